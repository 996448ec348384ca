#include "hostext/deployment/directory_loading_context.h"

#include <algorithm>
#include <system_error>

namespace fs = std::filesystem;

namespace hostext {
namespace deployment {

namespace {

bool isWithin(const fs::path& path, const fs::path& root) {
    return std::mismatch(root.begin(), root.end(), path.begin(), path.end()).first == root.end();
}

} // namespace

DirectoryLoadingContext::DirectoryLoadingContext(std::string artifactId, fs::path root)
    : artifactId_(std::move(artifactId)), root_(std::move(root)) {}

std::optional<fs::path> DirectoryLoadingContext::findResource(const std::string& resourcePath) const {
    if (resourcePath.empty()) {
        return std::nullopt;
    }
    const fs::path relative = fs::path(resourcePath).lexically_normal();
    if (relative.is_absolute() || relative.has_root_name() || relative.empty()) {
        return std::nullopt;
    }
    // A normalized path leaving the root starts with ".."
    if (*relative.begin() == "..") {
        return std::nullopt;
    }

    const fs::path candidate = root_ / relative;
    std::error_code ec;
    if (!fs::is_regular_file(candidate, ec) || ec) {
        return std::nullopt;
    }
    // Symlinks inside the plugin must not reach files outside it
    const fs::path resolved = fs::weakly_canonical(candidate, ec);
    if (ec) {
        return std::nullopt;
    }
    const fs::path resolvedRoot = fs::weakly_canonical(root_, ec);
    if (ec || !isWithin(resolved, resolvedRoot)) {
        return std::nullopt;
    }
    return candidate;
}

} // namespace deployment
} // namespace hostext
