#include "hostext/deployment/loader_library.h"

#include <dlfcn.h>

#include <algorithm>
#include <exception>
#include <set>
#include <utility>

#include "hostext/utils/logging.hpp"

namespace fs = std::filesystem;

namespace hostext {
namespace deployment {

namespace {

std::string lastDlError() {
    const char* message = dlerror();
    return message ? message : "unknown error";
}

// A loader whose code lives in a loader library, owning a reference to the library.
// Destroying the pair releases the loader before the library can be unmapped.
using LoaderKeepAlive = std::pair<std::shared_ptr<const LoaderLibrary>,
                                  std::shared_ptr<const core::ExtensionModelLoader>>;

std::vector<fs::path> collectLibraries(const std::string& pattern) {
    std::vector<fs::path> libraries;
    std::string dir = pattern;
    bool recursive = false;

    if (dir.size() >= 3 && dir.compare(dir.size() - 3, 3, "/**") == 0) {
        dir.resize(dir.size() - 3);
        recursive = true;
    } else if (dir.size() >= 2 && dir.compare(dir.size() - 2, 2, "/*") == 0) {
        dir.resize(dir.size() - 2);
    }

    std::error_code ec;
    if (dir.empty() || !fs::is_directory(dir, ec)) {
        HLOG_WARN("Loader library directory not found: " + pattern);
        return libraries;
    }

    const std::string extension = LoaderLibraryScanner::libraryExtension();
    auto consider = [&](const fs::directory_entry& entry) {
        if (entry.is_regular_file(ec) && entry.path().extension() == extension) {
            libraries.push_back(entry.path());
        }
    };

    if (recursive) {
        for (const auto& entry : fs::recursive_directory_iterator(dir, fs::directory_options::skip_permission_denied, ec)) {
            consider(entry);
        }
    } else {
        for (const auto& entry : fs::directory_iterator(dir, ec)) {
            consider(entry);
        }
    }

    std::sort(libraries.begin(), libraries.end());
    return libraries;
}

} // namespace

LoaderLibrary::LoaderLibrary(fs::path path, void* handle, RegisterFunction registerFunction)
    : path_(std::move(path)), handle_(handle), registerFunction_(registerFunction) {}

LoaderLibrary::~LoaderLibrary() {
    if (handle_) {
        dlclose(handle_);
    }
}

Result<std::shared_ptr<LoaderLibrary>> LoaderLibrary::open(const fs::path& libraryPath) {
    void* handle = dlopen(libraryPath.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (!handle) {
        return Error{"Failed to open loader library " + libraryPath.string() + ": " + lastDlError()};
    }

    dlerror();
    void* symbol = dlsym(handle, ENTRY_POINT);
    if (!symbol) {
        std::string message = "Loader library " + libraryPath.string() +
                              " does not export " + ENTRY_POINT + ": " + lastDlError();
        dlclose(handle);
        return Error{message};
    }

    auto registerFunction = reinterpret_cast<RegisterFunction>(symbol);
    return std::shared_ptr<LoaderLibrary>(new LoaderLibrary(libraryPath, handle, registerFunction));
}

Result<std::vector<std::string>> LoaderLibrary::registerLoaders(core::ExtensionModelLoaderRepository& repository) const {
    if (repository.isSealed()) {
        return Error{"Cannot register the loaders of " + path_.string() + ": the loader repository is sealed"};
    }

    core::ExtensionModelLoaderRepository staging;
    try {
        registerFunction_(staging);
    } catch (const std::exception& e) {
        return Error{"Loader library " + path_.string() + " failed to register its loaders: " + e.what()};
    }

    std::vector<std::string> ids = staging.getLoaderIds();
    for (const auto& id : ids) {
        if (repository.hasLoader(id)) {
            return Error{"Loader library " + path_.string() +
                         " provides loader '" + id + "' which is already registered"};
        }
    }

    auto self = shared_from_this();
    std::vector<std::shared_ptr<const core::ExtensionModelLoader>> loaders;
    loaders.reserve(ids.size());
    for (const auto& id : ids) {
        auto holder = std::make_shared<LoaderKeepAlive>(self, staging.getExtensionModelLoader(id));
        loaders.emplace_back(holder, holder->second.get());
    }
    try {
        repository.registerLoaders(loaders);
    } catch (const std::exception& e) {
        return Error{"Failed to register the loaders of " + path_.string() + ": " + e.what()};
    }
    HLOG_DEBUG("Registered " + std::to_string(ids.size()) + " extension model loader(s) from " + path_.string());
    return ids;
}

std::string LoaderLibraryScanner::libraryExtension() {
#if defined(__APPLE__)
    return ".dylib";
#else
    return ".so";
#endif
}

LoaderScanReport LoaderLibraryScanner::scan(const std::vector<std::string>& dirPatterns,
                                            core::ExtensionModelLoaderRepository& repository) const {
    LoaderScanReport report;
    std::set<fs::path> seen;

    for (const auto& pattern : dirPatterns) {
        for (const auto& path : collectLibraries(pattern)) {
            if (!seen.insert(path).second) {
                continue;
            }
            ++report.attempted;

            auto library = LoaderLibrary::open(path);
            if (!library) {
                HLOG_WARN(library.error());
                report.failures.push_back({path.string(), library.error()});
                continue;
            }

            auto registered = library.value()->registerLoaders(repository);
            if (!registered) {
                HLOG_WARN(registered.error());
                report.failures.push_back({path.string(), registered.error()});
                continue;
            }

            ++report.loaded;
            report.registeredLoaderIds.insert(report.registeredLoaderIds.end(),
                                              registered.value().begin(), registered.value().end());
        }
    }

    HLOG_INFO("Loaded " + std::to_string(report.loaded) + " of " + std::to_string(report.attempted) +
              " loader libraries");
    return report;
}

} // namespace deployment
} // namespace hostext
