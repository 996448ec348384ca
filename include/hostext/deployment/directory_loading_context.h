#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "hostext/core/plugin_loading_context.h"

namespace hostext {
namespace deployment {

/**
 * @brief Loading context over the unpacked directory of a plugin.
 *
 * Resource paths are resolved relative to the plugin root. Absolute paths and
 * paths leaving the root ("../x") are never resolved.
 */
class DirectoryLoadingContext : public core::PluginLoadingContext {
public:
    DirectoryLoadingContext(std::string artifactId, std::filesystem::path root);

    const std::string& getArtifactId() const override { return artifactId_; }
    std::optional<std::filesystem::path> findResource(const std::string& resourcePath) const override;

    const std::filesystem::path& getRoot() const { return root_; }

private:
    std::string artifactId_;
    std::filesystem::path root_;
};

} // namespace deployment
} // namespace hostext
