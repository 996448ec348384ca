#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace hostext {
namespace core {

/**
 * @brief Isolated loading context of a single plugin.
 *
 * Loaders use it to locate the resources the plugin ships. Lookups are
 * confined to the plugin; a context never sees the resources of another
 * plugin of the same artifact.
 */
class PluginLoadingContext {
public:
    virtual ~PluginLoadingContext() = default;

    /// Identifier of the plugin artifact owning this context.
    virtual const std::string& getArtifactId() const = 0;

    /**
     * @brief Locates a resource inside the plugin.
     *
     * @param resourcePath Relative path, '/' separated (e.g. "META-INF/extension-manifest.json")
     * @return Location of the resource, or std::nullopt if the plugin does not provide it
     */
    virtual std::optional<std::filesystem::path> findResource(const std::string& resourcePath) const = 0;
};

} // namespace core
} // namespace hostext
