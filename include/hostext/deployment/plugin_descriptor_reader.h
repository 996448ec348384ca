#pragma once

#include <any>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

#include "hostext/deployment/artifact_plugin.h"
#include "hostext/deployment/discovery_config.h"

namespace hostext {
namespace deployment {

/**
 * @brief Reads structured plugin descriptors (META-INF/plugin.json).
 *
 * @code
 * {
 *   "name": "http-plugin",
 *   "minRuntimeVersion": "4.0.0",
 *   "extensionModelLoaderDescriptor": {
 *     "id": "native",
 *     "attributes": { "type": "org.acme.http.HttpConnector", "version": "1.2.0" }
 *   }
 * }
 * @endcode
 */
class PluginDescriptorReader {
public:
    /**
     * @throws core::ManifestParseError if the file cannot be read or is malformed
     */
    PluginDescriptor read(const std::filesystem::path& descriptorPath) const;

    /**
     * @throws core::ManifestParseError if the content is malformed
     */
    PluginDescriptor parse(const std::string& content, const std::string& source) const;

    /**
     * @brief Convert a JSON attribute value to the std::any a loader reads.
     *
     * Strings map to std::string, booleans to bool, integers to int64_t
     * (uint64_t above the int64_t range), floating point numbers to double;
     * arrays, objects and null stay nlohmann::json.
     */
    static std::any toAttributeValue(const nlohmann::json& value);
};

/**
 * @brief Assemble a plugin from its unpacked directory.
 *
 * The descriptor is read from config.pluginDescriptorPath when the plugin
 * ships one; otherwise the plugin is named after its directory and carries no
 * loader describer.
 *
 * @throws core::ManifestParseError if the descriptor exists but is malformed
 */
ArtifactPluginPtr loadPluginFromDirectory(const std::filesystem::path& pluginRoot,
                                          const DiscoveryConfig& config = DiscoveryConfig{});

} // namespace deployment
} // namespace hostext
