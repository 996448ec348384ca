#pragma once

#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace hostext {
namespace core {

/**
 * @brief Describer section of a legacy extension manifest.
 */
struct DescriberManifest {
    std::string id;                                 // Loader id the manifest was written for
    std::map<std::string, std::string> properties;  // Must contain "type"
};

/**
 * @brief Legacy, file based description of an extension.
 *
 * Stored as JSON at META-INF/extension-manifest.json inside the plugin:
 * @code
 * {
 *   "name": "HTTP",
 *   "version": "1.2.0",
 *   "minRuntimeVersion": "4.0.0",
 *   "describer": { "id": "native", "properties": { "type": "org.acme.http.HttpConnector" } },
 *   "exportedPackages": ["org.acme.http.api"],
 *   "exportedResources": ["META-INF/http.xsd"]
 * }
 * @endcode
 */
struct ExtensionManifest {
    std::string name;
    std::string version;
    std::string minRuntimeVersion;
    DescriberManifest describer;
    std::vector<std::string> exportedPackages;
    std::vector<std::string> exportedResources;

    nlohmann::json to_json() const;
};

/**
 * @brief Reads legacy extension manifests.
 */
class ExtensionManifestReader {
public:
    /**
     * @brief Parse a manifest file.
     * @throws ManifestParseError if the file cannot be read or is malformed
     */
    ExtensionManifest read(const std::filesystem::path& manifestPath) const;

    /**
     * @brief Parse manifest content.
     *
     * @param content JSON text
     * @param source Name used in error messages
     * @throws ManifestParseError if the content is malformed
     */
    ExtensionManifest parse(const std::string& content, const std::string& source) const;
};

} // namespace core
} // namespace hostext
