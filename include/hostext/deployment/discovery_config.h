#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace hostext {
namespace deployment {

/**
 * @brief Configuration of extension discovery.
 */
struct DiscoveryConfig {
    std::string manifestResourcePath = "META-INF/extension-manifest.json";  // Legacy manifest location inside a plugin
    std::string pluginDescriptorPath = "META-INF/plugin.json";              // Structured plugin descriptor location
    std::vector<std::string> loaderLibraryDirs;                             // "dir" (shallow) or "dir/**" (recursive)
    std::string logLevel = "info";

    nlohmann::json to_json() const;

    /**
     * @brief Build a configuration from JSON; absent keys keep their defaults.
     * @throws std::invalid_argument if a key has the wrong type
     */
    static DiscoveryConfig from_json(const nlohmann::json& j);

    /**
     * @brief Load a configuration file.
     * @throws std::runtime_error if the file cannot be read or parsed
     */
    static DiscoveryConfig fromFile(const std::filesystem::path& path);
};

} // namespace deployment
} // namespace hostext
