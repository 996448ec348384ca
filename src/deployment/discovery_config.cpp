#include "hostext/deployment/discovery_config.h"

#include <fstream>
#include <stdexcept>

namespace hostext {
namespace deployment {

nlohmann::json DiscoveryConfig::to_json() const {
    return nlohmann::json{
        {"manifestResourcePath", manifestResourcePath},
        {"pluginDescriptorPath", pluginDescriptorPath},
        {"loaderLibraryDirs", loaderLibraryDirs},
        {"logLevel", logLevel}
    };
}

DiscoveryConfig DiscoveryConfig::from_json(const nlohmann::json& j) {
    DiscoveryConfig config;
    try {
        config.manifestResourcePath = j.value("manifestResourcePath", config.manifestResourcePath);
        config.pluginDescriptorPath = j.value("pluginDescriptorPath", config.pluginDescriptorPath);
        config.loaderLibraryDirs = j.value("loaderLibraryDirs", config.loaderLibraryDirs);
        config.logLevel = j.value("logLevel", config.logLevel);
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("Invalid discovery configuration: ") + e.what());
    }
    return config;
}

DiscoveryConfig DiscoveryConfig::fromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open discovery configuration " + path.string());
    }
    try {
        return from_json(nlohmann::json::parse(file));
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Malformed discovery configuration " + path.string() + ": " + e.what());
    }
}

} // namespace deployment
} // namespace hostext
