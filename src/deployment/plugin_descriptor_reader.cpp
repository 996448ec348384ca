#include "hostext/deployment/plugin_descriptor_reader.h"

#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>

#include "hostext/core/errors.h"
#include "hostext/deployment/directory_loading_context.h"

namespace hostext {
namespace deployment {

std::any PluginDescriptorReader::toAttributeValue(const nlohmann::json& value) {
    switch (value.type()) {
        case nlohmann::json::value_t::string:
            return value.get<std::string>();
        case nlohmann::json::value_t::boolean:
            return value.get<bool>();
        case nlohmann::json::value_t::number_integer:
            return value.get<int64_t>();
        case nlohmann::json::value_t::number_unsigned: {
            const uint64_t unsignedValue = value.get<uint64_t>();
            if (unsignedValue > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return unsignedValue;
            }
            return static_cast<int64_t>(unsignedValue);
        }
        case nlohmann::json::value_t::number_float:
            return value.get<double>();
        default:
            return value;
    }
}

PluginDescriptor PluginDescriptorReader::read(const std::filesystem::path& descriptorPath) const {
    std::ifstream file(descriptorPath);
    if (!file.is_open()) {
        throw core::ManifestParseError("Cannot open plugin descriptor " + descriptorPath.string(),
                                       descriptorPath.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str(), descriptorPath.string());
}

PluginDescriptor PluginDescriptorReader::parse(const std::string& content, const std::string& source) const {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw core::ManifestParseError("Malformed plugin descriptor " + source + ": " + e.what(), source);
    }

    PluginDescriptor descriptor;
    try {
        descriptor.name = j.at("name").get<std::string>();
        descriptor.minRuntimeVersion = j.value("minRuntimeVersion", std::string());

        if (j.contains("extensionModelLoaderDescriptor")) {
            const auto& loader = j.at("extensionModelLoaderDescriptor");
            core::LoaderDescriber describer;
            describer.id = loader.at("id").get<std::string>();
            if (loader.contains("attributes")) {
                for (const auto& [key, value] : loader.at("attributes").items()) {
                    describer.attributes[key] = toAttributeValue(value);
                }
            }
            descriptor.extensionModelDescriber = std::move(describer);
        }
    } catch (const nlohmann::json::exception& e) {
        throw core::ManifestParseError("Invalid plugin descriptor " + source + ": " + e.what(), source);
    }

    if (descriptor.name.empty()) {
        throw core::ManifestParseError("Plugin descriptor " + source + " has an empty name", source);
    }
    return descriptor;
}

ArtifactPluginPtr loadPluginFromDirectory(const std::filesystem::path& pluginRoot,
                                          const DiscoveryConfig& config) {
    // Tolerate a trailing separator ("plugins/http/")
    const auto directoryName = (pluginRoot / "").parent_path().filename().string();
    DirectoryLoadingContext probe(directoryName, pluginRoot);

    PluginDescriptor descriptor;
    if (auto descriptorPath = probe.findResource(config.pluginDescriptorPath)) {
        descriptor = PluginDescriptorReader().read(*descriptorPath);
    } else {
        descriptor.name = directoryName;
    }

    auto loadingContext = std::make_shared<DirectoryLoadingContext>(descriptor.name, pluginRoot);
    return std::make_shared<const ArtifactPlugin>(std::move(descriptor), std::move(loadingContext));
}

} // namespace deployment
} // namespace hostext
