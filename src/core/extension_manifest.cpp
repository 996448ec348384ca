#include "hostext/core/extension_manifest.h"

#include <fstream>
#include <sstream>

#include "hostext/core/errors.h"

namespace hostext {
namespace core {

namespace {

std::vector<std::string> stringList(const nlohmann::json& j, const char* key) {
    std::vector<std::string> values;
    if (j.contains(key)) {
        for (const auto& element : j.at(key)) {
            values.push_back(element.get<std::string>());
        }
    }
    return values;
}

} // namespace

nlohmann::json ExtensionManifest::to_json() const {
    return nlohmann::json{
        {"name", name},
        {"version", version},
        {"minRuntimeVersion", minRuntimeVersion},
        {"describer", {{"id", describer.id}, {"properties", describer.properties}}},
        {"exportedPackages", exportedPackages},
        {"exportedResources", exportedResources}
    };
}

ExtensionManifest ExtensionManifestReader::read(const std::filesystem::path& manifestPath) const {
    std::ifstream file(manifestPath);
    if (!file.is_open()) {
        throw ManifestParseError("Cannot open extension manifest " + manifestPath.string(),
                                 manifestPath.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str(), manifestPath.string());
}

ExtensionManifest ExtensionManifestReader::parse(const std::string& content, const std::string& source) const {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw ManifestParseError("Malformed extension manifest " + source + ": " + e.what(), source);
    }
    if (!j.is_object()) {
        throw ManifestParseError("Extension manifest " + source + " must be a JSON object", source);
    }

    ExtensionManifest manifest;
    try {
        manifest.name = j.at("name").get<std::string>();
        manifest.version = j.at("version").get<std::string>();
        manifest.minRuntimeVersion = j.value("minRuntimeVersion", std::string());

        const auto& describer = j.at("describer");
        manifest.describer.id = describer.value("id", std::string());
        if (describer.contains("properties")) {
            manifest.describer.properties =
                describer.at("properties").get<std::map<std::string, std::string>>();
        }

        manifest.exportedPackages = stringList(j, "exportedPackages");
        manifest.exportedResources = stringList(j, "exportedResources");
    } catch (const nlohmann::json::exception& e) {
        throw ManifestParseError("Invalid extension manifest " + source + ": " + e.what(), source);
    }
    return manifest;
}

} // namespace core
} // namespace hostext
