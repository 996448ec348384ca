#include "hostext/core/default_native_extension_model_loader.h"

#include <cctype>
#include <fstream>

#include <nlohmann/json.hpp>

#include "hostext/utils/logging.hpp"

namespace hostext {
namespace core {

namespace {

bool isIdentifierChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$' || c == '-';
}

} // namespace

std::string DefaultNativeExtensionModelLoader::declarationResourceFor(const std::string& typeId) {
    std::string resource;
    resource.reserve(typeId.size() + 16);
    bool segmentStart = true;
    for (char c : typeId) {
        if (c == '.') {
            if (segmentStart) {
                throw IllegalParameterError("Invalid extension type '" + typeId + "'", TYPE_PROPERTY_NAME);
            }
            resource.push_back('/');
            segmentStart = true;
        } else if (isIdentifierChar(c)) {
            resource.push_back(c);
            segmentStart = false;
        } else {
            throw IllegalParameterError("Invalid extension type '" + typeId + "'", TYPE_PROPERTY_NAME);
        }
    }
    if (segmentStart) {
        // Empty id or trailing dot
        throw IllegalParameterError("Invalid extension type '" + typeId + "'", TYPE_PROPERTY_NAME);
    }
    return resource + DECLARATION_SUFFIX;
}

ExtensionModel DefaultNativeExtensionModelLoader::declareExtension(const ExtensionLoadingRequest& request) const {
    const std::string type = request.requireString(TYPE_PROPERTY_NAME);
    const std::string version = request.requireString(VERSION);
    const std::string resource = declarationResourceFor(type);
    const auto& loadingContext = request.getLoadingContext();

    auto location = loadingContext.findResource(resource);
    if (!location) {
        throw ExtensionLoadingError("Extension type '" + type + "' not found in plugin '" +
                                    loadingContext.getArtifactId() + "' (expected resource " +
                                    resource + ")");
    }

    std::ifstream file(*location);
    if (!file.is_open()) {
        throw ExtensionLoadingError("Cannot read extension declaration " + location->string());
    }

    ExtensionModel model;
    try {
        model = ExtensionModel::from_json(nlohmann::json::parse(file));
    } catch (const nlohmann::json::exception& e) {
        throw ExtensionLoadingError("Malformed extension declaration " + location->string() + ": " + e.what());
    }
    model.version = version;

    HLOG_DEBUG("[NativeLoader] Declared extension '" + model.name + "' " + version + " from type " + type);
    return model;
}

} // namespace core
} // namespace hostext
