#pragma once

#include <string>

#include "hostext/core/extension_model_loader.h"

namespace hostext {
namespace core {

/**
 * @brief Built-in loader reading extension declarations shipped by the plugin.
 *
 * The "type" attribute names the extension type, e.g. "org.acme.http.HttpConnector".
 * The declaration is read from the resource "org/acme/http/HttpConnector.extension.json"
 * of the plugin's loading context; it holds the JSON form of an ExtensionModel.
 * The "version" attribute overrides whatever version the declaration carries.
 *
 * Legacy manifests are always loaded with this loader.
 */
class DefaultNativeExtensionModelLoader : public ExtensionModelLoader {
public:
    static constexpr const char* LOADER_ID = "native";
    static constexpr const char* TYPE_PROPERTY_NAME = "type";
    static constexpr const char* VERSION = "version";
    static constexpr const char* DECLARATION_SUFFIX = ".extension.json";

    std::string getId() const override { return LOADER_ID; }

    /**
     * @brief Resource path holding the declaration of a type.
     * @throws IllegalParameterError if typeId is not a dotted identifier
     */
    static std::string declarationResourceFor(const std::string& typeId);

protected:
    ExtensionModel declareExtension(const ExtensionLoadingRequest& request) const override;
};

} // namespace core
} // namespace hostext
