#pragma once

#include <any>
#include <optional>
#include <string>

#include "hostext/core/errors.h"
#include "hostext/core/extension_model.h"
#include "hostext/core/loader_describer.h"
#include "hostext/core/plugin_loading_context.h"
#include "hostext/core/resolution_context.h"

namespace hostext {
namespace core {

/**
 * @brief Inputs of a single extension model load.
 *
 * Bundles the plugin's loading context, the resolution context holding the
 * extensions resolved before this plugin, and the loader attributes.
 */
class ExtensionLoadingRequest {
public:
    ExtensionLoadingRequest(const PluginLoadingContext& loadingContext,
                            const ResolutionContext& resolutionContext,
                            const LoaderAttributes& attributes)
        : loadingContext_(loadingContext),
          resolutionContext_(resolutionContext),
          attributes_(attributes) {}

    const PluginLoadingContext& getLoadingContext() const { return loadingContext_; }
    const ResolutionContext& getResolutionContext() const { return resolutionContext_; }
    const LoaderAttributes& getAttributes() const { return attributes_; }

    bool hasAttribute(const std::string& key) const { return attributes_.count(key) > 0; }

    /**
     * @brief Reads an optional attribute of type T.
     * @throws IllegalParameterError if the attribute is present with another type
     */
    template <typename T>
    std::optional<T> getAttribute(const std::string& key) const {
        auto it = attributes_.find(key);
        if (it == attributes_.end()) {
            return std::nullopt;
        }
        if (const T* value = std::any_cast<T>(&it->second)) {
            return *value;
        }
        throw IllegalParameterError("Loader attribute '" + key + "' has an unexpected type", key);
    }

    /**
     * @brief Reads a required, non-empty string attribute.
     * @throws IllegalParameterError if the attribute is missing, empty or not a string
     */
    std::string requireString(const std::string& key) const {
        auto value = getAttribute<std::string>(key);
        if (!value || value->empty()) {
            throw IllegalParameterError("Required loader attribute '" + key + "' is missing", key);
        }
        return *value;
    }

private:
    const PluginLoadingContext& loadingContext_;
    const ResolutionContext& resolutionContext_;
    const LoaderAttributes& attributes_;
};

/**
 * @class ExtensionModelLoader
 * @brief Turns raw description data into an ExtensionModel.
 *
 * Loaders are registered in the ExtensionModelLoaderRepository under the id
 * returned by getId() and are selected by that id. Implementations override
 * declareExtension(); loadExtensionModel() validates what they declare
 * against the resolution context before handing the model out.
 *
 * Loaders are shared between concurrent artifact deployments and must not
 * keep per-load state.
 */
class ExtensionModelLoader {
public:
    virtual ~ExtensionModelLoader() = default;

    /// Stable identifier used by loader describers to select this loader.
    virtual std::string getId() const = 0;

    /**
     * @brief Loads and validates an extension model.
     *
     * @param loadingContext Loading context of the plugin declaring the extension
     * @param resolutionContext Extensions resolved before this plugin
     * @param attributes Loader parameters
     * @return The validated model
     * @throws ExtensionLoadingError (or a subclass) if the extension cannot be loaded
     */
    ExtensionModelPtr loadExtensionModel(const PluginLoadingContext& loadingContext,
                                         const ResolutionContext& resolutionContext,
                                         const LoaderAttributes& attributes) const;

protected:
    /**
     * @brief Declares the extension described by the request.
     */
    virtual ExtensionModel declareExtension(const ExtensionLoadingRequest& request) const = 0;
};

} // namespace core
} // namespace hostext
