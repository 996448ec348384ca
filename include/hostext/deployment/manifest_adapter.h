#pragma once

#include <memory>

#include "hostext/core/extension_manifest.h"
#include "hostext/core/extension_model_loader.h"

namespace hostext {
namespace deployment {

/**
 * @brief Loads extensions described by legacy manifests.
 *
 * Translates the manifest into the two attributes the built-in loader
 * expects ("type" from the describer properties, "version" from the
 * manifest) and always delegates to that loader; the loader id written in
 * the manifest is not consulted.
 */
class ManifestAdapter {
public:
    /**
     * @throws std::invalid_argument if builtinLoader is null
     */
    explicit ManifestAdapter(std::shared_ptr<const core::ExtensionModelLoader> builtinLoader);

    /**
     * @brief Loader attributes for a manifest.
     * @throws core::ManifestParseError if the describer has no "type" property or the version is empty
     */
    core::LoaderAttributes adapt(const core::ExtensionManifest& manifest) const;

    /**
     * @brief Load the extension a manifest describes with the built-in loader.
     */
    core::ExtensionModelPtr load(const core::PluginLoadingContext& loadingContext,
                                 const core::ResolutionContext& resolutionContext,
                                 const core::ExtensionManifest& manifest) const;

    const core::ExtensionModelLoader& getBuiltinLoader() const { return *builtinLoader_; }

private:
    std::shared_ptr<const core::ExtensionModelLoader> builtinLoader_;
};

} // namespace deployment
} // namespace hostext
