#include "hostext/deployment/manifest_adapter.h"

#include <stdexcept>

#include "hostext/core/default_native_extension_model_loader.h"
#include "hostext/core/errors.h"

namespace hostext {
namespace deployment {

using core::DefaultNativeExtensionModelLoader;

ManifestAdapter::ManifestAdapter(std::shared_ptr<const core::ExtensionModelLoader> builtinLoader)
    : builtinLoader_(std::move(builtinLoader)) {
    if (!builtinLoader_) {
        throw std::invalid_argument("The manifest adapter needs a built-in loader");
    }
}

core::LoaderAttributes ManifestAdapter::adapt(const core::ExtensionManifest& manifest) const {
    const auto& properties = manifest.describer.properties;
    auto type = properties.find(DefaultNativeExtensionModelLoader::TYPE_PROPERTY_NAME);
    if (type == properties.end() || type->second.empty()) {
        throw core::ManifestParseError("Extension manifest of '" + manifest.name +
                                       "' has no 'type' describer property", manifest.name);
    }
    if (manifest.version.empty()) {
        throw core::ManifestParseError("Extension manifest of '" + manifest.name +
                                       "' has no version", manifest.name);
    }

    core::LoaderAttributes attributes;
    attributes[DefaultNativeExtensionModelLoader::TYPE_PROPERTY_NAME] = type->second;
    attributes[DefaultNativeExtensionModelLoader::VERSION] = manifest.version;
    return attributes;
}

core::ExtensionModelPtr ManifestAdapter::load(const core::PluginLoadingContext& loadingContext,
                                              const core::ResolutionContext& resolutionContext,
                                              const core::ExtensionManifest& manifest) const {
    return builtinLoader_->loadExtensionModel(loadingContext, resolutionContext, adapt(manifest));
}

} // namespace deployment
} // namespace hostext
