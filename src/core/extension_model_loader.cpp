#include "hostext/core/extension_model_loader.h"

#include <memory>

#include "hostext/core/extension_model_validator.h"

namespace hostext {
namespace core {

ExtensionModelPtr ExtensionModelLoader::loadExtensionModel(
    const PluginLoadingContext& loadingContext,
    const ResolutionContext& resolutionContext,
    const LoaderAttributes& attributes) const {
    ExtensionLoadingRequest request(loadingContext, resolutionContext, attributes);
    ExtensionModel declared = declareExtension(request);

    ExtensionModelValidator().validate(declared, resolutionContext);
    return std::make_shared<const ExtensionModel>(std::move(declared));
}

} // namespace core
} // namespace hostext
