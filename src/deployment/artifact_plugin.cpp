#include "hostext/deployment/artifact_plugin.h"

#include <stdexcept>

namespace hostext {
namespace deployment {

ArtifactPlugin::ArtifactPlugin(PluginDescriptor descriptor,
                               std::shared_ptr<const core::PluginLoadingContext> loadingContext)
    : descriptor_(std::move(descriptor)), loadingContext_(std::move(loadingContext)) {
    if (!loadingContext_) {
        throw std::invalid_argument("Plugin '" + descriptor_.name + "' has no loading context");
    }
    if (descriptor_.name.empty()) {
        throw std::invalid_argument("Plugin descriptors must have a name");
    }
}

} // namespace deployment
} // namespace hostext
