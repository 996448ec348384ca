#include "hostext/deployment/artifact_extension_manager_factory.h"

#include <stdexcept>

#include "hostext/deployment/extension_discovery.h"
#include "hostext/deployment/extension_registration_sink.h"

namespace hostext {
namespace deployment {

ArtifactExtensionManagerFactory::ArtifactExtensionManagerFactory(
    std::vector<ArtifactPluginPtr> artifactPlugins,
    const core::ExtensionModelLoaderRepository& loaderRepository,
    std::shared_ptr<core::ExtensionManagerFactory> extensionManagerFactory,
    DiscoveryConfig config)
    : artifactPlugins_(std::move(artifactPlugins)),
      loaderRepository_(loaderRepository),
      extensionManagerFactory_(std::move(extensionManagerFactory)),
      config_(std::move(config)) {
    if (!extensionManagerFactory_) {
        throw std::invalid_argument("An extension manager factory is required");
    }
}

std::shared_ptr<core::ExtensionManager> ArtifactExtensionManagerFactory::create() {
    auto extensionManager = extensionManagerFactory_->create();
    if (!extensionManager) {
        throw std::runtime_error("The extension manager factory returned no manager");
    }

    ExtensionDiscovery discovery(loaderRepository_, *extensionManager,
                                 std::make_shared<core::DefaultNativeExtensionModelLoader>(), config_);
    const core::ExtensionModelSet extensions = discovery.discoverAll(artifactPlugins_);

    ExtensionRegistrationSink::registerAll(*extensionManager, extensions);
    return extensionManager;
}

} // namespace deployment
} // namespace hostext
