#pragma once

#include <memory>
#include <vector>

#include "hostext/core/extension_manager_factory.h"
#include "hostext/core/extension_model_loader_repository.h"
#include "hostext/deployment/artifact_plugin.h"
#include "hostext/deployment/discovery_config.h"

namespace hostext {
namespace deployment {

/**
 * @brief Creates the ExtensionManager of an artifact with the extensions of its plugins registered.
 *
 * Discovery runs to completion before anything is registered, so when it
 * fails the exception propagates and no manager with a partial set of
 * extensions is ever returned.
 */
class ArtifactExtensionManagerFactory : public core::ExtensionManagerFactory {
public:
    /**
     * @param artifactPlugins Plugins deployed inside the artifact, in declaration order
     * @param loaderRepository Available extension model loaders; must outlive this factory
     * @param extensionManagerFactory Creates the manager the extensions are registered with
     * @param config Discovery configuration
     */
    ArtifactExtensionManagerFactory(std::vector<ArtifactPluginPtr> artifactPlugins,
                                    const core::ExtensionModelLoaderRepository& loaderRepository,
                                    std::shared_ptr<core::ExtensionManagerFactory> extensionManagerFactory,
                                    DiscoveryConfig config = DiscoveryConfig{});

    /**
     * @throws core::ConfigurationError if the extensions of the artifact cannot be discovered
     */
    std::shared_ptr<core::ExtensionManager> create() override;

private:
    std::vector<ArtifactPluginPtr> artifactPlugins_;
    const core::ExtensionModelLoaderRepository& loaderRepository_;
    std::shared_ptr<core::ExtensionManagerFactory> extensionManagerFactory_;
    DiscoveryConfig config_;
};

} // namespace deployment
} // namespace hostext
