#pragma once

#include <memory>
#include <string>
#include <vector>

#include "hostext/core/default_native_extension_model_loader.h"
#include "hostext/core/extension_manager.h"
#include "hostext/core/extension_model.h"
#include "hostext/core/extension_model_loader_repository.h"
#include "hostext/deployment/artifact_plugin.h"
#include "hostext/deployment/discovery_config.h"
#include "hostext/deployment/discovery_strategy.h"
#include "hostext/deployment/manifest_adapter.h"

namespace hostext {
namespace deployment {

/**
 * @brief Outcome of a successful discovery pass.
 */
struct DiscoveryResult {
    core::ExtensionModelSet extensions;
    std::vector<std::string> undiscoveredPlugins;  // Plugins offering neither a describer nor a manifest
};

/**
 * @class ExtensionDiscovery
 * @brief Discovers and resolves the extensions contributed by the plugins of an artifact.
 *
 * Plugins are processed strictly in the order given. Each loader call
 * receives a resolution context built from the models of the plugins before
 * it, so a plugin may only reference extensions declared earlier in the
 * sequence; no dependency sorting takes place.
 *
 * Failure policy:
 * - a describer naming an unregistered loader id aborts the whole pass with
 *   core::ConfigurationError
 * - any loader failure aborts the whole pass; core::ConfigurationError
 *   subclasses propagate unchanged, other exceptions are rethrown as
 *   core::ExtensionLoadingError naming the plugin
 * - a plugin without describer and manifest is logged and skipped
 *
 * An instance holds no per-pass state and may run passes for different
 * artifacts concurrently.
 */
class ExtensionDiscovery {
public:
    /**
     * @param repository Loaders selectable by describer id; must outlive this object
     * @param manifestParser Parses legacy manifests; must outlive this object
     * @param builtinLoader Loader used for every legacy manifest
     * @param config Discovery configuration
     */
    ExtensionDiscovery(const core::ExtensionModelLoaderRepository& repository,
                       const core::ExtensionManager& manifestParser,
                       std::shared_ptr<const core::ExtensionModelLoader> builtinLoader =
                           std::make_shared<core::DefaultNativeExtensionModelLoader>(),
                       const DiscoveryConfig& config = DiscoveryConfig{});

    /**
     * @brief Discover the extensions of all plugins.
     *
     * @param plugins Plugins of the artifact, in declaration order
     * @return The resolved extension models
     * @throws core::ConfigurationError if discovery fails for any plugin
     */
    core::ExtensionModelSet discoverAll(const std::vector<ArtifactPluginPtr>& plugins) const;

    /**
     * @brief Same as discoverAll() but also reports the plugins without extension.
     */
    DiscoveryResult discover(const std::vector<ArtifactPluginPtr>& plugins) const;

private:
    core::ExtensionModelPtr discoverThroughDescriber(const ArtifactPlugin& plugin,
                                                     const core::LoaderDescriber& describer,
                                                     const core::ExtensionModelSet& accumulated) const;

    core::ExtensionModelPtr discoverThroughManifest(const ArtifactPlugin& plugin,
                                                    const std::filesystem::path& manifestPath,
                                                    const core::ExtensionModelSet& accumulated) const;

    const core::ExtensionModelLoaderRepository& repository_;
    const core::ExtensionManager& manifestParser_;
    DiscoveryStrategySelector selector_;
    ManifestAdapter manifestAdapter_;
};

} // namespace deployment
} // namespace hostext
