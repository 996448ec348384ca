#include "hostext/deployment/extension_discovery.h"

#include <exception>

#include "hostext/core/errors.h"
#include "hostext/core/resolution_context.h"
#include "hostext/utils/logging.hpp"

namespace hostext {
namespace deployment {

namespace {

// Runs a load step and attributes any failure to the plugin being discovered.
// ConfigurationErrors keep their type.
template <typename LoadStep>
core::ExtensionModelPtr invokeLoader(const ArtifactPlugin& plugin, LoadStep&& step) {
    try {
        return step();
    } catch (core::ConfigurationError& e) {
        e.attributeToPlugin(plugin.getArtifactName());
        throw;
    } catch (const std::exception& e) {
        throw core::ExtensionLoadingError("Failed to load the extension of plugin '" +
                                          plugin.getArtifactName() + "': " + e.what(),
                                          plugin.getArtifactName());
    }
}

} // namespace

ExtensionDiscovery::ExtensionDiscovery(const core::ExtensionModelLoaderRepository& repository,
                                       const core::ExtensionManager& manifestParser,
                                       std::shared_ptr<const core::ExtensionModelLoader> builtinLoader,
                                       const DiscoveryConfig& config)
    : repository_(repository),
      manifestParser_(manifestParser),
      selector_(config.manifestResourcePath),
      manifestAdapter_(std::move(builtinLoader)) {}

core::ExtensionModelSet ExtensionDiscovery::discoverAll(const std::vector<ArtifactPluginPtr>& plugins) const {
    return discover(plugins).extensions;
}

DiscoveryResult ExtensionDiscovery::discover(const std::vector<ArtifactPluginPtr>& plugins) const {
    DiscoveryResult result;
    core::ExtensionModelSet& accumulated = result.extensions;

    for (const auto& pluginPtr : plugins) {
        const ArtifactPlugin& plugin = *pluginPtr;
        const DiscoveryDecision decision = selector_.select(plugin);

        core::ExtensionModelPtr model;
        switch (decision.path) {
            case DiscoveryPath::StructuredDescriptor:
                model = discoverThroughDescriber(plugin, *decision.describer, accumulated);
                break;
            case DiscoveryPath::LegacyManifest:
                model = discoverThroughManifest(plugin, decision.manifest, accumulated);
                break;
            case DiscoveryPath::NoExtension:
                result.undiscoveredPlugins.push_back(plugin.getArtifactName());
                continue;
        }

        if (!accumulated.insert(model)) {
            HLOG_WARN("[ExtensionDiscovery] Plugin " + plugin.getArtifactName() + " declares extension " +
                      model->name + ", which an earlier plugin already declared; keeping the first one");
        }
    }

    HLOG_INFO("[ExtensionDiscovery] Discovered " + std::to_string(accumulated.size()) + " extension(s) in " +
              std::to_string(plugins.size()) + " plugin(s)");
    return result;
}

core::ExtensionModelPtr ExtensionDiscovery::discoverThroughDescriber(
    const ArtifactPlugin& plugin,
    const core::LoaderDescriber& describer,
    const core::ExtensionModelSet& accumulated) const {
    auto loader = repository_.getExtensionModelLoader(describer);
    if (!loader) {
        throw core::ConfigurationError(
            "The identifier '" + describer.id + "' does not match with the describers available "
            "to generate an ExtensionModel (working with the plugin '" + plugin.getArtifactName() + "')",
            describer.id, plugin.getArtifactName());
    }

    return invokeLoader(plugin, [&] {
        const core::ResolutionContext context = core::ResolutionContextBuilder::build(accumulated);
        return loader->loadExtensionModel(plugin.getLoadingContext(), context, describer.attributes);
    });
}

core::ExtensionModelPtr ExtensionDiscovery::discoverThroughManifest(
    const ArtifactPlugin& plugin,
    const std::filesystem::path& manifestPath,
    const core::ExtensionModelSet& accumulated) const {
    return invokeLoader(plugin, [&] {
        const core::ExtensionManifest manifest = manifestParser_.parseExtensionManifest(manifestPath);
        const core::ResolutionContext context = core::ResolutionContextBuilder::build(accumulated);
        return manifestAdapter_.load(plugin.getLoadingContext(), context, manifest);
    });
}

} // namespace deployment
} // namespace hostext
