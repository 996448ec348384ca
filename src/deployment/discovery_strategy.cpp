#include "hostext/deployment/discovery_strategy.h"

#include "hostext/utils/logging.hpp"

namespace hostext {
namespace deployment {

std::string toString(DiscoveryPath path) {
    switch (path) {
        case DiscoveryPath::StructuredDescriptor: return "structured-descriptor";
        case DiscoveryPath::LegacyManifest:       return "legacy-manifest";
        case DiscoveryPath::NoExtension:          return "no-extension";
    }
    return "unknown";
}

DiscoveryStrategySelector::DiscoveryStrategySelector(std::string manifestResourcePath)
    : manifestResourcePath_(std::move(manifestResourcePath)) {}

DiscoveryDecision DiscoveryStrategySelector::select(const ArtifactPlugin& plugin) const {
    DiscoveryDecision decision;

    const auto& describer = plugin.getDescriptor().extensionModelDescriber;
    if (describer) {
        decision.path = DiscoveryPath::StructuredDescriptor;
        decision.describer = &*describer;
        return decision;
    }

    if (auto manifest = plugin.getLoadingContext().findResource(manifestResourcePath_)) {
        HLOG_DEBUG("[ExtensionDiscovery] Discovered extension " + plugin.getArtifactName());
        decision.path = DiscoveryPath::LegacyManifest;
        decision.manifest = *manifest;
        return decision;
    }

    HLOG_WARN("[ExtensionDiscovery] Extension [" + plugin.getArtifactName() + "] could not be discovered");
    return decision;
}

} // namespace deployment
} // namespace hostext
