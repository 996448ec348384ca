#pragma once

#include <filesystem>
#include <string>

#include "hostext/core/loader_describer.h"
#include "hostext/deployment/artifact_plugin.h"

namespace hostext {
namespace deployment {

/**
 * @brief How the extension of a plugin is discovered.
 *
 * The paths are mutually exclusive and tried in declaration order; the first
 * one that applies wins.
 */
enum class DiscoveryPath {
    StructuredDescriptor,  // The plugin descriptor carries a loader describer
    LegacyManifest,        // The plugin ships a legacy extension manifest
    NoExtension            // Neither: the plugin contributes no extension
};

std::string toString(DiscoveryPath path);

/**
 * @brief Outcome of the strategy selection for one plugin.
 */
struct DiscoveryDecision {
    DiscoveryPath path = DiscoveryPath::NoExtension;
    const core::LoaderDescriber* describer = nullptr;  // Set for StructuredDescriptor, points into the plugin descriptor
    std::filesystem::path manifest;                    // Set for LegacyManifest
};

/**
 * @brief Chooses the discovery path of each plugin.
 *
 * Pure routing decision. The only side effect is logging: a debug message
 * when a legacy manifest is found and a warning when a plugin offers no
 * extension description at all.
 */
class DiscoveryStrategySelector {
public:
    explicit DiscoveryStrategySelector(std::string manifestResourcePath);

    DiscoveryDecision select(const ArtifactPlugin& plugin) const;

    const std::string& getManifestResourcePath() const { return manifestResourcePath_; }

private:
    std::string manifestResourcePath_;
};

} // namespace deployment
} // namespace hostext
