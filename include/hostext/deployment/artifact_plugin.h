#pragma once

#include <memory>
#include <optional>
#include <string>

#include "hostext/core/loader_describer.h"
#include "hostext/core/plugin_loading_context.h"

namespace hostext {
namespace deployment {

/**
 * @brief Deployment descriptor of a plugin.
 */
struct PluginDescriptor {
    std::string name;
    std::string minRuntimeVersion;
    std::optional<core::LoaderDescriber> extensionModelDescriber;  // Structured extension descriptor, if any
};

/**
 * @brief A plugin deployed inside an artifact.
 *
 * Built by the deployment subsystem before discovery starts and never
 * modified afterwards.
 */
class ArtifactPlugin {
public:
    /**
     * @throws std::invalid_argument if loadingContext is null or the descriptor has no name
     */
    ArtifactPlugin(PluginDescriptor descriptor,
                   std::shared_ptr<const core::PluginLoadingContext> loadingContext);

    /// Plugin name, unique within the owning artifact.
    const std::string& getArtifactName() const { return descriptor_.name; }
    const PluginDescriptor& getDescriptor() const { return descriptor_; }
    const core::PluginLoadingContext& getLoadingContext() const { return *loadingContext_; }

private:
    PluginDescriptor descriptor_;
    std::shared_ptr<const core::PluginLoadingContext> loadingContext_;
};

using ArtifactPluginPtr = std::shared_ptr<const ArtifactPlugin>;

} // namespace deployment
} // namespace hostext
