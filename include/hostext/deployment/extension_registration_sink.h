#pragma once

#include "hostext/core/extension_manager.h"
#include "hostext/core/extension_model.h"

namespace hostext {
namespace deployment {

/**
 * @brief Hands discovered extension models to an extension manager.
 */
class ExtensionRegistrationSink {
public:
    /**
     * @brief Register every model of the set. No retries; failures of the
     * manager propagate to the caller.
     */
    static void registerAll(core::ExtensionManager& manager, const core::ExtensionModelSet& models);
};

} // namespace deployment
} // namespace hostext
