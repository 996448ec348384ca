#include "hostext/deployment/extension_registration_sink.h"

namespace hostext {
namespace deployment {

void ExtensionRegistrationSink::registerAll(core::ExtensionManager& manager, const core::ExtensionModelSet& models) {
    for (const auto& [name, model] : models) {
        manager.registerExtension(model);
    }
}

} // namespace deployment
} // namespace hostext
