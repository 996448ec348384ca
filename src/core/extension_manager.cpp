#include "hostext/core/extension_manager.h"

#include <stdexcept>

#include "hostext/core/version.h"
#include "hostext/utils/logging.hpp"

namespace hostext {
namespace core {

namespace {

// Unparseable versions sort before any valid one
bool isNewer(const std::string& candidate, const std::string& registered) {
    if (!Version::isValid(candidate)) return false;
    if (!Version::isValid(registered)) return true;
    return Version::parse(candidate).isNewerThan(Version::parse(registered));
}

} // namespace

void DefaultExtensionManager::registerExtension(ExtensionModelPtr model) {
    if (!model) {
        throw std::invalid_argument("Cannot register a null extension model");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = extensions_.find(model->name);
    if (it == extensions_.end()) {
        HLOG_INFO("[ExtensionManager] Registering extension " + model->name + " (version " + model->version + ")");
        const std::string name = model->name;
        extensions_.emplace(name, std::move(model));
        return;
    }

    const auto& registered = it->second;
    if (registered->version == model->version) {
        HLOG_DEBUG("[ExtensionManager] Extension " + model->name + " " + model->version + " is already registered");
        return;
    }
    if (isNewer(model->version, registered->version)) {
        HLOG_WARN("[ExtensionManager] Extension " + model->name + " version " + registered->version +
                  " replaced by newer version " + model->version);
        it->second = std::move(model);
    } else {
        HLOG_WARN("[ExtensionManager] Ignoring extension " + model->name + " version " + model->version +
                  ": version " + registered->version + " is already registered");
    }
}

std::vector<ExtensionModelPtr> DefaultExtensionManager::getExtensions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ExtensionModelPtr> result;
    result.reserve(extensions_.size());
    for (const auto& [name, model] : extensions_) {
        result.push_back(model);
    }
    return result;
}

std::optional<ExtensionModelPtr> DefaultExtensionManager::getExtension(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = extensions_.find(name);
    if (it == extensions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

ExtensionManifest DefaultExtensionManager::parseExtensionManifest(const std::filesystem::path& manifestPath) const {
    return manifestReader_.read(manifestPath);
}

} // namespace core
} // namespace hostext
