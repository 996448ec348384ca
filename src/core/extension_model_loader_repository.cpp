#include "hostext/core/extension_model_loader_repository.h"

#include <algorithm>
#include <mutex>
#include <stdexcept>

#include "hostext/utils/logging.hpp"

namespace hostext {
namespace core {

void ExtensionModelLoaderRepository::registerLoader(std::shared_ptr<const ExtensionModelLoader> loader) {
    if (!loader) {
        throw std::invalid_argument("Cannot register a null extension model loader");
    }
    const std::string id = loader->getId();
    if (id.empty()) {
        throw std::invalid_argument("Extension model loaders must have a non empty id");
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (sealed_) {
        throw std::runtime_error("Cannot register loader '" + id + "': the loader repository is sealed");
    }
    if (loaders_.find(id) != loaders_.end()) {
        throw std::runtime_error("An extension model loader is already registered with id '" + id + "'");
    }
    loaders_.emplace(id, std::move(loader));
    HLOG_DEBUG("[LoaderRepository] Registered extension model loader '" + id + "'");
}

void ExtensionModelLoaderRepository::registerLoaders(
    const std::vector<std::shared_ptr<const ExtensionModelLoader>>& loaders) {
    std::vector<std::string> ids;
    ids.reserve(loaders.size());
    for (const auto& loader : loaders) {
        if (!loader) {
            throw std::invalid_argument("Cannot register a null extension model loader");
        }
        ids.push_back(loader->getId());
        if (ids.back().empty()) {
            throw std::invalid_argument("Extension model loaders must have a non empty id");
        }
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (sealed_) {
        throw std::runtime_error("Cannot register loaders: the loader repository is sealed");
    }
    for (size_t i = 0; i < ids.size(); ++i) {
        if (loaders_.count(ids[i]) > 0 || std::find(ids.begin(), ids.begin() + i, ids[i]) != ids.begin() + i) {
            throw std::runtime_error("An extension model loader is already registered with id '" + ids[i] + "'");
        }
    }
    for (size_t i = 0; i < ids.size(); ++i) {
        loaders_.emplace(ids[i], loaders[i]);
        HLOG_DEBUG("[LoaderRepository] Registered extension model loader '" + ids[i] + "'");
    }
}

void ExtensionModelLoaderRepository::seal() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    sealed_ = true;
}

bool ExtensionModelLoaderRepository::isSealed() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return sealed_;
}

std::shared_ptr<const ExtensionModelLoader> ExtensionModelLoaderRepository::getExtensionModelLoader(
    const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = loaders_.find(id);
    return (it != loaders_.end()) ? it->second : nullptr;
}

bool ExtensionModelLoaderRepository::hasLoader(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return loaders_.count(id) > 0;
}

std::vector<std::string> ExtensionModelLoaderRepository::getLoaderIds() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(loaders_.size());
    for (const auto& [id, loader] : loaders_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

size_t ExtensionModelLoaderRepository::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return loaders_.size();
}

} // namespace core
} // namespace hostext
