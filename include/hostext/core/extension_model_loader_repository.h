#pragma once

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "hostext/core/extension_model_loader.h"
#include "hostext/core/loader_describer.h"

namespace hostext {
namespace core {

/**
 * @brief Directory of the extension model loaders available to the runtime.
 *
 * Populated once during runtime bootstrap, then sealed and shared read-only
 * by every artifact deployment:
 * - registerLoader() is only allowed before seal()
 * - lookups never throw; an unknown id yields nullptr and the caller decides
 *   how severe that is
 * - lookups take a shared lock, so concurrent deployments may query the
 *   repository at the same time
 */
class ExtensionModelLoaderRepository {
public:
    ExtensionModelLoaderRepository() = default;

    /**
     * @brief Register a loader under its id.
     *
     * @param loader Loader to register
     * @throws std::invalid_argument if loader is null or its id is empty
     * @throws std::runtime_error if the id is already registered or the repository is sealed
     */
    void registerLoader(std::shared_ptr<const ExtensionModelLoader> loader);

    /**
     * @brief Register a batch of loaders under one lock. Either all of them are
     * registered or none is.
     *
     * @throws std::invalid_argument if a loader is null or has an empty id
     * @throws std::runtime_error if an id is taken, repeated in the batch, or the repository is sealed
     */
    void registerLoaders(const std::vector<std::shared_ptr<const ExtensionModelLoader>>& loaders);

    /**
     * @brief Freeze the repository. Further registrations fail.
     */
    void seal();

    bool isSealed() const;

    /**
     * @brief Look up a loader by id.
     *
     * @param id Loader id
     * @return The loader, or nullptr if no loader is registered under id
     */
    std::shared_ptr<const ExtensionModelLoader> getExtensionModelLoader(const std::string& id) const;

    /**
     * @brief Look up the loader a describer asks for.
     */
    std::shared_ptr<const ExtensionModelLoader> getExtensionModelLoader(const LoaderDescriber& describer) const {
        return getExtensionModelLoader(describer.id);
    }

    bool hasLoader(const std::string& id) const;

    /// Registered ids, sorted.
    std::vector<std::string> getLoaderIds() const;

    size_t size() const;

    ExtensionModelLoaderRepository(const ExtensionModelLoaderRepository&) = delete;
    ExtensionModelLoaderRepository& operator=(const ExtensionModelLoaderRepository&) = delete;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<const ExtensionModelLoader>> loaders_;
    bool sealed_ = false;
};

} // namespace core
} // namespace hostext
