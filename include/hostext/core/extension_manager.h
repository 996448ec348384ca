#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "hostext/core/extension_manifest.h"
#include "hostext/core/extension_model.h"

namespace hostext {
namespace core {

/**
 * @brief Central registry of the extensions of an artifact.
 */
class ExtensionManager {
public:
    virtual ~ExtensionManager() = default;

    /**
     * @brief Register an extension model.
     */
    virtual void registerExtension(ExtensionModelPtr model) = 0;

    /// Registered extensions, ordered by name.
    virtual std::vector<ExtensionModelPtr> getExtensions() const = 0;

    virtual std::optional<ExtensionModelPtr> getExtension(const std::string& name) const = 0;

    /**
     * @brief Parse a legacy extension manifest.
     * @throws ManifestParseError if the manifest cannot be read or is malformed
     */
    virtual ExtensionManifest parseExtensionManifest(const std::filesystem::path& manifestPath) const = 0;
};

/**
 * @brief Thread-safe in-memory ExtensionManager.
 *
 * Extensions are keyed by name. Registering a model whose name and version
 * are already registered does nothing; a different version replaces the
 * registered one only if it is newer.
 */
class DefaultExtensionManager : public ExtensionManager {
public:
    DefaultExtensionManager() = default;

    /**
     * @throws std::invalid_argument if model is null
     */
    void registerExtension(ExtensionModelPtr model) override;
    std::vector<ExtensionModelPtr> getExtensions() const override;
    std::optional<ExtensionModelPtr> getExtension(const std::string& name) const override;
    ExtensionManifest parseExtensionManifest(const std::filesystem::path& manifestPath) const override;

private:
    mutable std::mutex mutex_;
    std::map<std::string, ExtensionModelPtr> extensions_;
    ExtensionManifestReader manifestReader_;
};

} // namespace core
} // namespace hostext
