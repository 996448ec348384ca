#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "hostext/core/extension_model.h"

namespace hostext {
namespace core {

/**
 * @brief Immutable snapshot of the extension models resolved so far.
 *
 * A loader receives the context built from the models of the plugins that
 * precede its own plugin, so the types those extensions export can be
 * referenced. Contexts are created by ResolutionContextBuilder and never
 * change afterwards.
 *
 * Two contexts built from sets with the same content are equal regardless of
 * the order in which the models were discovered: the listing is ordered by
 * name and equality compares the content fingerprint.
 */
class ResolutionContext {
public:
    /// Context without any extension.
    ResolutionContext();

    /**
     * @brief Finds an extension by name.
     */
    std::optional<ExtensionModelPtr> getExtension(const std::string& name) const;

    /**
     * @brief All extensions in the context, ordered by name.
     */
    std::vector<ExtensionModelPtr> getExtensions() const;

    /**
     * @brief Finds the extension exporting a type.
     *
     * If several extensions export the same type id, the one with the lowest
     * name wins.
     *
     * @param typeId Type id as listed in ExtensionModel::exportedTypes
     * @return The exporting extension, or std::nullopt if no extension exports it
     */
    std::optional<ExtensionModelPtr> resolveType(const std::string& typeId) const;

    size_t size() const { return extensions_.size(); }
    bool empty() const { return extensions_.empty(); }

    /**
     * @brief Hex encoded SHA-256 of the canonical JSON form of the context content.
     */
    const std::string& fingerprint() const { return fingerprint_; }

    bool operator==(const ResolutionContext& other) const { return fingerprint_ == other.fingerprint_; }
    bool operator!=(const ResolutionContext& other) const { return !(*this == other); }

private:
    friend class ResolutionContextBuilder;

    std::map<std::string, ExtensionModelPtr> extensions_;
    std::map<std::string, std::string> typeOwners_;  // type id -> extension name
    std::string fingerprint_;
};

/**
 * @brief Builds resolution contexts from accumulated extension models.
 */
class ResolutionContextBuilder {
public:
    /**
     * @brief Builds a fresh context holding exactly the given models.
     *
     * Pure function: nothing is cached between calls.
     */
    static ResolutionContext build(const ExtensionModelSet& models);
};

} // namespace core
} // namespace hostext
