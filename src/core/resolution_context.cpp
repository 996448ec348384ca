#include "hostext/core/resolution_context.h"

#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <openssl/evp.h>

namespace hostext {
namespace core {

namespace {
    // Helper function to create a SHA-256 hash of a string
    std::string sha256(const std::string& data) {
        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int hashLen = 0;

        EVP_MD_CTX* ctx = EVP_MD_CTX_new();
        if (ctx == nullptr) {
            throw std::runtime_error("Failed to allocate digest context");
        }
        bool ok = EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) == 1 &&
                  EVP_DigestUpdate(ctx, data.c_str(), data.length()) == 1 &&
                  EVP_DigestFinal_ex(ctx, hash, &hashLen) == 1;
        EVP_MD_CTX_free(ctx);
        if (!ok) {
            throw std::runtime_error("Failed to compute SHA-256 digest");
        }

        std::stringstream ss;
        for (unsigned int i = 0; i < hashLen; i++) {
            ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
        }
        return ss.str();
    }

    // Models are listed by name, so the dump is independent of discovery order
    std::string canonicalFingerprint(const std::map<std::string, ExtensionModelPtr>& extensions) {
        nlohmann::json canonical = nlohmann::json::array();
        for (const auto& [name, model] : extensions) {
            canonical.push_back(model->to_json());
        }
        return sha256(canonical.dump());
    }
}

ResolutionContext::ResolutionContext()
    : fingerprint_(canonicalFingerprint({})) {}

std::optional<ExtensionModelPtr> ResolutionContext::getExtension(const std::string& name) const {
    auto it = extensions_.find(name);
    if (it == extensions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<ExtensionModelPtr> ResolutionContext::getExtensions() const {
    std::vector<ExtensionModelPtr> result;
    result.reserve(extensions_.size());
    for (const auto& [name, model] : extensions_) {
        result.push_back(model);
    }
    return result;
}

std::optional<ExtensionModelPtr> ResolutionContext::resolveType(const std::string& typeId) const {
    auto it = typeOwners_.find(typeId);
    if (it == typeOwners_.end()) {
        return std::nullopt;
    }
    return getExtension(it->second);
}

ResolutionContext ResolutionContextBuilder::build(const ExtensionModelSet& models) {
    ResolutionContext context;
    for (const auto& [name, model] : models) {
        context.extensions_.emplace(name, model);
        for (const auto& typeId : model->exportedTypes) {
            // Set iteration is ordered by name, so the first owner is the lowest name
            context.typeOwners_.emplace(typeId, name);
        }
    }
    context.fingerprint_ = canonicalFingerprint(context.extensions_);
    return context;
}

} // namespace core
} // namespace hostext
