#pragma once

#include <memory>

#include "hostext/core/extension_manager.h"

namespace hostext {
namespace core {

/**
 * @brief Creates the ExtensionManager of an artifact.
 */
class ExtensionManagerFactory {
public:
    virtual ~ExtensionManagerFactory() = default;

    virtual std::shared_ptr<ExtensionManager> create() = 0;
};

/**
 * @brief Creates empty DefaultExtensionManager instances.
 */
class DefaultExtensionManagerFactory : public ExtensionManagerFactory {
public:
    std::shared_ptr<ExtensionManager> create() override {
        return std::make_shared<DefaultExtensionManager>();
    }
};

} // namespace core
} // namespace hostext
