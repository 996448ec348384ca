#pragma once

#include <gmock/gmock.h>
#include "hostext/core/extension_manager.h"

namespace hostext {
namespace core {

class MockExtensionManager : public ExtensionManager {
public:
    MOCK_METHOD(void, registerExtension, (ExtensionModelPtr model), (override));
    MOCK_METHOD(std::vector<ExtensionModelPtr>, getExtensions, (), (const, override));
    MOCK_METHOD(std::optional<ExtensionModelPtr>, getExtension, (const std::string& name), (const, override));
    MOCK_METHOD(ExtensionManifest, parseExtensionManifest, (const std::filesystem::path& manifestPath), (const, override));
};

} // namespace core
} // namespace hostext
