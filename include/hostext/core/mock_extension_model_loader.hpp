#pragma once

#include <gmock/gmock.h>
#include "hostext/core/extension_model_loader.h"

namespace hostext {
namespace core {

class MockExtensionModelLoader : public ExtensionModelLoader {
public:
    MOCK_METHOD(std::string, getId, (), (const, override));
    MOCK_METHOD(ExtensionModel, declareExtension, (const ExtensionLoadingRequest& request), (const, override));
};

} // namespace core
} // namespace hostext
