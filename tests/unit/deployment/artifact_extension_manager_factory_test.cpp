#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "hostext/core/default_native_extension_model_loader.h"
#include "hostext/core/errors.h"
#include "hostext/core/mock_extension_manager.hpp"
#include "hostext/deployment/artifact_extension_manager_factory.h"
#include "../plugin_test_utils.hpp"

using namespace hostext::core;
using namespace hostext::deployment;
using hostext::test::PluginBuilder;
using hostext::test::TempDirectory;
using ::testing::_;
using ::testing::NiceMock;

namespace {

// Hands out a prepared manager
class FixedExtensionManagerFactory : public ExtensionManagerFactory {
public:
    explicit FixedExtensionManagerFactory(std::shared_ptr<ExtensionManager> manager)
        : manager_(std::move(manager)) {}

    std::shared_ptr<ExtensionManager> create() override { return manager_; }

private:
    std::shared_ptr<ExtensionManager> manager_;
};

} // namespace

class ArtifactExtensionManagerFactoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        repository.registerLoader(std::make_shared<DefaultNativeExtensionModelLoader>());
        repository.seal();
    }

    ArtifactPluginPtr nativePlugin(const std::string& pluginName, const std::string& extensionName) {
        const std::string type = "org.acme." + extensionName;
        PluginBuilder builder(artifact.path(), pluginName);
        builder.declare(type, nlohmann::json{{"name", extensionName}});
        return builder.build(LoaderDescriber{"native", {{"type", type}, {"version", std::string("1.0.0")}}});
    }

    TempDirectory artifact;
    ExtensionModelLoaderRepository repository;
};

TEST_F(ArtifactExtensionManagerFactoryTest, RegistersDiscoveredExtensions) {
    ArtifactExtensionManagerFactory factory({nativePlugin("http-plugin", "HTTP"), nativePlugin("tls-plugin", "TLS")},
                                            repository, std::make_shared<DefaultExtensionManagerFactory>());

    auto manager = factory.create();

    ASSERT_NE(manager, nullptr);
    auto extensions = manager->getExtensions();
    ASSERT_EQ(extensions.size(), 2u);
    EXPECT_EQ(extensions[0]->name, "HTTP");
    EXPECT_EQ(extensions[1]->name, "TLS");
}

TEST_F(ArtifactExtensionManagerFactoryTest, RegistersEachExtensionOnce) {
    auto manager = std::make_shared<NiceMock<MockExtensionManager>>();
    EXPECT_CALL(*manager, registerExtension(_)).Times(2);

    ArtifactExtensionManagerFactory factory({nativePlugin("a", "A"), nativePlugin("b", "B")},
                                            repository, std::make_shared<FixedExtensionManagerFactory>(manager));
    EXPECT_EQ(factory.create(), manager);
}

TEST_F(ArtifactExtensionManagerFactoryTest, FailedDiscoveryRegistersNothing) {
    auto manager = std::make_shared<NiceMock<MockExtensionManager>>();
    EXPECT_CALL(*manager, registerExtension(_)).Times(0);

    auto unknown = PluginBuilder(artifact.path(), "soap-plugin").build(LoaderDescriber{"soap", {}});
    ArtifactExtensionManagerFactory factory({nativePlugin("http-plugin", "HTTP"), unknown},
                                            repository, std::make_shared<FixedExtensionManagerFactory>(manager));

    EXPECT_THROW(factory.create(), ConfigurationError);
}

TEST_F(ArtifactExtensionManagerFactoryTest, ArtifactWithoutExtensionsYieldsEmptyManager) {
    ArtifactExtensionManagerFactory factory({PluginBuilder(artifact.path(), "utils").build()},
                                            repository, std::make_shared<DefaultExtensionManagerFactory>());
    EXPECT_TRUE(factory.create()->getExtensions().empty());
}

TEST_F(ArtifactExtensionManagerFactoryTest, RejectsMissingManagerFactory) {
    EXPECT_THROW(ArtifactExtensionManagerFactory({}, repository, nullptr), std::invalid_argument);
}

TEST_F(ArtifactExtensionManagerFactoryTest, NullManagerFromFactoryFails) {
    ArtifactExtensionManagerFactory factory({}, repository, std::make_shared<FixedExtensionManagerFactory>(nullptr));
    EXPECT_THROW(factory.create(), std::runtime_error);
}
