#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <thread>

#include "hostext/core/errors.h"
#include "hostext/core/mock_extension_manager.hpp"
#include "hostext/core/mock_extension_model_loader.hpp"
#include "hostext/deployment/extension_discovery.h"
#include "../plugin_test_utils.hpp"

using namespace hostext::core;
using namespace hostext::deployment;
using hostext::test::CapturedLog;
using hostext::test::PluginBuilder;
using hostext::test::TempDirectory;
using hostext::test::makeModel;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;

namespace {

nlohmann::json declaration(const std::string& name,
                           std::vector<std::string> exportedTypes = {},
                           std::vector<std::string> importedTypes = {}) {
    return nlohmann::json{{"name", name}, {"exportedTypes", exportedTypes}, {"importedTypes", importedTypes}};
}

LoaderDescriber nativeDescriber(const std::string& type, const std::string& version = "1.0.0") {
    return LoaderDescriber{"native", {{"type", type}, {"version", version}}};
}

} // namespace

class ExtensionDiscoveryTest : public ::testing::Test {
protected:
    void SetUp() override {
        repository.registerLoader(std::make_shared<DefaultNativeExtensionModelLoader>());
    }

    // Plugin whose describer points at the native loader
    ArtifactPluginPtr nativePlugin(const std::string& pluginName, const std::string& extensionName,
                                   std::vector<std::string> exportedTypes = {},
                                   std::vector<std::string> importedTypes = {}) {
        const std::string type = "org.acme." + extensionName;
        PluginBuilder builder(artifact.path(), pluginName);
        builder.declare(type, declaration(extensionName, exportedTypes, importedTypes));
        return builder.build(nativeDescriber(type));
    }

    ArtifactPluginPtr manifestPlugin(const std::string& pluginName, const std::string& extensionName,
                                     const std::string& version = "1.0.0") {
        const std::string type = "org.acme." + extensionName;
        PluginBuilder builder(artifact.path(), pluginName);
        builder.declare(type, declaration(extensionName));
        builder.manifest(extensionName, version, type);
        return builder.build();
    }

    ArtifactPluginPtr barePlugin(const std::string& pluginName) {
        return PluginBuilder(artifact.path(), pluginName).build();
    }

    TempDirectory artifact;
    ExtensionModelLoaderRepository repository;
    DefaultExtensionManager manifestParser;
};

TEST_F(ExtensionDiscoveryTest, StructuredDescriberUsesRegisteredLoader) {
    ExtensionDiscovery discovery(repository, manifestParser);

    auto extensions = discovery.discoverAll({nativePlugin("http-plugin", "HTTP")});

    ASSERT_EQ(extensions.size(), 1u);
    EXPECT_EQ(extensions.find("HTTP")->version, "1.0.0");
}

TEST_F(ExtensionDiscoveryTest, UnknownLoaderIdAbortsDiscovery) {
    ExtensionDiscovery discovery(repository, manifestParser);
    auto plugin = PluginBuilder(artifact.path(), "soap-plugin").build(LoaderDescriber{"soap", {}});

    try {
        discovery.discoverAll({nativePlugin("http-plugin", "HTTP"), plugin});
        FAIL() << "Expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_STREQ(e.what(),
                     "The identifier 'soap' does not match with the describers available to generate an "
                     "ExtensionModel (working with the plugin 'soap-plugin')");
        EXPECT_EQ(e.loaderId(), "soap");
        EXPECT_EQ(e.pluginName(), "soap-plugin");
    }
}

TEST_F(ExtensionDiscoveryTest, LegacyManifestUsesBuiltinLoader) {
    ExtensionDiscovery discovery(repository, manifestParser);

    auto extensions = discovery.discoverAll({manifestPlugin("sockets-plugin", "Sockets", "2.1.0")});

    ASSERT_EQ(extensions.size(), 1u);
    EXPECT_EQ(extensions.find("Sockets")->version, "2.1.0");
}

TEST_F(ExtensionDiscoveryTest, LegacyManifestIsParsedByExtensionManager) {
    NiceMock<MockExtensionManager> parser;
    auto plugin = manifestPlugin("sockets-plugin", "Sockets");
    ExtensionManifest manifest;
    manifest.name = "Sockets";
    manifest.version = "3.0.0";
    manifest.describer.properties["type"] = "org.acme.Sockets";

    EXPECT_CALL(parser, parseExtensionManifest(_)).WillOnce(Return(manifest));

    ExtensionDiscovery discovery(repository, parser);
    auto extensions = discovery.discoverAll({plugin});

    EXPECT_EQ(extensions.find("Sockets")->version, "3.0.0");
}

TEST_F(ExtensionDiscoveryTest, PluginWithoutExtensionIsSkipped) {
    ExtensionDiscovery discovery(repository, manifestParser);
    CapturedLog log;

    auto result = discovery.discover({barePlugin("utils"), nativePlugin("http-plugin", "HTTP")});

    EXPECT_EQ(result.extensions.size(), 1u);
    EXPECT_EQ(result.undiscoveredPlugins, std::vector<std::string>{"utils"});
    EXPECT_TRUE(log.contains("Extension [utils] could not be discovered"));
}

TEST_F(ExtensionDiscoveryTest, EmptyPluginListYieldsEmptySet) {
    ExtensionDiscovery discovery(repository, manifestParser);
    EXPECT_TRUE(discovery.discoverAll({}).empty());
}

TEST_F(ExtensionDiscoveryTest, OneModelPerDiscoverablePlugin) {
    ExtensionDiscovery discovery(repository, manifestParser);

    auto extensions = discovery.discoverAll({
        nativePlugin("a", "A"),
        manifestPlugin("b", "B"),
        barePlugin("c"),
        nativePlugin("d", "D"),
        barePlugin("e"),
    });

    EXPECT_EQ(extensions.names(), (std::set<std::string>{"A", "B", "D"}));
}

TEST_F(ExtensionDiscoveryTest, DuplicateExtensionNameKeepsFirst) {
    ExtensionDiscovery discovery(repository, manifestParser);
    CapturedLog log;

    auto extensions = discovery.discoverAll({
        manifestPlugin("first", "HTTP", "1.0.0"),
        manifestPlugin("second", "HTTP", "2.0.0"),
    });

    ASSERT_EQ(extensions.size(), 1u);
    EXPECT_EQ(extensions.find("HTTP")->version, "1.0.0");
    EXPECT_TRUE(log.contains("keeping the first one"));
}

TEST_F(ExtensionDiscoveryTest, EachLoaderSeesPreviouslyResolvedExtensions) {
    auto recording = std::make_shared<NiceMock<MockExtensionModelLoader>>();
    ON_CALL(*recording, getId()).WillByDefault(Return("recording"));
    repository.registerLoader(recording);

    std::vector<std::set<std::string>> seen;
    EXPECT_CALL(*recording, declareExtension(_))
        .Times(3)
        .WillRepeatedly(Invoke([&](const ExtensionLoadingRequest& request) {
            std::set<std::string> names;
            for (const auto& model : request.getResolutionContext().getExtensions()) {
                names.insert(model->name);
            }
            seen.push_back(names);
            return makeModel(request.requireString("name"));
        }));

    auto plugin = [&](const std::string& name) {
        return PluginBuilder(artifact.path(), name)
            .build(LoaderDescriber{"recording", {{"name", name}}});
    };

    ExtensionDiscovery discovery(repository, manifestParser);
    discovery.discoverAll({plugin("A"), plugin("B"), plugin("C")});

    ASSERT_EQ(seen.size(), 3u);
    EXPECT_TRUE(seen[0].empty());
    EXPECT_EQ(seen[1], (std::set<std::string>{"A"}));
    EXPECT_EQ(seen[2], (std::set<std::string>{"A", "B"}));
}

TEST_F(ExtensionDiscoveryTest, ImportsResolveOnlyFromEarlierPlugins) {
    ExtensionDiscovery discovery(repository, manifestParser);
    auto tls = nativePlugin("tls-plugin", "TLS", {"org.acme.tls.Context"});
    auto http = nativePlugin("http-plugin", "HTTP", {}, {"org.acme.tls.Context"});

    EXPECT_EQ(discovery.discoverAll({tls, http}).size(), 2u);

    try {
        discovery.discoverAll({http, tls});
        FAIL() << "Expected IllegalModelDefinitionError";
    } catch (const IllegalModelDefinitionError& e) {
        EXPECT_THAT(e.what(), HasSubstr("org.acme.tls.Context"));
    }
}

TEST_F(ExtensionDiscoveryTest, LoaderFailureAbortsDiscovery) {
    auto failing = std::make_shared<NiceMock<MockExtensionModelLoader>>();
    ON_CALL(*failing, getId()).WillByDefault(Return("failing"));
    ON_CALL(*failing, declareExtension(_)).WillByDefault(Invoke([](const ExtensionLoadingRequest&) -> ExtensionModel {
        throw std::runtime_error("disk on fire");
    }));
    repository.registerLoader(failing);

    ExtensionDiscovery discovery(repository, manifestParser);
    auto broken = PluginBuilder(artifact.path(), "broken").build(LoaderDescriber{"failing", {}});

    try {
        discovery.discoverAll({nativePlugin("http-plugin", "HTTP"), broken});
        FAIL() << "Expected ExtensionLoadingError";
    } catch (const ExtensionLoadingError& e) {
        EXPECT_EQ(e.pluginName(), "broken");
        EXPECT_THAT(e.what(), HasSubstr("disk on fire"));
    }
}

TEST_F(ExtensionDiscoveryTest, MalformedManifestAbortsDiscovery) {
    PluginBuilder builder(artifact.path(), "broken");
    builder.write("META-INF/extension-manifest.json", "{ not json");

    ExtensionDiscovery discovery(repository, manifestParser);
    try {
        discovery.discoverAll({builder.build()});
        FAIL() << "Expected ManifestParseError";
    } catch (const ManifestParseError& e) {
        EXPECT_EQ(e.pluginName(), "broken");
        EXPECT_THAT(e.what(), HasSubstr("(plugin 'broken')"));
    }
}

TEST_F(ExtensionDiscoveryTest, MissingLoaderAttributeNamesPlugin) {
    ExtensionDiscovery discovery(repository, manifestParser);
    PluginBuilder builder(artifact.path(), "http-plugin");
    builder.declare("org.acme.HTTP", declaration("HTTP"));
    auto plugin = builder.build(LoaderDescriber{"native", {{"type", std::string("org.acme.HTTP")}}});

    try {
        discovery.discoverAll({nativePlugin("tls-plugin", "TLS"), plugin});
        FAIL() << "Expected IllegalParameterError";
    } catch (const IllegalParameterError& e) {
        EXPECT_EQ(e.parameterName(), "version");
        EXPECT_EQ(e.pluginName(), "http-plugin");
        EXPECT_THAT(e.what(), HasSubstr("Required loader attribute 'version' is missing"));
        EXPECT_THAT(e.what(), HasSubstr("http-plugin"));
    }
}

TEST_F(ExtensionDiscoveryTest, InvalidModelNamesPlugin) {
    ExtensionDiscovery discovery(repository, manifestParser);
    auto http = nativePlugin("http-plugin", "HTTP", {}, {"org.acme.tls.Context"});

    try {
        discovery.discoverAll({http});
        FAIL() << "Expected IllegalModelDefinitionError";
    } catch (const IllegalModelDefinitionError& e) {
        EXPECT_EQ(e.pluginName(), "http-plugin");
    }
}

TEST_F(ExtensionDiscoveryTest, RepeatedPassesAreEqual) {
    ExtensionDiscovery discovery(repository, manifestParser);
    std::vector<ArtifactPluginPtr> plugins{
        nativePlugin("tls-plugin", "TLS", {"org.acme.tls.Context"}),
        manifestPlugin("sockets-plugin", "Sockets"),
        nativePlugin("http-plugin", "HTTP", {}, {"org.acme.tls.Context"}),
    };

    auto first = discovery.discoverAll(plugins);
    auto second = discovery.discoverAll(plugins);

    EXPECT_EQ(ResolutionContextBuilder::build(first), ResolutionContextBuilder::build(second));
}

TEST_F(ExtensionDiscoveryTest, ConcurrentPassesAreIndependent) {
    repository.seal();
    ExtensionDiscovery discovery(repository, manifestParser);
    std::vector<ArtifactPluginPtr> left{nativePlugin("l1", "Left1"), manifestPlugin("l2", "Left2")};
    std::vector<ArtifactPluginPtr> right{nativePlugin("r1", "Right1"), nativePlugin("r2", "Right2"),
                                        manifestPlugin("r3", "Right3")};

    ExtensionModelSet leftResult;
    ExtensionModelSet rightResult;
    std::thread leftThread([&] {
        for (int i = 0; i < 20; ++i) leftResult = discovery.discoverAll(left);
    });
    std::thread rightThread([&] {
        for (int i = 0; i < 20; ++i) rightResult = discovery.discoverAll(right);
    });
    leftThread.join();
    rightThread.join();

    EXPECT_EQ(leftResult.names(), (std::set<std::string>{"Left1", "Left2"}));
    EXPECT_EQ(rightResult.names(), (std::set<std::string>{"Right1", "Right2", "Right3"}));
}
