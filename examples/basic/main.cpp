#include "hostext/core/default_native_extension_model_loader.h"
#include "hostext/core/errors.h"
#include "hostext/deployment/artifact_extension_manager_factory.h"
#include "hostext/deployment/loader_library.h"
#include "hostext/deployment/plugin_descriptor_reader.h"
#include "hostext/utils/logging.hpp"
#include <algorithm>
#include <filesystem>
#include <iostream>

using namespace hostext::core;
using namespace hostext::deployment;

namespace fs = std::filesystem;

// Usage: hostext_example <artifact-dir> [discovery-config.json]
// Every subdirectory of <artifact-dir> is a plugin; plugins are deployed in name order.
int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <artifact-dir> [discovery-config.json]\n";
        return 2;
    }

    try {
        DiscoveryConfig config;
        if (argc > 2) {
            config = DiscoveryConfig::fromFile(argv[2]);
        }
        hostext::utils::setLogLevel(config.logLevel);

        // Runtime bootstrap: built-in loader plus any loader libraries
        ExtensionModelLoaderRepository repository;
        repository.registerLoader(std::make_shared<DefaultNativeExtensionModelLoader>());
        auto report = LoaderLibraryScanner().scan(config.loaderLibraryDirs, repository);
        for (const auto& failure : report.failures) {
            std::cerr << "Skipped loader library " << failure.path << ": " << failure.message << "\n";
        }
        repository.seal();

        std::vector<fs::path> pluginRoots;
        for (const auto& entry : fs::directory_iterator(argv[1])) {
            if (entry.is_directory()) {
                pluginRoots.push_back(entry.path());
            }
        }
        std::sort(pluginRoots.begin(), pluginRoots.end());

        std::vector<ArtifactPluginPtr> plugins;
        for (const auto& root : pluginRoots) {
            plugins.push_back(loadPluginFromDirectory(root, config));
        }

        ArtifactExtensionManagerFactory factory(plugins, repository,
                                                std::make_shared<DefaultExtensionManagerFactory>(), config);
        auto manager = factory.create();

        std::cout << "Extensions of " << argv[1] << ":\n";
        for (const auto& extension : manager->getExtensions()) {
            std::cout << "- " << extension->name << " " << extension->version
                      << " (" << extension->operations.size() << " operations)\n";
        }
    } catch (const ConfigurationError& e) {
        std::cerr << "Deployment failed: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
