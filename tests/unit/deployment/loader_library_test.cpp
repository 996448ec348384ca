#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "hostext/core/mock_extension_model_loader.hpp"
#include "hostext/deployment/directory_loading_context.h"
#include "hostext/deployment/loader_library.h"
#include "../plugin_test_utils.hpp"

#ifndef HOSTEXT_SAMPLE_LOADER_LIBRARY
#error "HOSTEXT_SAMPLE_LOADER_LIBRARY must name the sample loader library"
#endif

using namespace hostext::core;
using namespace hostext::deployment;
using hostext::test::TempDirectory;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Return;

namespace fs = std::filesystem;

class LoaderLibraryTest : public ::testing::Test {
protected:
    const fs::path samplePath{HOSTEXT_SAMPLE_LOADER_LIBRARY};
    ExtensionModelLoaderRepository repository;
};

TEST_F(LoaderLibraryTest, RegistersExportedLoaders) {
    auto library = LoaderLibrary::open(samplePath);
    ASSERT_TRUE(library) << library.error();

    auto registered = library.value()->registerLoaders(repository);

    ASSERT_TRUE(registered) << registered.error();
    EXPECT_EQ(registered.value(), (std::vector<std::string>{"sample", "sample-fixed"}));
    EXPECT_TRUE(repository.hasLoader("sample"));
    EXPECT_EQ(library.value()->getPath(), samplePath);
}

TEST_F(LoaderLibraryTest, LoadersOutliveLibraryHandle) {
    {
        auto library = LoaderLibrary::open(samplePath);
        ASSERT_TRUE(library) << library.error();
        ASSERT_TRUE(library.value()->registerLoaders(repository));
    }

    // The repository keeps the library mapped
    auto loader = repository.getExtensionModelLoader("sample");
    ASSERT_NE(loader, nullptr);
    DirectoryLoadingContext context("p", fs::temp_directory_path());
    auto model = loader->loadExtensionModel(context, ResolutionContext{},
                                            LoaderAttributes{{"name", std::string("FromLibrary")}});
    EXPECT_EQ(model->name, "FromLibrary");
    EXPECT_EQ(model->vendor, "Sample");
}

TEST_F(LoaderLibraryTest, TakenIdRegistersNothing) {
    auto clash = std::make_shared<NiceMock<MockExtensionModelLoader>>();
    ON_CALL(*clash, getId()).WillByDefault(Return("sample-fixed"));
    repository.registerLoader(clash);

    auto library = LoaderLibrary::open(samplePath);
    ASSERT_TRUE(library) << library.error();
    auto registered = library.value()->registerLoaders(repository);

    ASSERT_FALSE(registered);
    EXPECT_THAT(registered.error(), HasSubstr("sample-fixed"));
    EXPECT_FALSE(repository.hasLoader("sample"));
    EXPECT_EQ(repository.size(), 1u);
}

TEST_F(LoaderLibraryTest, SealedRepositoryIsRejected) {
    repository.seal();
    auto library = LoaderLibrary::open(samplePath);
    ASSERT_TRUE(library) << library.error();

    EXPECT_FALSE(library.value()->registerLoaders(repository));
}

TEST_F(LoaderLibraryTest, OpenReportsErrors) {
    TempDirectory dir;
    auto bogus = dir.writeFile("bogus" + LoaderLibraryScanner::libraryExtension(), "not a shared library");

    auto missing = LoaderLibrary::open(dir.path() / "missing.so");
    EXPECT_FALSE(missing);
    auto invalid = LoaderLibrary::open(bogus);
    ASSERT_FALSE(invalid);
    EXPECT_THAT(invalid.error(), HasSubstr("Failed to open loader library"));
}

class LoaderLibraryScannerTest : public ::testing::Test {
protected:
    void SetUp() override {
        fs::create_directories(dir.path() / "nested" / "deeper");
        fs::copy_file(HOSTEXT_SAMPLE_LOADER_LIBRARY,
                      dir.path() / "nested" / "deeper" / ("libsample" + LoaderLibraryScanner::libraryExtension()));
        dir.writeFile("broken" + LoaderLibraryScanner::libraryExtension(), "garbage");
        dir.writeFile("README.txt", "not a library");
    }

    TempDirectory dir;
    ExtensionModelLoaderRepository repository;
    LoaderLibraryScanner scanner;
};

TEST_F(LoaderLibraryScannerTest, ShallowScanSkipsSubdirectories) {
    auto report = scanner.scan({dir.path().string()}, repository);

    EXPECT_EQ(report.attempted, 1);
    EXPECT_EQ(report.loaded, 0);
    ASSERT_EQ(report.failures.size(), 1u);
    EXPECT_THAT(report.failures[0].path, HasSubstr("broken"));
    EXPECT_EQ(repository.size(), 0u);
}

TEST_F(LoaderLibraryScannerTest, RecursiveScanContinuesPastFailures) {
    auto report = scanner.scan({(dir.path() / "**").string()}, repository);

    EXPECT_EQ(report.attempted, 2);
    EXPECT_EQ(report.loaded, 1);
    EXPECT_EQ(report.failures.size(), 1u);
    EXPECT_EQ(report.registeredLoaderIds, (std::vector<std::string>{"sample", "sample-fixed"}));
    EXPECT_EQ(repository.getLoaderIds(), (std::vector<std::string>{"sample", "sample-fixed"}));
}

TEST_F(LoaderLibraryScannerTest, MissingDirectoryIsSkipped) {
    auto report = scanner.scan({(dir.path() / "absent").string()}, repository);
    EXPECT_EQ(report.attempted, 0);
    EXPECT_TRUE(report.failures.empty());
}

TEST_F(LoaderLibraryScannerTest, SameLibraryIsScannedOnce) {
    const auto nested = (dir.path() / "nested" / "deeper").string();
    auto report = scanner.scan({nested, nested + "/*"}, repository);
    EXPECT_EQ(report.attempted, 1);
    EXPECT_EQ(report.loaded, 1);
}
