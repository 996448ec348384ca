/**
 * @file loader_library.h
 * @brief Loading of extension model loaders shipped as shared libraries.
 *
 * A loader library exports the entry point
 * @code
 * extern "C" void hostext_register_loaders(hostext::core::ExtensionModelLoaderRepository& repository);
 * @endcode
 * which registers the library's loaders. Libraries are loaded during runtime
 * bootstrap, before the loader repository is sealed.
 *
 * @see ExtensionModelLoaderRepository
 */
#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "hostext/core/extension_model_loader_repository.h"
#include "hostext/utils/result.hpp"

#if defined(_WIN32)
#define HOSTEXT_LOADER_API extern "C" __declspec(dllexport)
#else
#define HOSTEXT_LOADER_API extern "C" __attribute__((visibility("default")))
#endif

namespace hostext {
namespace deployment {

/**
 * @class LoaderLibrary
 * @brief A shared library providing extension model loaders.
 *
 * The library stays mapped while the LoaderLibrary or any loader it
 * registered is alive.
 */
class LoaderLibrary : public std::enable_shared_from_this<LoaderLibrary> {
public:
    static constexpr const char* ENTRY_POINT = "hostext_register_loaders";
    using RegisterFunction = void (*)(core::ExtensionModelLoaderRepository&);

    /**
     * @brief Open a loader library and resolve its entry point.
     * @param libraryPath Path to the shared library.
     * @return The library, or an error if it cannot be opened or lacks the entry point.
     */
    static Result<std::shared_ptr<LoaderLibrary>> open(const std::filesystem::path& libraryPath);

    ~LoaderLibrary();

    LoaderLibrary(const LoaderLibrary&) = delete;
    LoaderLibrary& operator=(const LoaderLibrary&) = delete;

    /**
     * @brief Register the library's loaders into a repository.
     *
     * Either all loaders of the library are registered or none: if one of
     * their ids is already taken, nothing is registered.
     *
     * @param repository Target repository, not sealed.
     * @return Ids of the registered loaders, or an error.
     */
    Result<std::vector<std::string>> registerLoaders(core::ExtensionModelLoaderRepository& repository) const;

    const std::filesystem::path& getPath() const { return path_; }

private:
    LoaderLibrary(std::filesystem::path path, void* handle, RegisterFunction registerFunction);

    std::filesystem::path path_;
    void* handle_;
    RegisterFunction registerFunction_;
};

/**
 * @brief Result of scanning directories for loader libraries.
 */
struct LoaderScanReport {
    struct Failure {
        std::string path;
        std::string message;
    };

    int attempted = 0;
    int loaded = 0;
    std::vector<std::string> registeredLoaderIds;
    std::vector<Failure> failures;
};

/**
 * @class LoaderLibraryScanner
 * @brief Loads every loader library found in a set of directories.
 *
 * Directory patterns:
 *   - "path" or "path/*" scans only the directory itself
 *   - "path/**" scans all subdirectories recursively
 *
 * A library that fails to load is reported and skipped; the scan continues.
 */
class LoaderLibraryScanner {
public:
    LoaderScanReport scan(const std::vector<std::string>& dirPatterns,
                          core::ExtensionModelLoaderRepository& repository) const;

    /// Platform shared library suffix (".so", ".dylib").
    static std::string libraryExtension();
};

} // namespace deployment
} // namespace hostext
