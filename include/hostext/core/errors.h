#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace hostext {
namespace core {

/**
 * @brief Fatal deployment error raised while discovering the extensions of an artifact.
 *
 * Thrown when a plugin's loader describer names a loader id with no registered
 * implementation. Subclasses cover loader failures and malformed manifests.
 * Any ConfigurationError aborts discovery for the whole artifact.
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message,
                                std::string loaderId = "",
                                std::string pluginName = "")
        : std::runtime_error(message),
          message_(message),
          loaderId_(std::move(loaderId)),
          pluginName_(std::move(pluginName)) {}

    const char* what() const noexcept override { return message_.c_str(); }

    /// Loader id involved in the failure, empty if none.
    const std::string& loaderId() const noexcept { return loaderId_; }
    /// Name of the offending plugin, empty if unknown.
    const std::string& pluginName() const noexcept { return pluginName_; }

    /**
     * @brief Names the plugin being discovered when the error was raised without one.
     *
     * Errors that already carry a plugin name are left unchanged.
     */
    void attributeToPlugin(const std::string& pluginName) {
        if (!pluginName_.empty() || pluginName.empty()) {
            return;
        }
        pluginName_ = pluginName;
        message_ += " (plugin '" + pluginName + "')";
    }

private:
    std::string message_;
    std::string loaderId_;
    std::string pluginName_;
};

/**
 * @brief A loader failed to produce an extension model.
 */
class ExtensionLoadingError : public ConfigurationError {
public:
    explicit ExtensionLoadingError(const std::string& message,
                                   std::string pluginName = "")
        : ConfigurationError(message, "", std::move(pluginName)) {}
};

/**
 * @brief A required loader attribute is missing or has the wrong type.
 */
class IllegalParameterError : public ExtensionLoadingError {
public:
    IllegalParameterError(const std::string& message, std::string parameterName)
        : ExtensionLoadingError(message), parameterName_(std::move(parameterName)) {}

    const std::string& parameterName() const noexcept { return parameterName_; }

private:
    std::string parameterName_;
};

/**
 * @brief A loader produced a model that failed validation.
 */
class IllegalModelDefinitionError : public ExtensionLoadingError {
public:
    IllegalModelDefinitionError(const std::string& extensionName,
                                std::vector<std::string> problems)
        : ExtensionLoadingError(buildMessage(extensionName, problems)),
          problems_(std::move(problems)) {}

    const std::vector<std::string>& problems() const noexcept { return problems_; }

private:
    static std::string buildMessage(const std::string& extensionName,
                                    const std::vector<std::string>& problems) {
        std::string message = "Extension '" + extensionName + "' has an invalid definition:";
        for (const auto& problem : problems) {
            message += "\n  - " + problem;
        }
        return message;
    }

    std::vector<std::string> problems_;
};

/**
 * @brief A legacy manifest or plugin descriptor could not be read or is malformed.
 */
class ManifestParseError : public ConfigurationError {
public:
    ManifestParseError(const std::string& message, std::string resource)
        : ConfigurationError(message), resource_(std::move(resource)) {}

    const std::string& resource() const noexcept { return resource_; }

private:
    std::string resource_;
};

} // namespace core
} // namespace hostext
