#ifndef HOSTEXT_CORE_EXTENSION_MODEL_H
#define HOSTEXT_CORE_EXTENSION_MODEL_H

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace hostext {
namespace core {

/**
 * @brief A parameter of an operation or configuration.
 */
struct ParameterModel {
    std::string name;
    std::string type;                          // Type id, e.g. "string" or "org.acme.http.Request"
    bool required{false};
    std::optional<std::string> defaultValue;

    bool operator==(const ParameterModel& other) const {
        return name == other.name && type == other.type &&
               required == other.required && defaultValue == other.defaultValue;
    }
    bool operator!=(const ParameterModel& other) const { return !(*this == other); }

    nlohmann::json to_json() const;
    static ParameterModel from_json(const nlohmann::json& j);
};

/**
 * @brief An operation exposed by an extension.
 */
struct OperationModel {
    std::string name;
    std::string description;
    std::vector<ParameterModel> parameters;
    std::optional<std::string> outputType;

    bool operator==(const OperationModel& other) const {
        return name == other.name && description == other.description &&
               parameters == other.parameters && outputType == other.outputType;
    }
    bool operator!=(const OperationModel& other) const { return !(*this == other); }

    nlohmann::json to_json() const;
    static OperationModel from_json(const nlohmann::json& j);
};

/**
 * @brief A configuration surface of an extension.
 */
struct ConfigurationModel {
    std::string name;
    std::string description;
    std::vector<ParameterModel> parameters;

    bool operator==(const ConfigurationModel& other) const {
        return name == other.name && description == other.description &&
               parameters == other.parameters;
    }
    bool operator!=(const ConfigurationModel& other) const { return !(*this == other); }

    nlohmann::json to_json() const;
    static ConfigurationModel from_json(const nlohmann::json& j);
};

/**
 * @brief Canonical description of an extension's capabilities.
 *
 * Produced by an ExtensionModelLoader and never modified afterwards; models
 * are shared as ExtensionModelPtr. Within an artifact an extension is
 * identified by its name.
 */
struct ExtensionModel {
    std::string name;
    std::string version;
    std::string vendor;
    std::string category;
    std::string description;
    std::set<std::string> exportedTypes;     // Type ids other extensions may import
    std::set<std::string> importedTypes;     // Type ids declared by other extensions
    std::vector<OperationModel> operations;
    std::vector<ConfigurationModel> configurations;

    bool operator==(const ExtensionModel& other) const {
        return name == other.name && version == other.version &&
               vendor == other.vendor && category == other.category &&
               description == other.description &&
               exportedTypes == other.exportedTypes &&
               importedTypes == other.importedTypes &&
               operations == other.operations &&
               configurations == other.configurations;
    }
    bool operator!=(const ExtensionModel& other) const { return !(*this == other); }

    nlohmann::json to_json() const;

    /**
     * @brief Builds a model from its JSON form.
     * @throws nlohmann::json::exception if "name" is missing or a field has the wrong type
     */
    static ExtensionModel from_json(const nlohmann::json& j);
};

using ExtensionModelPtr = std::shared_ptr<const ExtensionModel>;

/**
 * @brief Set of extension models keyed by extension name.
 *
 * Inserting a model whose name is already present keeps the existing model.
 * Iteration is ordered by name.
 */
class ExtensionModelSet {
public:
    using const_iterator = std::map<std::string, ExtensionModelPtr>::const_iterator;

    /**
     * @brief Adds a model to the set.
     * @return true if the model was added, false if a model with the same name was already present
     * @throws std::invalid_argument if model is null
     */
    bool insert(ExtensionModelPtr model);

    bool contains(const std::string& name) const { return models_.count(name) > 0; }
    ExtensionModelPtr find(const std::string& name) const;

    size_t size() const { return models_.size(); }
    bool empty() const { return models_.empty(); }

    const_iterator begin() const { return models_.begin(); }
    const_iterator end() const { return models_.end(); }

    std::set<std::string> names() const;

private:
    std::map<std::string, ExtensionModelPtr> models_;
};

} // namespace core
} // namespace hostext

#endif // HOSTEXT_CORE_EXTENSION_MODEL_H
