#include "hostext/core/extension_model.h"

#include <stdexcept>

namespace hostext {
namespace core {

namespace {

template <typename T>
nlohmann::json toJsonArray(const std::vector<T>& items) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto& item : items) {
        array.push_back(item.to_json());
    }
    return array;
}

template <typename T>
std::vector<T> fromJsonArray(const nlohmann::json& j, const char* key) {
    std::vector<T> items;
    if (j.contains(key)) {
        for (const auto& element : j.at(key)) {
            items.push_back(T::from_json(element));
        }
    }
    return items;
}

std::set<std::string> stringSet(const nlohmann::json& j, const char* key) {
    std::set<std::string> values;
    if (j.contains(key)) {
        for (const auto& element : j.at(key)) {
            values.insert(element.get<std::string>());
        }
    }
    return values;
}

} // namespace

// ---- ParameterModel ----

nlohmann::json ParameterModel::to_json() const {
    nlohmann::json j{{"name", name}, {"type", type}, {"required", required}};
    if (defaultValue) {
        j["defaultValue"] = *defaultValue;
    }
    return j;
}

ParameterModel ParameterModel::from_json(const nlohmann::json& j) {
    ParameterModel parameter;
    parameter.name = j.at("name").get<std::string>();
    parameter.type = j.value("type", std::string("string"));
    parameter.required = j.value("required", false);
    if (j.contains("defaultValue")) {
        parameter.defaultValue = j.at("defaultValue").get<std::string>();
    }
    return parameter;
}

// ---- OperationModel ----

nlohmann::json OperationModel::to_json() const {
    nlohmann::json j{{"name", name}, {"description", description}, {"parameters", toJsonArray(parameters)}};
    if (outputType) {
        j["outputType"] = *outputType;
    }
    return j;
}

OperationModel OperationModel::from_json(const nlohmann::json& j) {
    OperationModel operation;
    operation.name = j.at("name").get<std::string>();
    operation.description = j.value("description", std::string());
    operation.parameters = fromJsonArray<ParameterModel>(j, "parameters");
    if (j.contains("outputType")) {
        operation.outputType = j.at("outputType").get<std::string>();
    }
    return operation;
}

// ---- ConfigurationModel ----

nlohmann::json ConfigurationModel::to_json() const {
    return nlohmann::json{{"name", name}, {"description", description}, {"parameters", toJsonArray(parameters)}};
}

ConfigurationModel ConfigurationModel::from_json(const nlohmann::json& j) {
    ConfigurationModel configuration;
    configuration.name = j.at("name").get<std::string>();
    configuration.description = j.value("description", std::string());
    configuration.parameters = fromJsonArray<ParameterModel>(j, "parameters");
    return configuration;
}

// ---- ExtensionModel ----

nlohmann::json ExtensionModel::to_json() const {
    return nlohmann::json{
        {"name", name},
        {"version", version},
        {"vendor", vendor},
        {"category", category},
        {"description", description},
        {"exportedTypes", exportedTypes},
        {"importedTypes", importedTypes},
        {"operations", toJsonArray(operations)},
        {"configurations", toJsonArray(configurations)}
    };
}

ExtensionModel ExtensionModel::from_json(const nlohmann::json& j) {
    ExtensionModel model;
    model.name = j.at("name").get<std::string>();
    model.version = j.value("version", std::string());
    model.vendor = j.value("vendor", std::string());
    model.category = j.value("category", std::string());
    model.description = j.value("description", std::string());
    model.exportedTypes = stringSet(j, "exportedTypes");
    model.importedTypes = stringSet(j, "importedTypes");
    model.operations = fromJsonArray<OperationModel>(j, "operations");
    model.configurations = fromJsonArray<ConfigurationModel>(j, "configurations");
    return model;
}

// ---- ExtensionModelSet ----

bool ExtensionModelSet::insert(ExtensionModelPtr model) {
    if (!model) {
        throw std::invalid_argument("Cannot add a null extension model");
    }
    const std::string name = model->name;
    return models_.emplace(name, std::move(model)).second;
}

ExtensionModelPtr ExtensionModelSet::find(const std::string& name) const {
    auto it = models_.find(name);
    return (it != models_.end()) ? it->second : nullptr;
}

std::set<std::string> ExtensionModelSet::names() const {
    std::set<std::string> result;
    for (const auto& [name, model] : models_) {
        result.insert(name);
    }
    return result;
}

} // namespace core
} // namespace hostext
