#include "hostext/core/extension_model_validator.h"

#include <set>

#include "hostext/core/errors.h"
#include "hostext/core/version.h"

namespace hostext {
namespace core {

namespace {

void checkParameters(const std::string& owner,
                     const std::vector<ParameterModel>& parameters,
                     std::vector<std::string>& problems) {
    std::set<std::string> seen;
    for (const auto& parameter : parameters) {
        if (parameter.name.empty()) {
            problems.push_back(owner + " declares a parameter without a name");
        } else if (!seen.insert(parameter.name).second) {
            problems.push_back(owner + " declares parameter '" + parameter.name + "' more than once");
        }
    }
}

} // namespace

std::vector<std::string> ExtensionModelValidator::findProblems(
    const ExtensionModel& model,
    const ResolutionContext& resolutionContext) const {
    std::vector<std::string> problems;

    if (model.name.empty()) {
        problems.push_back("the extension name is empty");
    }
    if (!Version::isValid(model.version)) {
        problems.push_back("version '" + model.version + "' is not a valid version");
    }

    std::set<std::string> operationNames;
    for (const auto& operation : model.operations) {
        if (!operationNames.insert(operation.name).second) {
            problems.push_back("operation '" + operation.name + "' is declared more than once");
        }
        checkParameters("operation '" + operation.name + "'", operation.parameters, problems);
    }

    std::set<std::string> configurationNames;
    for (const auto& configuration : model.configurations) {
        if (!configurationNames.insert(configuration.name).second) {
            problems.push_back("configuration '" + configuration.name + "' is declared more than once");
        }
        checkParameters("configuration '" + configuration.name + "'", configuration.parameters, problems);
    }

    for (const auto& typeId : model.importedTypes) {
        if (model.exportedTypes.count(typeId) == 0 && !resolutionContext.resolveType(typeId)) {
            problems.push_back("imported type '" + typeId +
                               "' is not exported by any extension resolved before this one");
        }
    }

    return problems;
}

void ExtensionModelValidator::validate(const ExtensionModel& model,
                                       const ResolutionContext& resolutionContext) const {
    auto problems = findProblems(model, resolutionContext);
    if (!problems.empty()) {
        throw IllegalModelDefinitionError(model.name, std::move(problems));
    }
}

} // namespace core
} // namespace hostext
