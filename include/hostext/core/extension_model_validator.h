#pragma once

#include <string>
#include <vector>

#include "hostext/core/extension_model.h"
#include "hostext/core/resolution_context.h"

namespace hostext {
namespace core {

/**
 * @brief Checks a freshly declared extension model before it is handed out.
 *
 * Rules:
 * - the name is not empty and the version parses as a Version
 * - operation and configuration names are unique, and so are the parameter
 *   names of each operation or configuration
 * - every imported type is exported by the extension itself or by an
 *   extension of the resolution context
 */
class ExtensionModelValidator {
public:
    /**
     * @brief Collects every rule violation of the model.
     * @return Human readable problems, empty if the model is valid
     */
    std::vector<std::string> findProblems(const ExtensionModel& model,
                                          const ResolutionContext& resolutionContext) const;

    /**
     * @throws IllegalModelDefinitionError listing all problems if the model is invalid
     */
    void validate(const ExtensionModel& model, const ResolutionContext& resolutionContext) const;
};

} // namespace core
} // namespace hostext
