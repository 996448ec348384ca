#pragma once

#include <any>
#include <map>
#include <string>

namespace hostext {
namespace core {

/// Parameters handed to a loader. Values are std::string, bool, int64_t, double or nlohmann::json.
using LoaderAttributes = std::map<std::string, std::any>;

/**
 * @brief Structured description of which loader builds a plugin's extension model.
 */
struct LoaderDescriber {
    std::string id;               // Id of an ExtensionModelLoader
    LoaderAttributes attributes;  // Passed verbatim to the loader
};

} // namespace core
} // namespace hostext
