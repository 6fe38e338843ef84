#pragma once

#include "massing/params/ParameterSet.h"
#include <nlohmann/json.hpp>
#include <string>

namespace massing {
namespace params {

/**
 * ParameterLoader - resolves layered JSON parameter documents.
 *
 * Layers are applied defaults -> project -> lot. Objects merge key by key,
 * any other value (numbers, strings, arrays, null) replaces the lower layer.
 * The sections mirror config/default.json: zoning_parameters,
 * normative_parameters, architectural_parameters, parking_parameters and
 * modeling_strategy (with its grid_search_parameters block).
 */
class ParameterLoader {
public:
    using json = nlohmann::json;

    // Parse a JSON file; throws ConfigError when unreadable or malformed
    static json loadDocument(const std::string& path);

    // Parse a JSON string; throws ConfigError when malformed
    static json parseDocument(const std::string& text);

    // Recursive merge of `overlay` onto `base`
    static json merge(const json& base, const json& overlay);

    /**
     * Convert a resolved document to a validated ParameterSet.
     * Missing keys keep the ParameterSet member defaults; wrong types,
     * unknown enumeration names and out-of-range values throw ParameterError.
     */
    static ParameterSet fromJson(const json& doc);

    // merge(merge(defaults, project), lot) followed by fromJson
    static ParameterSet resolve(const json& defaults, const json& project, const json& lot);
};

} // namespace params
} // namespace massing
