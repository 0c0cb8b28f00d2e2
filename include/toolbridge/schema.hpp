#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace toolbridge {

/// Checks tool-call arguments against the tool's advertised input schema.
///
/// Covers the JSON Schema subset tool servers use in practice: "type"
/// (single or list), "required", "properties", "additionalProperties": false,
/// "enum", "items", "minimum"/"maximum", "minLength"/"maxLength".
/// Keywords outside that subset are ignored, so an unusual schema never
/// rejects a call the server would accept.
///
/// Throws InvalidArguments naming the offending path.
void validate_arguments(const nlohmann::json& schema, const nlohmann::json& arguments);

} // namespace toolbridge
