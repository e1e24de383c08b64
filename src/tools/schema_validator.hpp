#pragma once

#include <nlohmann/json.hpp>
#include "core/errors/forge_errors.hpp"

namespace forge::tools {

// Checks value against the JSON Schema subset tools declare: type, required,
// properties, enum, items and additionalProperties: false. Unknown keywords
// are ignored. Failures are Validation errors naming the offending field.
core::errors::Status validate_against_schema(const nlohmann::json& schema,
                                             const nlohmann::json& value);

}  // namespace forge::tools
