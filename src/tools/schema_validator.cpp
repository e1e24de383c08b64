#include "tools/schema_validator.hpp"

#include <cmath>
#include <string>

namespace forge::tools {

using core::errors::ErrorCategory;
using core::errors::ForgeError;
using nlohmann::json;

namespace {

bool matches_type(const std::string& type, const json& value) {
    if (type == "object") return value.is_object();
    if (type == "array") return value.is_array();
    if (type == "string") return value.is_string();
    if (type == "boolean") return value.is_boolean();
    if (type == "number") return value.is_number();
    if (type == "integer") {
        if (value.is_number_integer()) {
            return true;
        }
        // 3.0 is an integer as far as JSON Schema is concerned.
        if (!value.is_number_float()) {
            return false;
        }
        const double number = value.get<double>();
        return std::isfinite(number) && std::floor(number) == number;
    }
    if (type == "null") return value.is_null();
    return true;
}

ForgeError mismatch(const std::string& where, const std::string& what) {
    return ForgeError{ErrorCategory::Validation, where + ": " + what, "schema_mismatch"};
}

core::errors::Status validate_node(const json& schema, const json& value,
                                   const std::string& where) {
    if (!schema.is_object()) {
        return core::errors::ok();
    }

    if (schema.contains("type")) {
        const auto& type = schema.at("type");
        bool matched = false;
        if (type.is_string()) {
            matched = matches_type(type.get<std::string>(), value);
        } else if (type.is_array()) {
            for (const auto& option : type) {
                if (option.is_string() && matches_type(option.get<std::string>(), value)) {
                    matched = true;
                    break;
                }
            }
        } else {
            matched = true;
        }
        if (!matched) {
            return mismatch(where, "expected type " + type.dump() + ", got " + value.type_name());
        }
    }

    if (schema.contains("enum") && schema.at("enum").is_array()) {
        bool found = false;
        for (const auto& option : schema.at("enum")) {
            if (option == value) {
                found = true;
                break;
            }
        }
        if (!found) {
            return mismatch(where, "value must be one of " + schema.at("enum").dump());
        }
    }

    if (value.is_number()) {
        const double number = value.get<double>();
        if (schema.contains("minimum") && schema.at("minimum").is_number() &&
            number < schema.at("minimum").get<double>()) {
            return mismatch(where, "must be >= " + schema.at("minimum").dump());
        }
        if (schema.contains("maximum") && schema.at("maximum").is_number() &&
            number > schema.at("maximum").get<double>()) {
            return mismatch(where, "must be <= " + schema.at("maximum").dump());
        }
    }

    if (value.is_object()) {
        if (schema.contains("required") && schema.at("required").is_array()) {
            for (const auto& key : schema.at("required")) {
                if (key.is_string() && !value.contains(key.get<std::string>())) {
                    return mismatch(where, "missing required field '" + key.get<std::string>() + "'");
                }
            }
        }
        const json properties =
            schema.contains("properties") && schema.at("properties").is_object()
                ? schema.at("properties")
                : json::object();
        const bool closed = schema.contains("additionalProperties") &&
                            schema.at("additionalProperties").is_boolean() &&
                            !schema.at("additionalProperties").get<bool>();
        for (auto it = value.begin(); it != value.end(); ++it) {
            if (properties.contains(it.key())) {
                auto nested = validate_node(properties.at(it.key()), it.value(),
                                            where + "." + it.key());
                if (core::errors::is_error(nested)) {
                    return nested;
                }
            } else if (closed) {
                return mismatch(where, "unexpected field '" + it.key() + "'");
            }
        }
    }

    if (value.is_array() && schema.contains("items")) {
        for (std::size_t i = 0; i < value.size(); ++i) {
            auto nested = validate_node(schema.at("items"), value.at(i),
                                        where + "[" + std::to_string(i) + "]");
            if (core::errors::is_error(nested)) {
                return nested;
            }
        }
    }

    return core::errors::ok();
}

}  // namespace

core::errors::Status validate_against_schema(const json& schema, const json& value) {
    return validate_node(schema, value, "arguments");
}

}  // namespace forge::tools
