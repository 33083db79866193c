// SPDX-License-Identifier: MIT
#include "config/json_value.hpp"
#include "core/errors.hpp"

namespace journal {
namespace config {

Decimal decimal_value(const nlohmann::json& value, const std::string& key) {
    try {
        if (value.is_string()) return Decimal::parse(value.get<std::string>());
        if (value.is_number()) return Decimal::from_double(value.get<double>());
    } catch (const ValidationError& e) {
        throw ConfigError(key + ": " + e.what());
    }
    throw ConfigError(key + " must be a number or decimal string");
}

int int_value(const nlohmann::json& value, const std::string& key) {
    if (!value.is_number_integer()) {
        throw ConfigError(key + " must be an integer");
    }
    return value.get<int>();
}

double double_value(const nlohmann::json& value, const std::string& key) {
    if (!value.is_number()) {
        throw ConfigError(key + " must be a number");
    }
    return value.get<double>();
}

bool bool_value(const nlohmann::json& value, const std::string& key) {
    if (!value.is_boolean()) {
        throw ConfigError(key + " must be a boolean");
    }
    return value.get<bool>();
}

std::string string_value(const nlohmann::json& value, const std::string& key) {
    if (!value.is_string()) {
        throw ConfigError(key + " must be a string");
    }
    return value.get<std::string>();
}

} // namespace config
} // namespace journal
