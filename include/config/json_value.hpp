// SPDX-License-Identifier: MIT
#ifndef JOURNAL_CONFIG_JSON_VALUE_HPP
#define JOURNAL_CONFIG_JSON_VALUE_HPP

#include <string>
#include <nlohmann/json.hpp>

#include "core/decimal.hpp"

namespace journal {
namespace config {

// Typed reads of configuration values. @p key is the dotted path used in
// error messages. All throw ConfigError on a wrong type or malformed value.

/// Accepts 10000, 10000.5 or "10000.50".
Decimal decimal_value(const nlohmann::json& value, const std::string& key);

int int_value(const nlohmann::json& value, const std::string& key);
double double_value(const nlohmann::json& value, const std::string& key);
bool bool_value(const nlohmann::json& value, const std::string& key);
std::string string_value(const nlohmann::json& value, const std::string& key);

} // namespace config
} // namespace journal

#endif // JOURNAL_CONFIG_JSON_VALUE_HPP
