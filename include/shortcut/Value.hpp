/**
 * @file Value.hpp
 * @brief Value types for shortcut normalization
 *
 * Resolved argument values use nlohmann::json as the underlying value
 * model, so a normalized configuration can hold:
 * - Null (absent raw value)
 * - String (raw value passed through unchanged)
 * - Any scalar an expression evaluated to (bool, number, string)
 * - Array (gathered list of resolved values)
 *
 * Raw shorthand arguments are kept in ArgMap, nlohmann's insertion-ordered
 * map. Position matters: it drives placeholder key naming and
 * trailing-flag detection.
 */

#ifndef SHORTCUT_VALUE_HPP
#define SHORTCUT_VALUE_HPP

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace shortcut {

/**
 * @brief JSON-like value type for resolved arguments
 *
 * Alias for nlohmann::json. A NormalizedConfig is a Value holding an
 * object; individual entries are scalars or arrays.
 */
using Value = nlohmann::json;

/**
 * @brief Field name -> resolved value, produced by normalize()
 */
using NormalizedConfig = Value;

/**
 * @brief Raw argument value; std::nullopt models an absent value
 */
using RawValue = std::optional<std::string>;

/**
 * @brief Insertion-ordered map of raw shorthand arguments
 *
 * operator[] on an existing key replaces the value in place and keeps the
 * original position; at() throws std::out_of_range for a missing key.
 */
using ArgMap = nlohmann::ordered_map<std::string, RawValue>;

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return Type name string (e.g., "null", "boolean", "integer", "float",
 *         "string", "array", "object")
 */
inline std::string type_name(const Value& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number_integer()) return "integer";
    if (val.is_number_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_array()) return "array";
    if (val.is_object()) return "object";
    return "unknown";
}

} // namespace shortcut

#endif // SHORTCUT_VALUE_HPP
