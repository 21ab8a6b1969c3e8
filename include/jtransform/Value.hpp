/**
 * @file Value.hpp
 * @brief Document value type
 *
 * Uses nlohmann::ordered_json as the underlying value model. Object
 * properties keep their document order, which the command collector
 * relies on to discover commands in the order they were written.
 */

#ifndef JTRANSFORM_VALUE_HPP
#define JTRANSFORM_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace jtransform {

/**
 * @brief JSON document type used for sources, transformations and results
 *
 * Alias for nlohmann::ordered_json. Copying a Value is a deep clone.
 */
using Value = nlohmann::ordered_json;

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

/**
 * @brief Check if value is a container (array or object)
 */
inline bool is_container(const Value& val) {
    return val.is_array() || val.is_object();
}

} // namespace jtransform

#endif // JTRANSFORM_VALUE_HPP
