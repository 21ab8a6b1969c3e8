/**
 * @file Path.hpp
 * @brief Path utilities for addressing nodes inside a document
 *
 * A Path is a sequence of segments. A segment addresses an object
 * property by name, or an array element when it is a canonical
 * non-negative decimal index ("0", "17", but not "007").
 *
 * Text form: dot-separated segments with optional bracket indices,
 * e.g. "items.0.name" or "items[0].name".
 */

#ifndef JTRANSFORM_PATH_HPP
#define JTRANSFORM_PATH_HPP

#include "jtransform/Value.hpp"
#include "jtransform/Errors.hpp"
#include <string>
#include <vector>

namespace jtransform {

using Path = std::vector<std::string>;

/**
 * @brief Split a textual path into segments
 *
 * Examples:
 * - "database.host" → ["database", "host"]
 * - "items[2].name" → ["items", "2", "name"]
 * - "" → []
 */
Path split_path(const std::string& path);

/**
 * @brief Join path segments with dots
 *
 * Examples:
 * - ["a", "b", "c"] → "a.b.c"
 * - [] → ""
 */
std::string join_path(const Path& segments);

/**
 * @brief Check if segment is a canonical array index
 * @return true if segment is all digits with no leading zero (except "0")
 */
bool is_array_index(const std::string& segment);

/**
 * @brief Extend a path by one segment
 */
Path child_path(const Path& parent, const std::string& segment);

/**
 * @brief Look up a node, returning nullptr if any segment is missing
 *
 * Traversal into a scalar also yields nullptr.
 */
const Value* find_by_path(const Value& data, const Path& path);

/**
 * @brief Get a node by path (strict)
 *
 * @throws PathResolutionError if a segment does not exist
 * @throws ShapeMismatchError if traversal hits a scalar before the last segment
 */
const Value& get_by_path(const Value& data, const Path& path);

/**
 * @brief Mutable form of get_by_path()
 */
Value& get_by_path(Value& data, const Path& path);

/**
 * @brief Check if a path fully resolves
 */
bool contains_path(const Value& data, const Path& path);

/**
 * @brief Set a node by path
 *
 * The final segment may name a new object key, an existing array
 * element, or the position one past the end of an array (append).
 *
 * @param create_missing If true, missing intermediate segments are
 *                       created as objects and scalar intermediates are
 *                       overwritten; if false they raise errors.
 * @throws PathResolutionError if create_missing=false and an intermediate
 *         segment is missing, or an array index is out of range
 * @throws ShapeMismatchError if create_missing=false and an intermediate is
 *         a scalar
 *
 * Example:
 * ```cpp
 * Value doc = Value::object();
 * set_by_path(doc, {"db", "host"}, "localhost");
 * // Result: {"db": {"host": "localhost"}}
 * ```
 */
void set_by_path(Value& data, const Path& path, Value value,
                 bool create_missing = true);

/**
 * @brief Remove the node at a path
 *
 * Object keys are erased; array elements are erased by index and the
 * following elements shift down.
 *
 * @throws PathResolutionError if the path does not resolve or is empty
 * @throws ShapeMismatchError if the parent is not a container
 */
void remove_by_path(Value& data, const Path& path);

} // namespace jtransform

#endif // JTRANSFORM_PATH_HPP
