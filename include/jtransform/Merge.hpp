/**
 * @file Merge.hpp
 * @brief Structural merge of documents
 *
 * Merging rules:
 * - Both objects: keys are merged one by one. Keys absent from the target
 *   are added (including null values).
 * - Both arrays: combined according to ArrayMergeHandling.
 * - Array target, object patch whose keys are all array indices: the
 *   addressed elements are merged in place. Indices past the end are
 *   ignored.
 * - Anything else: the patch value replaces the target.
 *
 * A null patch value never replaces an existing value when null handling
 * is Ignore.
 */

#ifndef JTRANSFORM_MERGE_HPP
#define JTRANSFORM_MERGE_HPP

#include "jtransform/Value.hpp"

namespace jtransform {

/**
 * @brief How two arrays are combined
 */
enum class ArrayMergeHandling {
    Merge,   ///< Element-wise by index; extra patch elements are appended
    Concat,  ///< Patch elements appended
    Union,   ///< Patch elements appended unless structurally present
    Replace  ///< Patch array replaces target array
};

/**
 * @brief How null patch values are treated
 */
enum class NullValueHandling {
    Ignore,  ///< Null never overwrites an existing value
    Merge    ///< Null overwrites like any other value
};

struct MergeOptions {
    ArrayMergeHandling arrays = ArrayMergeHandling::Merge;
    NullValueHandling nulls = NullValueHandling::Ignore;
};

/**
 * @brief Merge patch into target in place
 *
 * Example:
 * ```cpp
 * Value target = {{"a", 1}, {"b", {1, 2, 3}}};
 * merge_into(target, {{"a", nullptr}, {"b", {9}}, {"c", true}});
 * // Result: {"a": 1, "b": [9, 2, 3], "c": true}
 * ```
 */
void merge_into(Value& target, const Value& patch, const MergeOptions& options = {});

/**
 * @brief Merge patch into a copy of base
 * @return Merged result; base is untouched
 */
Value deep_merge(const Value& base, const Value& patch, const MergeOptions& options = {});

} // namespace jtransform

#endif // JTRANSFORM_MERGE_HPP
