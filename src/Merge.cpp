/**
 * @file Merge.cpp
 * @brief Implementation of structural merge
 */

#include "jtransform/Merge.hpp"
#include "jtransform/Path.hpp"
#include <algorithm>

namespace jtransform {

namespace {

bool is_index_patch(const Value& patch) {
    if (!patch.is_object() || patch.empty()) return false;
    for (auto it = patch.begin(); it != patch.end(); ++it) {
        if (!is_array_index(it.key())) return false;
    }
    return true;
}

void merge_value(Value& existing, const Value& incoming, const MergeOptions& options);

void merge_array(Value& target, const Value& patch, const MergeOptions& options) {
    switch (options.arrays) {
        case ArrayMergeHandling::Replace:
            target = patch;
            break;

        case ArrayMergeHandling::Concat:
            for (const auto& item : patch) {
                target.push_back(item);
            }
            break;

        case ArrayMergeHandling::Union:
            for (const auto& item : patch) {
                if (std::find(target.begin(), target.end(), item) == target.end()) {
                    target.push_back(item);
                }
            }
            break;

        case ArrayMergeHandling::Merge:
            for (size_t i = 0; i < patch.size(); ++i) {
                if (i < target.size()) {
                    merge_value(target[i], patch[i], options);
                } else {
                    target.push_back(patch[i]);
                }
            }
            break;
    }
}

void merge_indexed(Value& target, const Value& patch, const MergeOptions& options) {
    for (auto it = patch.begin(); it != patch.end(); ++it) {
        // Longer keys cannot address an element of any real array
        if (it.key().size() > 18) continue;
        size_t idx = static_cast<size_t>(std::stoull(it.key()));
        if (idx < target.size()) {
            merge_value(target[idx], it.value(), options);
        }
    }
}

void merge_value(Value& existing, const Value& incoming, const MergeOptions& options) {
    if (existing.is_object() && incoming.is_object()) {
        for (auto it = incoming.begin(); it != incoming.end(); ++it) {
            auto found = existing.find(it.key());
            if (found == existing.end()) {
                // Absent key: added even when null
                existing[it.key()] = it.value();
            } else {
                merge_value(*found, it.value(), options);
            }
        }
        return;
    }

    if (existing.is_array() && incoming.is_array()) {
        merge_array(existing, incoming, options);
        return;
    }

    if (existing.is_array() && is_index_patch(incoming)) {
        merge_indexed(existing, incoming, options);
        return;
    }

    if (incoming.is_null() && options.nulls == NullValueHandling::Ignore) {
        return;
    }

    existing = incoming;
}

} // anonymous namespace

void merge_into(Value& target, const Value& patch, const MergeOptions& options) {
    merge_value(target, patch, options);
}

Value deep_merge(const Value& base, const Value& patch, const MergeOptions& options) {
    Value result = base;
    merge_into(result, patch, options);
    return result;
}

} // namespace jtransform
