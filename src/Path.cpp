/**
 * @file Path.cpp
 * @brief Implementation of path utilities
 */

#include "jtransform/Path.hpp"
#include <algorithm>
#include <cctype>
#include <limits>
#include <sstream>

namespace jtransform {

Path split_path(const std::string& path) {
    Path segments;
    std::string current;

    auto flush = [&]() {
        if (!current.empty()) {
            segments.push_back(current);
            current.clear();
        }
    };

    for (char c : path) {
        if (c == '.' || c == '[' || c == ']') {
            flush();
        } else {
            current += c;
        }
    }
    flush();

    return segments;
}

std::string join_path(const Path& segments) {
    if (segments.empty()) {
        return "";
    }

    std::ostringstream oss;
    for (size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) oss << '.';
        oss << segments[i];
    }
    return oss.str();
}

bool is_array_index(const std::string& segment) {
    if (segment.empty()) return false;
    if (segment[0] == '0' && segment.size() > 1) return false;
    return std::all_of(segment.begin(), segment.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

Path child_path(const Path& parent, const std::string& segment) {
    Path out = parent;
    out.push_back(segment);
    return out;
}

namespace {
    /**
     * @brief Parse array index from segment
     * @pre is_array_index(segment) must be true
     */
    size_t parse_array_index(const std::string& segment) {
        // Too long for stoull; no array is that large anyway
        if (segment.size() > 18) return std::numeric_limits<size_t>::max();
        return static_cast<size_t>(std::stoull(segment));
    }

    /**
     * @brief Resolve one segment of a strict traversal
     *
     * Shared by the const and mutable get_by_path overloads.
     */
    template <typename V>
    V* step(V* current, const std::string& seg, const Path& path) {
        if (current->is_object()) {
            auto it = current->find(seg);
            if (it == current->end()) {
                throw PathResolutionError(join_path(path), seg);
            }
            return &(*it);
        }

        if (current->is_array()) {
            if (!is_array_index(seg)) {
                throw PathResolutionError(join_path(path), seg + " (not a valid array index)");
            }
            size_t idx = parse_array_index(seg);
            if (idx >= current->size()) {
                throw PathResolutionError(join_path(path), seg + " (index out of range)");
            }
            return &(*current)[idx];
        }

        throw ShapeMismatchError(join_path(path), "object or array", type_name(*current));
    }
}

const Value* find_by_path(const Value& data, const Path& path) {
    const Value* current = &data;

    for (const auto& seg : path) {
        if (current->is_object()) {
            auto it = current->find(seg);
            if (it == current->end()) return nullptr;
            current = &(*it);
        } else if (current->is_array()) {
            if (!is_array_index(seg)) return nullptr;
            size_t idx = parse_array_index(seg);
            if (idx >= current->size()) return nullptr;
            current = &(*current)[idx];
        } else {
            return nullptr;
        }
    }

    return current;
}

const Value& get_by_path(const Value& data, const Path& path) {
    const Value* current = &data;
    for (const auto& seg : path) {
        current = step(current, seg, path);
    }
    return *current;
}

Value& get_by_path(Value& data, const Path& path) {
    Value* current = &data;
    for (const auto& seg : path) {
        current = step(current, seg, path);
    }
    return *current;
}

bool contains_path(const Value& data, const Path& path) {
    return find_by_path(data, path) != nullptr;
}

void set_by_path(Value& data, const Path& path, Value value, bool create_missing) {
    if (path.empty()) {
        // Empty path: replace root
        data = std::move(value);
        return;
    }

    Value* current = &data;

    for (size_t i = 0; i + 1 < path.size(); ++i) {
        const auto& seg = path[i];

        if (current->is_array() && is_array_index(seg) &&
            parse_array_index(seg) < current->size()) {
            current = &(*current)[parse_array_index(seg)];
            continue;
        }

        // In-range indices were handled above; arrays are never reshaped
        if (current->is_array()) {
            throw PathResolutionError(join_path(path), is_array_index(seg)
                                          ? seg + " (index out of range)"
                                          : seg + " (not a valid array index)");
        }

        if (!current->is_object()) {
            if (!create_missing) {
                throw ShapeMismatchError(join_path(path), "object or array",
                                         type_name(*current));
            }
            // Overwrite non-object with object
            *current = Value::object();
        }

        if (!current->contains(seg)) {
            if (!create_missing) {
                throw PathResolutionError(join_path(path), seg);
            }
            (*current)[seg] = Value::object();
        }

        current = &(*current)[seg];
    }

    const auto& final_seg = path.back();

    if (current->is_array()) {
        if (!is_array_index(final_seg)) {
            throw PathResolutionError(join_path(path), final_seg + " (not a valid array index)");
        }
        size_t idx = parse_array_index(final_seg);
        if (idx < current->size()) {
            (*current)[idx] = std::move(value);
        } else if (idx == current->size()) {
            current->push_back(std::move(value));
        } else {
            throw PathResolutionError(join_path(path), final_seg + " (index out of range)");
        }
        return;
    }

    if (!current->is_object()) {
        if (!create_missing) {
            throw ShapeMismatchError(join_path(path), "object or array",
                                     type_name(*current));
        }
        *current = Value::object();
    }

    (*current)[final_seg] = std::move(value);
}

void remove_by_path(Value& data, const Path& path) {
    if (path.empty()) {
        throw PathResolutionError("", "(root cannot be removed)");
    }

    Path parent_path(path.begin(), path.end() - 1);
    Value& parent = get_by_path(data, parent_path);
    const auto& seg = path.back();

    if (parent.is_object()) {
        if (parent.erase(seg) == 0) {
            throw PathResolutionError(join_path(path), seg);
        }
        return;
    }

    if (parent.is_array()) {
        if (!is_array_index(seg)) {
            throw PathResolutionError(join_path(path), seg + " (not a valid array index)");
        }
        size_t idx = parse_array_index(seg);
        if (idx >= parent.size()) {
            throw PathResolutionError(join_path(path), seg + " (index out of range)");
        }
        parent.erase(idx);
        return;
    }

    throw ShapeMismatchError(join_path(path), "object or array", type_name(parent));
}

} // namespace jtransform
