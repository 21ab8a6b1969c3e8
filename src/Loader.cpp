/**
 * @file Loader.cpp
 * @brief Document loading implementation
 */

#include "jtransform/Loader.hpp"
#include "jtransform/Errors.hpp"

#include <toml++/toml.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <type_traits>

namespace fs = std::filesystem;

namespace jtransform {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

/**
 * @brief Read entire file into string.
 */
std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

template <typename T>
Value streamed_string(const T& v) {
    std::ostringstream ss;
    ss << v;
    return Value(ss.str());
}

/**
 * @brief Convert a toml++ node to a Value.
 *
 * Dates and times have no JSON counterpart and become their TOML text.
 */
Value toml_to_value(const toml::node& node) {
    return node.visit([](const auto& n) -> Value {
        using node_type = std::decay_t<decltype(n)>;

        if constexpr (toml::is_table<node_type>) {
            Value obj = Value::object();
            for (const auto& [key, child] : n) {
                obj[std::string(key.str())] = toml_to_value(child);
            }
            return obj;
        } else if constexpr (toml::is_array<node_type>) {
            Value arr = Value::array();
            for (const auto& child : n) {
                arr.push_back(toml_to_value(child));
            }
            return arr;
        } else if constexpr (toml::is_date<node_type> || toml::is_time<node_type> ||
                             toml::is_date_time<node_type>) {
            return streamed_string(n.get());
        } else {
            return Value(n.get());
        }
    });
}

} // anonymous namespace

Value parse_document(const std::string& text, const std::string& source_name) {
    try {
        return Value::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw ParseError(source_name, e.what());
    }
}

Value load_json_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }
    return parse_document(read_file(path), path);
}

Value load_toml_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    toml::table table;
    try {
        table = toml::parse_file(path);
    } catch (const toml::parse_error& e) {
        std::ostringstream details;
        details << e.description() << " (line " << e.source().begin.line
                << ", column " << e.source().begin.column << ")";
        throw ParseError(path, details.str());
    }

    return toml_to_value(table);
}

std::string get_file_extension(const std::string& path) {
    fs::path p(path);
    return to_lower(p.extension().string());
}

Value load_document_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    if (get_file_extension(path) == ".toml") {
        return load_toml_file(path);
    }
    return load_json_file(path);
}

} // namespace jtransform
