/**
 * @file Factory.cpp
 * @brief Command key parsing and binding
 */

#include "jtransform/Factory.hpp"

namespace jtransform {

std::optional<CommandKey> parse_command_key(const std::string& key) {
    if (key.size() < 4) return std::nullopt;  // shortest form: "$a:b"
    if (key[0] != BUILTIN_PREFIX && key[0] != CUSTOM_PREFIX) return std::nullopt;

    const auto sep = key.find(CODE_SEPARATOR);
    if (sep == std::string::npos || sep < 2 || sep + 1 >= key.size()) {
        return std::nullopt;
    }

    return CommandKey{key.substr(0, sep), key.substr(sep + 1)};
}

std::unique_ptr<Command> CommandFactory::create(const std::string& key, const Value& value,
                                                const Path& parent_path) const {
    auto parsed = parse_command_key(key);
    if (!parsed) return nullptr;

    auto ctor = registry_.lookup(parsed->formatted_code);
    if (!ctor) return nullptr;

    return ctor(CreateContext{parsed->formatted_code,
                              child_path(parent_path, parsed->name),
                              value});
}

} // namespace jtransform
