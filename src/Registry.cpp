/**
 * @file Registry.cpp
 * @brief Command registry implementation
 */

#include "jtransform/Registry.hpp"
#include "jtransform/BuiltinCommands.hpp"
#include "jtransform/Errors.hpp"
#include <algorithm>

namespace jtransform {

std::string format_builtin_code(const std::string& code) {
    return std::string(1, BUILTIN_PREFIX) + code;
}

std::string format_custom_code(const std::string& code) {
    return std::string(1, CUSTOM_PREFIX) + code;
}

bool is_valid_custom_code(const std::string& code) {
    if (code.empty()) return false;
    return std::all_of(code.begin(), code.end(),
                       [](char c) { return c >= 'a' && c <= 'z'; });
}

CommandRegistry& CommandRegistry::instance() {
    static CommandRegistry inst;
    static std::once_flag builtins_installed;
    std::call_once(builtins_installed, [] { install_builtin_commands(inst); });
    return inst;
}

void CommandRegistry::register_command(const std::string& code, CommandConstructor ctor) {
    if (!is_valid_custom_code(code)) {
        throw InvalidRegistrationCode(code);
    }
    insert(format_custom_code(code), std::move(ctor));
}

void CommandRegistry::register_command(const std::string& code, CommandFunction fn) {
    if (!is_valid_custom_code(code)) {
        throw InvalidRegistrationCode(code);
    }
    insert(format_custom_code(code), [fn = std::move(fn)](const CreateContext& create) {
        return std::unique_ptr<Command>(std::make_unique<FunctionCommand>(create, fn));
    });
}

void CommandRegistry::register_builtin(const std::string& code, CommandConstructor ctor) {
    insert(format_builtin_code(code), std::move(ctor));
}

CommandConstructor CommandRegistry::lookup(const std::string& formatted_code) const {
    std::shared_lock locker(mutex_);
    const auto it = registry_.find(formatted_code);
    if (it == registry_.end()) {
        return nullptr;
    }
    return it->second;
}

bool CommandRegistry::contains(const std::string& formatted_code) const {
    std::shared_lock locker(mutex_);
    return registry_.find(formatted_code) != registry_.end();
}

void CommandRegistry::insert(std::string formatted_code, CommandConstructor ctor) {
    std::unique_lock locker(mutex_);
    registry_[std::move(formatted_code)] = std::move(ctor);
}

} // namespace jtransform
