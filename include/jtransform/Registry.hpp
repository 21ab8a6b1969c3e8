/**
 * @file Registry.hpp
 * @brief Process-wide registry of command kinds
 *
 * Command keys in a transformation document look like
 * `<prefix><code>:<name>`. Built-in commands use the "$" prefix and
 * user-registered ones the "@" prefix, so a user may register a code
 * that coincides with a built-in name without colliding with it.
 */

#ifndef JTRANSFORM_REGISTRY_HPP
#define JTRANSFORM_REGISTRY_HPP

#include "jtransform/Command.hpp"
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace jtransform {

inline constexpr char BUILTIN_PREFIX = '$';
inline constexpr char CUSTOM_PREFIX = '@';
inline constexpr char CODE_SEPARATOR = ':';

/// "remove" → "$remove"
std::string format_builtin_code(const std::string& code);

/// "stamp" → "@stamp"
std::string format_custom_code(const std::string& code);

/**
 * @brief Check a user code: non-empty, letters a-z only
 */
bool is_valid_custom_code(const std::string& code);

/**
 * @brief Thread-safe map from formatted code to command constructor
 *
 * Lookups take a shared lock and may run concurrently with each other
 * and with transformations; registrations take an exclusive lock. A
 * registration racing with a transformation already in flight may or
 * may not be seen by it.
 */
class CommandRegistry {
public:
    /**
     * @brief The process-wide registry
     *
     * The built-in commands are installed once, on first call.
     */
    static CommandRegistry& instance();

    /**
     * @brief Register a user command under the custom prefix
     * @throws InvalidRegistrationCode if code is not lowercase letters
     */
    void register_command(const std::string& code, CommandConstructor ctor);

    /**
     * @brief Register a user command given as a plain function
     * @throws InvalidRegistrationCode if code is not lowercase letters
     */
    void register_command(const std::string& code, CommandFunction fn);

    /**
     * @brief Register a command under the built-in prefix
     */
    void register_builtin(const std::string& code, CommandConstructor ctor);

    /**
     * @brief Find the constructor for a formatted code
     * @return The constructor, or an empty function if not registered
     */
    CommandConstructor lookup(const std::string& formatted_code) const;

    bool contains(const std::string& formatted_code) const;

    CommandRegistry() = default;
    CommandRegistry(const CommandRegistry&) = delete;
    CommandRegistry& operator=(const CommandRegistry&) = delete;

private:
    void insert(std::string formatted_code, CommandConstructor ctor);

    std::unordered_map<std::string, CommandConstructor> registry_;
    mutable std::shared_mutex mutex_;
};

} // namespace jtransform

#endif // JTRANSFORM_REGISTRY_HPP
