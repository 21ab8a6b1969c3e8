/**
 * @file Factory.hpp
 * @brief Classification of document keys as commands or data
 */

#ifndef JTRANSFORM_FACTORY_HPP
#define JTRANSFORM_FACTORY_HPP

#include "jtransform/Command.hpp"
#include "jtransform/Registry.hpp"
#include <memory>
#include <optional>
#include <string>

namespace jtransform {

/**
 * @brief Syntactic parts of a `<prefix><code>:<name>` key
 */
struct CommandKey {
    std::string formatted_code;  ///< prefix + code, e.g. "$copy"
    std::string name;            ///< property the command acts on
};

/**
 * @brief Split a key into prefix+code and name
 *
 * Does not consult the registry.
 *
 * @return The parts, or std::nullopt if the key does not start with a
 *         command prefix, lacks the separator, or has an empty code or
 *         name
 *
 * Examples:
 * - "$remove:b"   → {"$remove", "b"}
 * - "@stamp:a:b"  → {"@stamp", "a:b"}
 * - "plain"       → nullopt
 * - "$remove:"    → nullopt
 */
std::optional<CommandKey> parse_command_key(const std::string& key);

/**
 * @brief Builds bound commands from transformation document properties
 */
class CommandFactory {
public:
    explicit CommandFactory(const CommandRegistry& registry = CommandRegistry::instance())
        : registry_(registry) {}

    /**
     * @brief Create the command a property denotes
     * @param key Property key
     * @param value Property value, used as the command's arguments
     * @param parent_path Path of the object holding the property
     * @return The bound command, or nullptr if the property is plain data
     */
    std::unique_ptr<Command> create(const std::string& key, const Value& value,
                                    const Path& parent_path) const;

private:
    const CommandRegistry& registry_;
};

} // namespace jtransform

#endif // JTRANSFORM_FACTORY_HPP
