/**
 * @file Collector.hpp
 * @brief Discovery of commands in a transformation document
 */

#ifndef JTRANSFORM_COLLECTOR_HPP
#define JTRANSFORM_COLLECTOR_HPP

#include "jtransform/Command.hpp"
#include "jtransform/Factory.hpp"
#include <memory>
#include <vector>

namespace jtransform {

/**
 * @brief Output of collect_commands()
 */
struct CollectedCommands {
    /// Commands in discovery order; back() is the top of the stack
    std::vector<std::unique_ptr<Command>> commands;

    /// The transformation document with every command property replaced
    /// by `name: null`, ready to be merged
    Value data;
};

/**
 * @brief Walk a transformation document depth-first, pre-order
 *
 * - Object properties are visited in document order. A property the
 *   factory turns into a command is collected and its value is not
 *   visited. Any other property is visited with the path extended by
 *   its key.
 * - Array elements are visited with the path extended by their index.
 * - Scalars end the walk.
 *
 * Example:
 * ```cpp
 * auto collected = collect_commands(Value::parse(R"({"a": {"$remove:b": 1}, "c": 2})"));
 * // collected.commands: [$remove at a.b]
 * // collected.data:     {"a": {"b": null}, "c": 2}
 * ```
 */
CollectedCommands collect_commands(const Value& transformation,
                                   const CommandFactory& factory = CommandFactory());

} // namespace jtransform

#endif // JTRANSFORM_COLLECTOR_HPP
