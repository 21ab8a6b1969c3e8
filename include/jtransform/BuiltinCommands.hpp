/**
 * @file BuiltinCommands.hpp
 * @brief Commands shipped under the "$" prefix
 *
 * | Key            | Argument                 | Effect                              |
 * |----------------|--------------------------|-------------------------------------|
 * | $copy:name     | path into the source     | copies the source node to name      |
 * | $foreach:name  | transformation document  | transforms every child of name      |
 * | $remove:name   | ignored                  | deletes name                        |
 * | $setnull:name  | ignored                  | sets name to null                   |
 * | $union:name    | value                    | unions the value into name          |
 */

#ifndef JTRANSFORM_BUILTINCOMMANDS_HPP
#define JTRANSFORM_BUILTINCOMMANDS_HPP

#include "jtransform/Command.hpp"

namespace jtransform {

class CommandRegistry;

/**
 * @brief Copy a node of the source document to the target path
 *
 * The argument is a textual path (see split_path()) resolved against
 * InvocationContext::source(), so earlier edits to the result are not
 * visible to it.
 */
class CopyCommand : public Command {
public:
    using Command::Command;
    void apply_to(Value& target, InvocationContext& ctx) const override;
};

/**
 * @brief Apply a nested transformation to every child of the target
 *
 * Each child is transformed as a source document of its own, so paths
 * inside the nested document (including $copy arguments) are relative to
 * the child. Child errors are reported with the child's path prepended.
 */
class ForEachCommand : public Command {
public:
    using Command::Command;
    void apply_to(Value& target, InvocationContext& ctx) const override;
};

/**
 * @brief Delete the node at the target path
 *
 * Array elements are erased by index; later elements shift down.
 */
class RemoveCommand : public Command {
public:
    using Command::Command;
    void apply_to(Value& target, InvocationContext& ctx) const override;
};

/**
 * @brief Replace the node at the target path with null
 *
 * Needed because the merge step never lets null overwrite a value.
 */
class SetNullCommand : public Command {
public:
    using Command::Command;
    void apply_to(Value& target, InvocationContext& ctx) const override;
};

/**
 * @brief Combine the node at the target path with the argument
 *
 * - array ∪ array: argument elements not already present are appended
 * - object ∪ object: deep merge, argument wins, nested arrays unioned
 * - null target: becomes the argument
 * Any other pairing is a ShapeMismatchError.
 */
class UnionCommand : public Command {
public:
    using Command::Command;
    void apply_to(Value& target, InvocationContext& ctx) const override;
};

/**
 * @brief Register the commands above as "$copy", "$foreach", "$remove",
 *        "$setnull" and "$union"
 */
void install_builtin_commands(CommandRegistry& registry);

} // namespace jtransform

#endif // JTRANSFORM_BUILTINCOMMANDS_HPP
