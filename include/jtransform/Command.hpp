/**
 * @file Command.hpp
 * @brief Deferred transformation command interface
 */

#ifndef JTRANSFORM_COMMAND_HPP
#define JTRANSFORM_COMMAND_HPP

#include "jtransform/Value.hpp"
#include "jtransform/Path.hpp"
#include "jtransform/Context.hpp"
#include <functional>
#include <memory>
#include <string>

namespace jtransform {

/**
 * @brief Everything a command is bound to when it is created
 */
struct CreateContext {
    /// Registry code including its prefix, e.g. "$remove" or "@stamp"
    std::string code;

    /// Node the command acts on, derived from where its key was found
    Path target_path;

    /// The command key's value, taken literally
    Value arguments;
};

/**
 * @brief A unit of deferred work bound to one target path
 *
 * Commands are created while the transformation document is walked and
 * applied after the merge step, in reverse discovery order. They may
 * report errors to the context, or throw TransformError which the
 * transformer records at target_path().
 */
class Command {
public:
    explicit Command(CreateContext create) : create_(std::move(create)) {}
    virtual ~Command() = default;

    /**
     * @brief Apply the edit to the in-progress result
     * @param target Whole result document (not the node at target_path())
     * @param ctx Context shared by all commands of this call
     */
    virtual void apply_to(Value& target, InvocationContext& ctx) const = 0;

    const std::string& code() const noexcept { return create_.code; }
    const Path& target_path() const noexcept { return create_.target_path; }
    const Value& arguments() const noexcept { return create_.arguments; }

protected:
    CreateContext create_;
};

using CommandConstructor = std::function<std::unique_ptr<Command>(const CreateContext&)>;

/**
 * @brief Plain-function form of a command body
 */
using CommandFunction = std::function<void(Value& target, const CreateContext& create,
                                           InvocationContext& ctx)>;

/**
 * @brief Command that forwards to a CommandFunction
 */
class FunctionCommand : public Command {
public:
    FunctionCommand(CreateContext create, CommandFunction fn)
        : Command(std::move(create)), fn_(std::move(fn)) {}

    void apply_to(Value& target, InvocationContext& ctx) const override {
        fn_(target, create_, ctx);
    }

private:
    CommandFunction fn_;
};

/**
 * @brief Constructor for any Command subclass taking a CreateContext
 *
 * ```cpp
 * registry.register_command("stamp", make_constructor<StampCommand>());
 * ```
 */
template <typename T>
CommandConstructor make_constructor() {
    return [](const CreateContext& create) -> std::unique_ptr<Command> {
        return std::make_unique<T>(create);
    };
}

} // namespace jtransform

#endif // JTRANSFORM_COMMAND_HPP
