/**
 * @file BuiltinCommands.cpp
 * @brief Built-in command implementations
 */

#include "jtransform/BuiltinCommands.hpp"
#include "jtransform/Errors.hpp"
#include "jtransform/Merge.hpp"
#include "jtransform/Registry.hpp"
#include "jtransform/Transformer.hpp"
#include <string>
#include <vector>

namespace jtransform {

void CopyCommand::apply_to(Value& target, InvocationContext& ctx) const {
    if (!arguments().is_string()) {
        throw ShapeMismatchError(join_path(target_path()), "source path string",
                                 type_name(arguments()));
    }

    const auto& source_path = arguments().get_ref<const std::string&>();
    const Value* node = find_by_path(ctx.source(), split_path(source_path));
    if (node == nullptr) {
        ctx.report(target_path(), "Copy source not found: '" + source_path + "'");
        return;
    }

    set_by_path(target, target_path(), *node);
}

void ForEachCommand::apply_to(Value& target, InvocationContext& ctx) const {
    if (ctx.depth() >= ctx.options().max_depth) {
        ctx.report(target_path(), "Nesting depth limit of " +
                   std::to_string(ctx.options().max_depth) + " exceeded");
        return;
    }

    if (!arguments().is_object()) {
        throw ShapeMismatchError(join_path(target_path()), "transformation object",
                                 type_name(arguments()));
    }

    Value& node = get_by_path(target, target_path());
    if (!is_container(node)) {
        throw ShapeMismatchError(join_path(target_path()), "array or object", type_name(node));
    }

    std::vector<std::string> keys;
    if (node.is_array()) {
        for (size_t i = 0; i < node.size(); ++i) keys.push_back(std::to_string(i));
    } else {
        for (auto it = node.begin(); it != node.end(); ++it) keys.push_back(it.key());
    }

    for (size_t i = 0; i < keys.size(); ++i) {
        Value& child = node.is_array() ? node[i] : node[keys[i]];
        const Value child_source = child;

        InvocationContext nested(child_source, ctx.state(), ctx.options(), ctx.depth() + 1);
        child = apply_transformation(child_source, arguments(), nested);

        const std::string prefix = join_path(child_path(target_path(), keys[i]));
        for (auto& error : nested.take_errors()) {
            ctx.report(error.path.empty() ? prefix : prefix + "." + error.path,
                       std::move(error.message));
        }
    }
}

void RemoveCommand::apply_to(Value& target, InvocationContext&) const {
    remove_by_path(target, target_path());
}

void SetNullCommand::apply_to(Value& target, InvocationContext&) const {
    Value& node = get_by_path(target, target_path());
    if (is_container(node)) {
        throw ShapeMismatchError(join_path(target_path()), "scalar", type_name(node));
    }
    node = nullptr;
}

void UnionCommand::apply_to(Value& target, InvocationContext&) const {
    Value& node = get_by_path(target, target_path());
    const Value& operand = arguments();

    if (node.is_null()) {
        node = operand;
        return;
    }

    const bool arrays = node.is_array() && operand.is_array();
    const bool objects = node.is_object() && operand.is_object();
    if (!arrays && !objects) {
        throw ShapeMismatchError(join_path(target_path()), type_name(node),
                                 type_name(operand));
    }

    merge_into(node, operand, MergeOptions{ArrayMergeHandling::Union, NullValueHandling::Merge});
}

void install_builtin_commands(CommandRegistry& registry) {
    registry.register_builtin("copy", make_constructor<CopyCommand>());
    registry.register_builtin("foreach", make_constructor<ForEachCommand>());
    registry.register_builtin("remove", make_constructor<RemoveCommand>());
    registry.register_builtin("setnull", make_constructor<SetNullCommand>());
    registry.register_builtin("union", make_constructor<UnionCommand>());
}

} // namespace jtransform
