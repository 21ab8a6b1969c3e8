/**
 * @file Transformer.cpp
 * @brief Transformation pipeline implementation
 */

#include "jtransform/Transformer.hpp"
#include "jtransform/Collector.hpp"
#include "jtransform/Errors.hpp"
#include "jtransform/Loader.hpp"
#include "jtransform/Merge.hpp"
#include "jtransform/Registry.hpp"
#include <exception>

namespace jtransform {

Value apply_transformation(const Value& source, const Value& transformation,
                           InvocationContext& ctx) {
    auto collected = collect_commands(transformation);

    Value result = source;
    merge_into(result, collected.data, ctx.options().merge);

    auto& stack = collected.commands;
    while (!stack.empty()) {
        std::unique_ptr<Command> command = std::move(stack.back());
        stack.pop_back();

        try {
            command->apply_to(result, ctx);
        } catch (const TransformError& e) {
            ctx.report(command->target_path(), e.what());
        } catch (const nlohmann::json::exception& e) {
            ctx.report(command->target_path(), e.what());
        } catch (const std::exception& e) {
            // User commands may fail with anything derived from std::exception
            ctx.report(command->target_path(), e.what());
        }
    }

    return result;
}

TransformationResult transform(const Value& source, const Value& transformation) {
    return transform_with_state(source, transformation, Value::object());
}

TransformationResult transform(const Value& source, const Value& transformation,
                               const TransformOptions& options) {
    return transform_with_state(source, transformation, Value::object(), options);
}

TransformationResult transform_with_state(const Value& source, const Value& transformation,
                                          Value state, const TransformOptions& options) {
    InvocationContext ctx(source, state, options);

    TransformationResult result;
    result.value = apply_transformation(source, transformation, ctx);
    result.errors = ctx.take_errors();
    return result;
}

TransformationResult transform_json(const std::string& source_json,
                                    const std::string& transformation_json,
                                    const TransformOptions& options) {
    Value source = parse_document(source_json, "<source>");
    Value transformation = parse_document(transformation_json, "<transformation>");
    return transform(source, transformation, options);
}

void register_transformation(const std::string& code, CommandConstructor ctor) {
    CommandRegistry::instance().register_command(code, std::move(ctor));
}

void register_transformation(const std::string& code, CommandFunction fn) {
    CommandRegistry::instance().register_command(code, std::move(fn));
}

} // namespace jtransform
