/**
 * @file Collector.cpp
 * @brief Transformation document walk
 */

#include "jtransform/Collector.hpp"

namespace jtransform {

namespace {

Value walk(const Value& node, const Path& path, const CommandFactory& factory,
           std::vector<std::unique_ptr<Command>>& commands) {
    if (node.is_object()) {
        Value cleaned = Value::object();
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto command = factory.create(it.key(), it.value(), path);
            if (command) {
                // The value is the command's argument, not more document
                const auto& name = command->target_path().back();
                if (!cleaned.contains(name)) {
                    cleaned[name] = nullptr;
                }
                commands.push_back(std::move(command));
            } else {
                cleaned[it.key()] = walk(it.value(), child_path(path, it.key()),
                                         factory, commands);
            }
        }
        return cleaned;
    }

    if (node.is_array()) {
        Value cleaned = Value::array();
        for (size_t i = 0; i < node.size(); ++i) {
            cleaned.push_back(walk(node[i], child_path(path, std::to_string(i)),
                                   factory, commands));
        }
        return cleaned;
    }

    return node;
}

} // anonymous namespace

CollectedCommands collect_commands(const Value& transformation, const CommandFactory& factory) {
    CollectedCommands out;
    out.data = walk(transformation, {}, factory, out.commands);
    return out;
}

} // namespace jtransform
