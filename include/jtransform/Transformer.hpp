/**
 * @file Transformer.hpp
 * @brief Applying a transformation document to a source document
 *
 * A transformation document is shaped like the data it edits. Ordinary
 * properties are merged into a copy of the source; properties whose key
 * names a registered command are collected and applied after the merge,
 * last-discovered first.
 *
 * Example:
 * ```cpp
 * auto result = jtransform::transform_json(R"({"a":1,"b":[1,2,3]})",
 *                                          R"({"$remove:b":null})");
 * // result.value == {"a":1}, result.errors is empty
 * ```
 */

#ifndef JTRANSFORM_TRANSFORMER_HPP
#define JTRANSFORM_TRANSFORMER_HPP

#include "jtransform/Value.hpp"
#include "jtransform/Context.hpp"
#include "jtransform/Command.hpp"
#include "jtransform/Result.hpp"
#include <string>

namespace jtransform {

/**
 * @brief Transform source with transformation
 *
 * Neither input is modified. Command failures are returned in the
 * result's error list, never thrown.
 */
TransformationResult transform(const Value& source, const Value& transformation);

TransformationResult transform(const Value& source, const Value& transformation,
                               const TransformOptions& options);

/**
 * @brief Transform with caller-supplied state visible to every command
 *        through InvocationContext::state()
 *
 * The state is owned by this call and discarded afterwards. Commands may
 * modify it to pass data to commands applied after them.
 */
TransformationResult transform_with_state(const Value& source, const Value& transformation,
                                          Value state,
                                          const TransformOptions& options = {});

/**
 * @brief Run the walk, merge and apply phases against an existing context
 *
 * Used by commands that transform sub-documents, such as foreach. The
 * context's source should be `source`. Errors are recorded into ctx.
 *
 * @return The transformed document
 */
Value apply_transformation(const Value& source, const Value& transformation,
                           InvocationContext& ctx);

/**
 * @brief Parse both documents from JSON text, then transform
 * @throws ParseError if either text is malformed; no transformation
 *         work is done in that case
 */
TransformationResult transform_json(const std::string& source_json,
                                    const std::string& transformation_json,
                                    const TransformOptions& options = {});

/**
 * @brief Register a user command in the process-wide registry
 *
 * Documents then invoke it with keys of the form "@code:name".
 *
 * @throws InvalidRegistrationCode if code contains anything but a-z
 */
void register_transformation(const std::string& code, CommandConstructor ctor);

void register_transformation(const std::string& code, CommandFunction fn);

} // namespace jtransform

#endif // JTRANSFORM_TRANSFORMER_HPP
