/**
 * @file Context.hpp
 * @brief Per-call state shared by all commands of one transformation
 */

#ifndef JTRANSFORM_CONTEXT_HPP
#define JTRANSFORM_CONTEXT_HPP

#include "jtransform/Value.hpp"
#include "jtransform/Merge.hpp"
#include "jtransform/Path.hpp"
#include "jtransform/Result.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace jtransform {

/**
 * @brief Knobs for a transformation call
 */
struct TransformOptions {
    /// Policy for merging the transformation document into the source
    MergeOptions merge{ArrayMergeHandling::Merge, NullValueHandling::Ignore};

    /// Maximum nesting of foreach commands
    std::size_t max_depth = 32;
};

/**
 * @brief Invocation context handed to every Command::apply_to()
 *
 * Holds references only; the transformer that creates a context owns the
 * source document and the state for the whole call.
 */
class InvocationContext {
public:
    /**
     * @param source Pre-transform document; commands read from it, never
     *               from the in-progress result
     * @param state Caller-supplied per-call state
     * @param options Options of the running transformation
     * @param depth Nesting level (0 for a top-level call)
     */
    InvocationContext(const Value& source, Value& state,
                      const TransformOptions& options, std::size_t depth = 0)
        : source_(source), state_(state), options_(options), depth_(depth) {}

    InvocationContext(const InvocationContext&) = delete;
    InvocationContext& operator=(const InvocationContext&) = delete;

    const Value& source() const noexcept { return source_; }
    Value& state() noexcept { return state_; }
    const Value& state() const noexcept { return state_; }
    const TransformOptions& options() const noexcept { return options_; }
    std::size_t depth() const noexcept { return depth_; }

    /**
     * @brief Record a failure without aborting the transformation
     */
    void report(const Path& path, std::string message) {
        errors_.push_back({join_path(path), std::move(message)});
    }

    void report(std::string path, std::string message) {
        errors_.push_back({std::move(path), std::move(message)});
    }

    const std::vector<PathError>& errors() const noexcept { return errors_; }

    std::vector<PathError> take_errors() { return std::move(errors_); }

private:
    const Value& source_;
    Value& state_;
    const TransformOptions& options_;
    std::size_t depth_;
    std::vector<PathError> errors_;
};

} // namespace jtransform

#endif // JTRANSFORM_CONTEXT_HPP
