/**
 * @file Result.hpp
 * @brief Outcome of a transformation
 */

#ifndef JTRANSFORM_RESULT_HPP
#define JTRANSFORM_RESULT_HPP

#include "jtransform/Value.hpp"
#include <string>
#include <vector>

namespace jtransform {

/**
 * @brief One recorded command failure
 *
 * `path` is the dot-path of the node the failing command was bound to.
 */
struct PathError {
    std::string path;
    std::string message;

    bool operator==(const PathError& other) const {
        return path == other.path && message == other.message;
    }
};

/**
 * @brief Transformed document plus every error recorded on the way
 *
 * The value is always a best-effort result: a failing command leaves the
 * document as the other commands made it.
 */
struct TransformationResult {
    Value value;
    std::vector<PathError> errors;

    bool ok() const noexcept { return errors.empty(); }
};

} // namespace jtransform

#endif // JTRANSFORM_RESULT_HPP
