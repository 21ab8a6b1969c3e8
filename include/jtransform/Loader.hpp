/**
 * @file Loader.hpp
 * @brief Reading source and transformation documents
 *
 * - JSON text and files (using nlohmann::json)
 * - TOML files (using toml++)
 *
 * TOML has no null and toml++ tables are not kept in document order, so
 * transformation documents whose command order matters should be JSON.
 */

#ifndef JTRANSFORM_LOADER_HPP
#define JTRANSFORM_LOADER_HPP

#include "jtransform/Value.hpp"
#include <string>

namespace jtransform {

/**
 * @brief Parse JSON text
 * @param text JSON document text
 * @param source_name Name used in error messages
 * @throws ParseError if the text is not valid JSON
 */
Value parse_document(const std::string& text, const std::string& source_name = "<input>");

/**
 * @brief Load a document from a JSON file
 * @throws FileNotFoundError if file doesn't exist
 * @throws ParseError if JSON syntax is invalid
 */
Value load_json_file(const std::string& path);

/**
 * @brief Load a document from a TOML file
 *
 * Dates and times become strings.
 *
 * @throws FileNotFoundError if file doesn't exist
 * @throws ParseError if TOML syntax is invalid
 */
Value load_toml_file(const std::string& path);

/**
 * @brief Load a document, choosing the format by extension
 *
 * ".toml" is read as TOML, everything else as JSON.
 *
 * @throws FileNotFoundError if file doesn't exist
 * @throws ParseError if the file has syntax errors
 */
Value load_document_file(const std::string& path);

/**
 * @brief Get file extension (lowercase), including the dot
 */
std::string get_file_extension(const std::string& path);

} // namespace jtransform

#endif // JTRANSFORM_LOADER_HPP
