/**
 * @file Loader.hpp
 * @brief File input and output
 *
 * Reads documents from:
 * - JSON files (using nlohmann::json, key order preserved)
 * - TOML files (using toml++)
 * - TOON files (using toon::parse)
 */

#ifndef TOON_LOADER_HPP
#define TOON_LOADER_HPP

#include "toon/Value.hpp"

#include <string>
#include <string_view>

namespace toon {

// ============================================================================
// Raw file access
// ============================================================================

/**
 * @brief Read an entire file into a string
 * @throws FileNotFoundError if the file doesn't exist or can't be opened
 */
std::string read_text_file(const std::string& path);

/**
 * @brief Write (truncate) a file with the given content
 * @throws IoError if the file can't be opened or written
 */
void write_text_file(const std::string& path, std::string_view content);

/**
 * @brief Get file extension (lowercase).
 *
 * @param path File path
 * @return Extension including the dot (e.g., ".json"), or empty if none
 */
std::string get_file_extension(const std::string& path);

// ============================================================================
// Document loading
// ============================================================================

/**
 * @brief Load a JSON document
 *
 * @param path Path to the JSON file
 * @return Document as a Value; object field order follows the file
 * @throws FileNotFoundError if file doesn't exist
 * @throws FileParseError if JSON syntax is invalid
 */
Value load_json_file(const std::string& path);

/**
 * @brief Load a TOML document
 *
 * Tables map to objects. Offset date-times become Date; local dates,
 * times and date-times become their TOML text.
 *
 * @param path Path to the TOML file
 * @return Document as a Value
 * @throws FileNotFoundError if file doesn't exist
 * @throws FileParseError if TOML syntax is invalid
 */
Value load_toml_file(const std::string& path);

/**
 * @brief Load a TOON document
 *
 * @throws FileNotFoundError if file doesn't exist
 * @throws PositionedError subclasses from the parser
 */
Value load_toon_file(const std::string& path);

/**
 * @brief Load a document, picking the format by extension.
 *
 * `.json`, `.toml` and `.toon` are recognized (case-insensitive).
 *
 * @throws FileNotFoundError if file doesn't exist
 * @throws ToonError if the extension is not recognized
 */
Value load_file(const std::string& path);

} // namespace toon

#endif // TOON_LOADER_HPP
