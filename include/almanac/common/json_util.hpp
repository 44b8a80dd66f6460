#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace almanac::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Unescape a JSON-encoded string (handles \n, \r, \t, \b, \f, \uXXXX and pass-through).
[[nodiscard]] std::string json_unescape(const std::string &raw);

/// Find the position of a JSON key in a JSON string.
[[nodiscard]] std::size_t json_find_key(const std::string &json, const std::string &key,
                                        std::size_t from = 0);

/// Skip whitespace starting at pos, returning the first non-whitespace position.
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Find the closing quote of a JSON string starting at quote_pos.
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

/// Find matching bracket/brace for nested JSON structures.
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// Strict syntax check of a complete JSON document.
[[nodiscard]] bool json_is_valid(const std::string &json);

/// True when the document is valid JSON and its top-level value is an object.
[[nodiscard]] bool json_is_object(const std::string &json);

/// Extract a string field value from a JSON document.
[[nodiscard]] std::string json_get_string(const std::string &json, const std::string &field);

/// Extract a nested JSON array field (including brackets) from a JSON document.
[[nodiscard]] std::string json_get_array(const std::string &json, const std::string &field);

/// Parse a flat JSON object into a key→value map (top-level only). String values are
/// unescaped; objects, arrays, numbers and literals are kept as raw JSON text.
using JsonFlatMap = std::unordered_map<std::string, std::string>;
[[nodiscard]] JsonFlatMap json_parse_flat(const std::string &json);

/// Like json_parse_flat but keeps only top-level keys whose value is a JSON string.
[[nodiscard]] JsonFlatMap json_parse_flat_strings(const std::string &json);

/// Parse a JSON array of strings like ["a","b"]. Non-string elements are skipped.
[[nodiscard]] std::vector<std::string> json_parse_string_array(const std::string &array_json);

/// Render strings as a JSON array.
[[nodiscard]] std::string json_string_array(const std::vector<std::string> &values);

/// Split a JSON array of objects into individual object strings.
[[nodiscard]] std::vector<std::string> json_split_top_level_objects(const std::string &array_json);

} // namespace almanac::common
