#pragma once

#include "ragsync/common/result.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace ragsync::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Unescape a JSON-encoded string (handles \n, \r, \t, \uXXXX and pass-through).
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

/// Extract a string field value from a JSON document.
[[nodiscard]] std::string json_get_string(const std::string &json, const std::string &field);

/// Extract a numeric field value (as string) from a JSON document.
[[nodiscard]] std::string json_get_number(const std::string &json, const std::string &field);

/// Extract a nested JSON object field (including braces) from a JSON document.
[[nodiscard]] std::string json_get_object(const std::string &json, const std::string &field);

/// Extract a nested JSON array field (including brackets) from a JSON document.
[[nodiscard]] std::string json_get_array(const std::string &json, const std::string &field);

/// Split a JSON array of objects into individual object strings.
[[nodiscard]] std::vector<std::string> json_split_top_level_objects(const std::string &array_json);

/// Parse a flat JSON array of numbers like [0.1, -2e-3].
[[nodiscard]] Result<std::vector<float>> json_parse_float_array(const std::string &array_json);

/// Parse a flat JSON array of integers like [10, 20, -1].
[[nodiscard]] Result<std::vector<std::int64_t>> json_parse_int_array(const std::string &array_json);

[[nodiscard]] std::string json_int_array(const std::vector<std::int64_t> &values);

} // namespace ragsync::common
