#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>

namespace tasktide::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Quote and escape a string as a JSON string literal.
[[nodiscard]] std::string json_quote(const std::string &value);

/// JSON string literal for engaged optionals, `null` otherwise.
[[nodiscard]] std::string json_quote_or_null(const std::optional<std::string> &value);

/// Unescape a JSON-encoded string (handles \n, \r, \t, \uXXXX for ASCII and pass-through).
[[nodiscard]] std::string json_unescape(const std::string &raw);

/// Skip whitespace starting at pos, returning the first non-whitespace position.
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Find the closing quote of a JSON string starting at quote_pos.
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

/// Find matching bracket/brace for nested JSON structures.
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// True when the text is a single JSON object (outer braces balanced).
[[nodiscard]] bool json_is_object(const std::string &json);

/// Parse a flat JSON object into a key→value map (top-level only). String values are
/// unescaped; nested objects/arrays, numbers and literals are kept as raw text.
using JsonFlatMap = std::unordered_map<std::string, std::string>;
[[nodiscard]] JsonFlatMap json_parse_flat(const std::string &json);

} // namespace tasktide::common
