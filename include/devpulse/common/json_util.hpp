#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>

namespace devpulse::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Decode the body of a JSON string literal (quotes already stripped).
[[nodiscard]] std::string json_unescape(const std::string &raw);

[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Position of the closing quote for the string literal opened at quote_pos.
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// Top-level members of a JSON object. String values are unescaped, every other value
/// (numbers, literals, nested objects and arrays) is kept as raw JSON text.
using JsonFlatMap = std::unordered_map<std::string, std::string>;
[[nodiscard]] JsonFlatMap json_parse_flat(const std::string &json);

/// True when text is a well-formed top-level JSON object as far as json_parse_flat can tell.
[[nodiscard]] bool json_looks_like_object(const std::string &text);

[[nodiscard]] std::string json_get_string(const std::string &json, const std::string &field);

} // namespace devpulse::common
