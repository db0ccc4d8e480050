#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace distill::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Unescape a JSON-encoded string body (the text between the quotes).
[[nodiscard]] std::string json_unescape(const std::string &raw);

[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// Top-level members of a JSON object. String values are unescaped; nested
/// objects and arrays are kept as raw JSON text; numbers, booleans and null
/// are kept as their literal text. When string_members is given it receives
/// the keys whose value was a JSON string.
using JsonFlatMap = std::unordered_map<std::string, std::string>;
[[nodiscard]] JsonFlatMap json_parse_flat(const std::string &json,
                                          std::unordered_set<std::string> *string_members = nullptr);

/// Split a JSON array of objects into individual object strings.
[[nodiscard]] std::vector<std::string> json_split_top_level_objects(const std::string &array_json);

/// String elements of a raw JSON array such as ["a","b"]; other elements are skipped.
[[nodiscard]] std::vector<std::string> json_array_strings(const std::string &array_json);

/// Numeric elements of a raw JSON array; nullopt when any element is not a number.
[[nodiscard]] std::optional<std::vector<double>> json_array_numbers(const std::string &array_json);

[[nodiscard]] std::optional<double> json_number(const std::string &literal);
[[nodiscard]] std::optional<bool> json_bool(const std::string &literal);

[[nodiscard]] std::string json_string_array(const std::vector<std::string> &values);

/// Look up a member of a flat map and convert it, falling back when absent or invalid.
[[nodiscard]] double json_field_double(const JsonFlatMap &map, const std::string &key,
                                       double fallback);
[[nodiscard]] std::string json_field_string(const JsonFlatMap &map, const std::string &key,
                                            const std::string &fallback = "");
/// Non-negative integral count; missing, negative or NaN values read as 0 and
/// values beyond the range of size_t saturate.
[[nodiscard]] std::size_t json_field_count(const JsonFlatMap &map, const std::string &key);

} // namespace distill::common
