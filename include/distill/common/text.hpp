#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace distill::common {

/// Collapse whitespace runs into single spaces and trim the ends.
[[nodiscard]] std::string normalize_whitespace(const std::string &text);

[[nodiscard]] std::size_t count_words(const std::string &text);
[[nodiscard]] std::size_t count_sentences(const std::string &text);
[[nodiscard]] std::vector<std::string> split_sentences(const std::string &text);

/// Lower-cased alphabetic tokens of three or more letters.
[[nodiscard]] std::vector<std::string> word_tokens(const std::string &text);

/// Most frequent non-stop-word tokens; ties keep first-occurrence order.
[[nodiscard]] std::vector<std::string> extract_keywords(const std::string &text,
                                                       std::size_t max_keywords = 10);

/// 1.0 for 10-20 words per sentence, falling off on either side; 0.5 when no
/// sentence terminator is present and 0.0 for empty text.
[[nodiscard]] double readability_score(const std::string &text);

/// Leading sentences that fit in `max_length` characters, with "..." appended
/// when the text was cut.
[[nodiscard]] std::string summarize_text(const std::string &text, std::size_t max_length = 500);

/// Number of distinct `terms` that occur in `text` as whole words (case-insensitive).
[[nodiscard]] std::size_t count_term_hits(const std::string &text,
                                          const std::vector<std::string> &terms);

/// Lower-cased host of an http(s) URL without a leading "www."; empty when absent.
[[nodiscard]] std::string url_host(const std::string &url);

} // namespace distill::common
