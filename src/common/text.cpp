#include "distill/common/text.hpp"

#include "distill/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>
#include <unordered_set>

namespace distill::common {

namespace {

const std::unordered_set<std::string> &stop_words() {
  static const std::unordered_set<std::string> words = {
      "the", "and", "for", "are", "but", "not", "you", "all", "can", "had", "her", "was",
      "one", "our", "out", "day", "get", "has", "him", "his", "how", "man", "new", "now",
      "old", "see", "two", "way", "who", "boy", "did", "its", "let", "put", "say", "she",
      "too", "use", "that", "this", "with", "from", "they", "have", "will", "were", "been",
      "their", "which", "there", "would", "about", "into", "than", "then", "them", "also"};
  return words;
}

bool is_sentence_end(const char ch) { return ch == '.' || ch == '!' || ch == '?'; }

bool is_word_char(const char ch) {
  return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_';
}

} // namespace

std::string normalize_whitespace(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  bool pending_space = false;
  for (const char ch : text) {
    if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) {
      out.push_back(' ');
      pending_space = false;
    }
    out.push_back(ch);
  }
  return out;
}

std::size_t count_words(const std::string &text) {
  std::size_t count = 0;
  bool in_word = false;
  for (const char ch : text) {
    const bool space = std::isspace(static_cast<unsigned char>(ch)) != 0;
    if (!space && !in_word) {
      ++count;
    }
    in_word = !space;
  }
  return count;
}

std::size_t count_sentences(const std::string &text) {
  std::size_t count = 0;
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (is_sentence_end(text[i]) && (i + 1 == text.size() || !is_sentence_end(text[i + 1]))) {
      ++count;
    }
  }
  return count;
}

std::vector<std::string> split_sentences(const std::string &text) {
  std::vector<std::string> sentences;
  std::string current;
  for (const char ch : text) {
    if (is_sentence_end(ch)) {
      if (auto sentence = trim(current); !sentence.empty()) {
        sentences.push_back(normalize_whitespace(sentence));
      }
      current.clear();
      continue;
    }
    current.push_back(ch);
  }
  if (auto sentence = trim(current); !sentence.empty()) {
    sentences.push_back(normalize_whitespace(sentence));
  }
  return sentences;
}

std::vector<std::string> word_tokens(const std::string &text) {
  std::vector<std::string> tokens;
  std::string current;
  const auto flush = [&] {
    if (current.size() >= 3) {
      tokens.push_back(current);
    }
    current.clear();
  };
  for (const char ch : text) {
    if (std::isalpha(static_cast<unsigned char>(ch)) != 0) {
      current.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    } else {
      flush();
    }
  }
  flush();
  return tokens;
}

std::vector<std::string> extract_keywords(const std::string &text, const std::size_t max_keywords) {
  std::unordered_map<std::string, std::size_t> counts;
  std::vector<std::string> order;
  for (const auto &token : word_tokens(text)) {
    if (stop_words().contains(token)) {
      continue;
    }
    if (counts[token]++ == 0) {
      order.push_back(token);
    }
  }

  std::stable_sort(order.begin(), order.end(), [&](const auto &lhs, const auto &rhs) {
    return counts.at(lhs) > counts.at(rhs);
  });
  if (order.size() > max_keywords) {
    order.resize(max_keywords);
  }
  return order;
}

double readability_score(const std::string &text) {
  if (trim(text).empty()) {
    return 0.0;
  }
  const std::size_t sentences = count_sentences(text);
  if (sentences == 0) {
    return 0.5;
  }

  const double avg = static_cast<double>(count_words(text)) / static_cast<double>(sentences);
  double score = 1.0;
  if (avg < 10.0) {
    score = avg / 10.0;
  } else if (avg > 20.0) {
    score = std::max(0.1, 1.0 - (avg - 20.0) / 50.0);
  }
  return std::clamp(score, 0.0, 1.0);
}

std::string summarize_text(const std::string &text, const std::size_t max_length) {
  const std::string clean = normalize_whitespace(text);
  if (clean.size() <= max_length) {
    return clean;
  }

  std::string summary;
  for (const auto &sentence : split_sentences(clean)) {
    if (summary.size() + sentence.size() + 2 > max_length - std::min<std::size_t>(3, max_length)) {
      break;
    }
    summary += sentence + ". ";
  }

  if (summary.empty()) {
    // Single overlong sentence: cut on the character budget.
    const std::size_t budget = max_length > 3 ? max_length - 3 : 0;
    summary = trim(clean.substr(0, budget));
  }
  return trim(summary) + "...";
}

std::size_t count_term_hits(const std::string &text, const std::vector<std::string> &terms) {
  const std::string haystack = to_lower(text);
  std::unordered_set<std::string> seen;
  for (const auto &raw_term : terms) {
    const std::string term = to_lower(trim(raw_term));
    if (term.empty() || seen.contains(term)) {
      continue;
    }
    std::size_t pos = haystack.find(term);
    while (pos != std::string::npos) {
      const bool left_ok = pos == 0 || !is_word_char(haystack[pos - 1]);
      const std::size_t end = pos + term.size();
      const bool right_ok = end >= haystack.size() || !is_word_char(haystack[end]);
      if (left_ok && right_ok) {
        seen.insert(term);
        break;
      }
      pos = haystack.find(term, pos + 1);
    }
  }
  return seen.size();
}

std::string url_host(const std::string &url) {
  const auto scheme = url.find("://");
  if (scheme == std::string::npos) {
    return "";
  }
  std::string rest = url.substr(scheme + 3);
  const auto end = rest.find_first_of("/?#");
  if (end != std::string::npos) {
    rest = rest.substr(0, end);
  }
  if (const auto at = rest.rfind('@'); at != std::string::npos) {
    rest = rest.substr(at + 1);
  }
  if (const auto colon = rest.find(':'); colon != std::string::npos) {
    rest = rest.substr(0, colon);
  }
  rest = to_lower(rest);
  if (starts_with(rest, "www.")) {
    rest = rest.substr(4);
  }
  return rest;
}

} // namespace distill::common
