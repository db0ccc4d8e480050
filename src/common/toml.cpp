#include "distill/common/toml.hpp"

#include "distill/common/fs.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <sstream>

namespace distill::common {

namespace {

/// Index of the first `target` outside a double-quoted string, or npos.
std::size_t find_unquoted(const std::string &text, const char target, std::size_t from = 0) {
  bool in_quotes = false;
  for (std::size_t i = 0; i < text.size(); ++i) {
    const char ch = text[i];
    if (ch == '"' && (i == 0 || text[i - 1] != '\\')) {
      in_quotes = !in_quotes;
    } else if (!in_quotes && ch == target && i >= from) {
      return i;
    }
  }
  return std::string::npos;
}

std::string without_comment(const std::string &line) {
  return line.substr(0, find_unquoted(line, '#'));
}

int open_brackets(const std::string &value) {
  int depth = 0;
  bool in_quotes = false;
  for (std::size_t i = 0; i < value.size(); ++i) {
    const char ch = value[i];
    if (ch == '"' && (i == 0 || value[i - 1] != '\\')) {
      in_quotes = !in_quotes;
    } else if (!in_quotes) {
      depth += ch == '[' ? 1 : (ch == ']' ? -1 : 0);
    }
  }
  return depth;
}

std::vector<std::string> array_elements(const std::string &inner) {
  std::vector<std::string> elements;
  std::size_t start = 0;
  while (start <= inner.size()) {
    const std::size_t comma = find_unquoted(inner, ',', start);
    const std::string element =
        trim(inner.substr(start, comma == std::string::npos ? std::string::npos : comma - start));
    if (!element.empty()) {
      elements.push_back(element);
    }
    if (comma == std::string::npos) {
      break;
    }
    start = comma + 1;
  }
  return elements;
}

std::string unquote(const std::string &raw) {
  const std::string value = trim(raw);
  if (value.size() < 2 || value.front() != '"' || value.back() != '"') {
    return value;
  }
  std::string out;
  out.reserve(value.size() - 2);
  for (std::size_t i = 1; i + 1 < value.size(); ++i) {
    if (value[i] != '\\' || i + 2 >= value.size()) {
      out.push_back(value[i]);
      continue;
    }
    const char escaped = value[++i];
    switch (escaped) {
    case 'n':
      out.push_back('\n');
      break;
    case 't':
      out.push_back('\t');
      break;
    default:
      out.push_back(escaped);
      break;
    }
  }
  return out;
}

/// TOML allows `_` between digits of a number.
std::string numeric_text(const std::string &raw) {
  std::string text = trim(raw);
  text.erase(std::remove(text.begin(), text.end(), '_'), text.end());
  return text;
}

} // namespace

std::optional<std::string> TomlDocument::raw(const std::string &key) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool TomlDocument::has(const std::string &key) const { return values.contains(key); }

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto value = raw(key);
  return value.has_value() ? unquote(*value) : fallback;
}

bool TomlDocument::get_bool(const std::string &key, const bool fallback) const {
  const auto value = raw(key);
  if (!value.has_value()) {
    return fallback;
  }
  const std::string word = to_lower(trim(*value));
  if (word == "true" || word == "false") {
    return word == "true";
  }
  return fallback;
}

std::uint64_t TomlDocument::get_u64(const std::string &key, const std::uint64_t fallback) const {
  const auto value = raw(key);
  if (!value.has_value()) {
    return fallback;
  }
  const std::string text = numeric_text(*value);
  std::uint64_t parsed = 0;
  const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
  if (ec != std::errc() || end != text.data() + text.size()) {
    return fallback;
  }
  return parsed;
}

double TomlDocument::get_double(const std::string &key, const double fallback) const {
  const auto value = raw(key);
  if (!value.has_value()) {
    return fallback;
  }
  const std::string text = numeric_text(*value);
  if (text.empty()) {
    return fallback;
  }
  char *end = nullptr;
  const double parsed = std::strtod(text.c_str(), &end);
  return (end != nullptr && *end == '\0') ? parsed : fallback;
}

std::vector<std::string>
TomlDocument::get_string_array(const std::string &key,
                               const std::vector<std::string> &fallback) const {
  const auto value = raw(key);
  if (!value.has_value()) {
    return fallback;
  }
  const std::string text = trim(*value);
  if (text.size() < 2 || text.front() != '[' || text.back() != ']') {
    return fallback;
  }
  std::vector<std::string> out;
  for (const auto &element : array_elements(text.substr(1, text.size() - 2))) {
    out.push_back(unquote(element));
  }
  return out;
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string section;
  std::size_t line_number = 0;

  // A multi-line array accumulates here until its brackets close.
  std::string open_key;
  std::string open_value;

  const auto fail = [&line_number](const std::string &what) {
    return Result<TomlDocument>::failure(what + " at line " + std::to_string(line_number));
  };

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string text = trim(without_comment(line));

    if (!open_key.empty()) {
      open_value += " " + text;
      if (open_brackets(open_value) <= 0) {
        document.values[open_key] = trim(open_value);
        open_key.clear();
        open_value.clear();
      }
      continue;
    }
    if (text.empty()) {
      continue;
    }

    if (text.front() == '[') {
      if (text.back() != ']') {
        return fail("unterminated section header");
      }
      section = trim(text.substr(1, text.size() - 2));
      if (section.empty()) {
        return fail("empty section name");
      }
      continue;
    }

    const std::size_t equals = find_unquoted(text, '=');
    if (equals == std::string::npos) {
      return fail("expected key = value");
    }
    const std::string key = trim(text.substr(0, equals));
    const std::string value = trim(text.substr(equals + 1));
    if (key.empty()) {
      return fail("missing key");
    }

    std::string qualified = section.empty() ? key : section + "." + key;
    if (!value.empty() && value.front() == '[' && open_brackets(value) > 0) {
      open_key = std::move(qualified);
      open_value = value;
      continue;
    }
    document.values[qualified] = value;
  }

  if (!open_key.empty()) {
    return Result<TomlDocument>::failure("unterminated array for key " + open_key);
  }
  return Result<TomlDocument>::success(std::move(document));
}

std::string quote_toml_string(const std::string &value) {
  std::string out = "\"";
  for (const char ch : value) {
    switch (ch) {
    case '"':
    case '\\':
      out.push_back('\\');
      out.push_back(ch);
      break;
    case '\n':
      out += "\\n";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      out.push_back(ch);
      break;
    }
  }
  out.push_back('"');
  return out;
}

std::string toml_string_array(const std::vector<std::string> &values) {
  std::ostringstream out;
  out << "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    out << (i == 0 ? "" : ", ") << quote_toml_string(values[i]);
  }
  out << "]";
  return out.str();
}

} // namespace distill::common
