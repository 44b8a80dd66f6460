#include "almanac/common/toml.hpp"

#include "almanac/common/fs.hpp"

#include <charconv>
#include <cstdlib>
#include <sstream>

namespace almanac::common {

namespace {

// Returns npos when a string opened on this line is never closed.
std::size_t comment_start(const std::string &line) {
  char quote = '\0';
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char ch = line[i];
    if (quote == '"' && ch == '\\') {
      ++i;
      continue;
    }
    if (quote != '\0') {
      if (ch == quote) {
        quote = '\0';
      }
      continue;
    }
    if (ch == '"' || ch == '\'') {
      quote = ch;
      continue;
    }
    if (ch == '#') {
      return i;
    }
  }
  return quote == '\0' ? line.size() : std::string::npos;
}

std::vector<std::string> split_array_elements(const std::string &array_value) {
  std::vector<std::string> result;
  std::string current;
  char quote = '\0';

  for (std::size_t i = 0; i < array_value.size(); ++i) {
    const char ch = array_value[i];
    if (quote == '"' && ch == '\\' && i + 1 < array_value.size()) {
      current.push_back(ch);
      current.push_back(array_value[++i]);
      continue;
    }
    if (quote != '\0') {
      if (ch == quote) {
        quote = '\0';
      }
      current.push_back(ch);
      continue;
    }
    if (ch == '"' || ch == '\'') {
      quote = ch;
      current.push_back(ch);
      continue;
    }
    if (ch == ',') {
      result.push_back(trim(current));
      current.clear();
      continue;
    }
    current.push_back(ch);
  }

  if (!trim(current).empty()) {
    result.push_back(trim(current));
  }
  return result;
}

std::string decode_string(std::string value) {
  value = trim(value);
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  if (value.size() < 2 || value.front() != '"' || value.back() != '"') {
    return value;
  }

  std::string out;
  out.reserve(value.size() - 2);
  for (std::size_t i = 1; i + 1 < value.size(); ++i) {
    const char ch = value[i];
    if (ch != '\\' || i + 2 >= value.size()) {
      out.push_back(ch);
      continue;
    }
    const char esc = value[++i];
    switch (esc) {
    case 'n':
      out.push_back('\n');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'r':
      out.push_back('\r');
      break;
    default:
      out.push_back(esc);
      break;
    }
  }
  return out;
}

template <typename Int> bool parse_integer(const std::string &raw, Int &out) {
  std::string digits;
  digits.reserve(raw.size());
  for (const char ch : trim(raw)) {
    if (ch != '_') {
      digits.push_back(ch);
    }
  }
  const char *first = digits.data();
  const char *last = first + digits.size();
  if (first != last && *first == '+') {
    ++first;
  }
  auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc() && ptr == last && first != last;
}

} // namespace

bool TomlDocument::has(const std::string &key) const { return values.contains(key); }

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  return decode_string(it->second);
}

bool TomlDocument::get_bool(const std::string &key, const bool fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  const std::string normalized = to_lower(decode_string(it->second));
  if (normalized == "true") {
    return true;
  }
  if (normalized == "false") {
    return false;
  }
  return fallback;
}

std::int64_t TomlDocument::get_int(const std::string &key, const std::int64_t fallback) const {
  const auto it = values.find(key);
  std::int64_t parsed = 0;
  if (it == values.end() || !parse_integer(it->second, parsed)) {
    return fallback;
  }
  return parsed;
}

std::uint64_t TomlDocument::get_u64(const std::string &key, const std::uint64_t fallback) const {
  const auto it = values.find(key);
  std::uint64_t parsed = 0;
  if (it == values.end() || !parse_integer(it->second, parsed)) {
    return fallback;
  }
  return parsed;
}

double TomlDocument::get_double(const std::string &key, const double fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  const std::string raw = trim(it->second);
  char *end = nullptr;
  const double parsed = std::strtod(raw.c_str(), &end);
  if (raw.empty() || end == nullptr || *end != '\0') {
    return fallback;
  }
  return parsed;
}

std::vector<std::string>
TomlDocument::get_string_array(const std::string &key,
                               const std::vector<std::string> &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }

  const std::string raw = trim(it->second);
  if (raw.size() < 2 || raw.front() != '[' || raw.back() != ']') {
    return fallback;
  }

  std::vector<std::string> values_out;
  for (const auto &element : split_array_elements(raw.substr(1, raw.size() - 2))) {
    if (!element.empty()) {
      values_out.push_back(decode_string(element));
    }
  }
  return values_out;
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string current_section;
  std::size_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    const std::size_t cut = comment_start(line);
    if (cut == std::string::npos) {
      return Result<TomlDocument>::failure("Unterminated string at line " +
                                           std::to_string(line_number));
    }
    const std::string clean_line = trim(line.substr(0, cut));
    if (clean_line.empty()) {
      continue;
    }

    if (clean_line.front() == '[') {
      if (clean_line.back() != ']') {
        return Result<TomlDocument>::failure("Invalid section header at line " +
                                             std::to_string(line_number));
      }
      current_section = trim(clean_line.substr(1, clean_line.size() - 2));
      if (current_section.empty()) {
        return Result<TomlDocument>::failure("Invalid empty section at line " +
                                             std::to_string(line_number));
      }
      continue;
    }

    const std::size_t equals_index = clean_line.find('=');
    if (equals_index == std::string::npos) {
      return Result<TomlDocument>::failure("Invalid key/value at line " +
                                           std::to_string(line_number));
    }

    const std::string key = decode_string(clean_line.substr(0, equals_index));
    const std::string value = trim(clean_line.substr(equals_index + 1));
    if (key.empty()) {
      return Result<TomlDocument>::failure("Missing key at line " + std::to_string(line_number));
    }
    if (value.empty()) {
      return Result<TomlDocument>::failure("Missing value for '" + key + "' at line " +
                                           std::to_string(line_number));
    }

    const std::string full_key = current_section.empty() ? key : current_section + "." + key;
    if (document.values.contains(full_key)) {
      return Result<TomlDocument>::failure("Duplicate key '" + full_key + "' at line " +
                                           std::to_string(line_number));
    }
    document.values[full_key] = value;
  }

  return Result<TomlDocument>::success(std::move(document));
}

} // namespace almanac::common
