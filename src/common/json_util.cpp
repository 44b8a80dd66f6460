#include "almanac/common/json_util.hpp"

#include <cctype>
#include <cstdint>
#include <sstream>

namespace almanac::common {

namespace {

constexpr std::size_t kMaxNestingDepth = 64;

void append_utf8(std::string &out, std::uint32_t code_point) {
  if (code_point < 0x80u) {
    out.push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800u) {
    out.push_back(static_cast<char>(0xC0u | (code_point >> 6u)));
    out.push_back(static_cast<char>(0x80u | (code_point & 0x3Fu)));
  } else if (code_point < 0x10000u) {
    out.push_back(static_cast<char>(0xE0u | (code_point >> 12u)));
    out.push_back(static_cast<char>(0x80u | ((code_point >> 6u) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | (code_point & 0x3Fu)));
  } else {
    out.push_back(static_cast<char>(0xF0u | (code_point >> 18u)));
    out.push_back(static_cast<char>(0x80u | ((code_point >> 12u) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | ((code_point >> 6u) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | (code_point & 0x3Fu)));
  }
}

bool parse_hex4(const std::string &raw, const std::size_t pos, std::uint32_t &out) {
  if (pos + 4 > raw.size()) {
    return false;
  }
  out = 0;
  for (std::size_t i = pos; i < pos + 4; ++i) {
    const char ch = raw[i];
    out <<= 4u;
    if (ch >= '0' && ch <= '9') {
      out |= static_cast<std::uint32_t>(ch - '0');
    } else if (ch >= 'a' && ch <= 'f') {
      out |= static_cast<std::uint32_t>(ch - 'a' + 10);
    } else if (ch >= 'A' && ch <= 'F') {
      out |= static_cast<std::uint32_t>(ch - 'A' + 10);
    } else {
      return false;
    }
  }
  return true;
}

class JsonValidator {
public:
  explicit JsonValidator(const std::string &text) : text_(text) {}

  [[nodiscard]] bool validate_document(char *top_level) {
    pos_ = json_skip_ws(text_, 0);
    if (pos_ >= text_.size()) {
      return false;
    }
    if (top_level != nullptr) {
      *top_level = text_[pos_];
    }
    if (!value(0)) {
      return false;
    }
    pos_ = json_skip_ws(text_, pos_);
    return pos_ == text_.size();
  }

private:
  bool value(const std::size_t depth) {
    if (depth > kMaxNestingDepth || pos_ >= text_.size()) {
      return false;
    }
    switch (text_[pos_]) {
    case '{':
      return object(depth + 1);
    case '[':
      return array(depth + 1);
    case '"':
      return string();
    case 't':
      return literal("true");
    case 'f':
      return literal("false");
    case 'n':
      return literal("null");
    default:
      return number();
    }
  }

  bool object(const std::size_t depth) {
    ++pos_;
    pos_ = json_skip_ws(text_, pos_);
    if (pos_ < text_.size() && text_[pos_] == '}') {
      ++pos_;
      return true;
    }
    while (pos_ < text_.size()) {
      pos_ = json_skip_ws(text_, pos_);
      if (pos_ >= text_.size() || text_[pos_] != '"' || !string()) {
        return false;
      }
      pos_ = json_skip_ws(text_, pos_);
      if (pos_ >= text_.size() || text_[pos_] != ':') {
        return false;
      }
      ++pos_;
      pos_ = json_skip_ws(text_, pos_);
      if (!value(depth)) {
        return false;
      }
      pos_ = json_skip_ws(text_, pos_);
      if (pos_ >= text_.size()) {
        return false;
      }
      if (text_[pos_] == ',') {
        ++pos_;
        continue;
      }
      if (text_[pos_] == '}') {
        ++pos_;
        return true;
      }
      return false;
    }
    return false;
  }

  bool array(const std::size_t depth) {
    ++pos_;
    pos_ = json_skip_ws(text_, pos_);
    if (pos_ < text_.size() && text_[pos_] == ']') {
      ++pos_;
      return true;
    }
    while (pos_ < text_.size()) {
      pos_ = json_skip_ws(text_, pos_);
      if (!value(depth)) {
        return false;
      }
      pos_ = json_skip_ws(text_, pos_);
      if (pos_ >= text_.size()) {
        return false;
      }
      if (text_[pos_] == ',') {
        ++pos_;
        continue;
      }
      if (text_[pos_] == ']') {
        ++pos_;
        return true;
      }
      return false;
    }
    return false;
  }

  bool string() {
    ++pos_;
    while (pos_ < text_.size()) {
      const auto ch = static_cast<unsigned char>(text_[pos_]);
      if (ch == '"') {
        ++pos_;
        return true;
      }
      if (ch < 0x20u) {
        return false;
      }
      if (ch == '\\') {
        ++pos_;
        if (pos_ >= text_.size()) {
          return false;
        }
        const char esc = text_[pos_];
        if (esc == 'u') {
          std::uint32_t ignored = 0;
          if (!parse_hex4(text_, pos_ + 1, ignored)) {
            return false;
          }
          pos_ += 4;
        } else if (esc != '"' && esc != '\\' && esc != '/' && esc != 'b' && esc != 'f' &&
                   esc != 'n' && esc != 'r' && esc != 't') {
          return false;
        }
      }
      ++pos_;
    }
    return false;
  }

  bool literal(const std::string &word) {
    if (text_.compare(pos_, word.size(), word) != 0) {
      return false;
    }
    pos_ += word.size();
    return true;
  }

  bool number() {
    const std::size_t start = pos_;
    if (pos_ < text_.size() && text_[pos_] == '-') {
      ++pos_;
    }
    const std::size_t int_start = pos_;
    while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_])) != 0) {
      ++pos_;
    }
    if (pos_ == int_start) {
      return false;
    }
    if (text_[int_start] == '0' && pos_ - int_start > 1) {
      return false;
    }
    if (pos_ < text_.size() && text_[pos_] == '.') {
      ++pos_;
      const std::size_t frac_start = pos_;
      while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_])) != 0) {
        ++pos_;
      }
      if (pos_ == frac_start) {
        return false;
      }
    }
    if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
      ++pos_;
      if (pos_ < text_.size() && (text_[pos_] == '+' || text_[pos_] == '-')) {
        ++pos_;
      }
      const std::size_t exp_start = pos_;
      while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_])) != 0) {
        ++pos_;
      }
      if (pos_ == exp_start) {
        return false;
      }
    }
    return pos_ > start;
  }

  const std::string &text_;
  std::size_t pos_ = 0;
};

} // namespace

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    case '\b':
      escaped += "\\b";
      break;
    case '\f':
      escaped += "\\f";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20u) {
        static constexpr char kHex[] = "0123456789abcdef";
        escaped += "\\u00";
        escaped.push_back(kHex[(static_cast<unsigned char>(ch) >> 4u) & 0x0Fu]);
        escaped.push_back(kHex[static_cast<unsigned char>(ch) & 0x0Fu]);
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\' || i + 1 >= raw.size()) {
      out.push_back(ch);
      continue;
    }
    const char esc = raw[++i];
    switch (esc) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'u': {
      std::uint32_t code_point = 0;
      if (!parse_hex4(raw, i + 1, code_point)) {
        out.push_back(esc);
        break;
      }
      i += 4;
      // surrogate pair
      if (code_point >= 0xD800u && code_point <= 0xDBFFu && i + 2 < raw.size() &&
          raw[i + 1] == '\\' && raw[i + 2] == 'u') {
        std::uint32_t low = 0;
        if (parse_hex4(raw, i + 3, low) && low >= 0xDC00u && low <= 0xDFFFu) {
          code_point = 0x10000u + ((code_point - 0xD800u) << 10u) + (low - 0xDC00u);
          i += 6;
        }
      }
      append_utf8(out, code_point);
      break;
    }
    default:
      out.push_back(esc);
      break;
    }
  }
  return out;
}

std::size_t json_find_key(const std::string &json, const std::string &key, std::size_t from) {
  const std::string quoted = "\"" + key + "\"";
  return json.find(quoted, from);
}

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos) {
  bool escaped = false;
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    const char ch = json[i];
    if (!escaped && ch == '"') {
      return i;
    }
    if (!escaped && ch == '\\') {
      escaped = true;
      continue;
    }
    escaped = false;
  }
  return std::string::npos;
}

std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                      const char open_ch, const char close_ch) {
  if (open_pos >= json.size() || json[open_pos] != open_ch) {
    return std::string::npos;
  }
  std::size_t depth = 0;
  bool in_string = false;
  bool escaped = false;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (in_string) {
      if (!escaped && ch == '"') {
        in_string = false;
      } else if (!escaped && ch == '\\') {
        escaped = true;
        continue;
      }
      escaped = false;
      continue;
    }
    if (ch == '"') {
      in_string = true;
      escaped = false;
      continue;
    }
    if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch) {
      if (depth == 0) {
        return std::string::npos;
      }
      --depth;
      if (depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

bool json_is_valid(const std::string &json) {
  JsonValidator validator(json);
  return validator.validate_document(nullptr);
}

bool json_is_object(const std::string &json) {
  JsonValidator validator(json);
  char top = '\0';
  return validator.validate_document(&top) && top == '{';
}

std::string json_get_string(const std::string &json, const std::string &field) {
  const auto key_pos = json_find_key(json, field);
  if (key_pos == std::string::npos) {
    return "";
  }
  const auto colon = json.find(':', key_pos + field.size() + 2);
  if (colon == std::string::npos) {
    return "";
  }
  std::size_t pos = json_skip_ws(json, colon + 1);
  if (pos >= json.size() || json[pos] != '"') {
    return "";
  }
  const auto end = json_find_string_end(json, pos);
  if (end == std::string::npos || end <= pos) {
    return "";
  }
  return json_unescape(json.substr(pos + 1, end - pos - 1));
}

std::string json_get_array(const std::string &json, const std::string &field) {
  const auto key_pos = json_find_key(json, field);
  if (key_pos == std::string::npos) {
    return "";
  }
  const auto colon = json.find(':', key_pos + field.size() + 2);
  if (colon == std::string::npos) {
    return "";
  }
  std::size_t pos = json_skip_ws(json, colon + 1);
  if (pos >= json.size() || json[pos] != '[') {
    return "";
  }
  const auto end = json_find_matching_token(json, pos, '[', ']');
  if (end == std::string::npos || end < pos) {
    return "";
  }
  return json.substr(pos, end - pos + 1);
}

namespace {

JsonFlatMap parse_flat_object(const std::string &json, const bool strings_only) {
  JsonFlatMap result;
  std::size_t pos = json_skip_ws(json, 0);
  if (json.size() < pos + 2 || json[pos] != '{') {
    return result;
  }

  ++pos; // skip opening {
  while (pos < json.size()) {
    pos = json_skip_ws(json, pos);
    if (pos >= json.size() || json[pos] == '}') {
      break;
    }
    if (json[pos] == ',') {
      ++pos;
      continue;
    }

    // expect key
    if (json[pos] != '"') {
      ++pos;
      continue;
    }
    const auto key_end = json_find_string_end(json, pos);
    if (key_end == std::string::npos) {
      break;
    }
    const std::string key = json_unescape(json.substr(pos + 1, key_end - pos - 1));
    pos = key_end + 1;

    // expect colon
    pos = json_skip_ws(json, pos);
    if (pos >= json.size() || json[pos] != ':') {
      break;
    }
    ++pos;
    pos = json_skip_ws(json, pos);
    if (pos >= json.size()) {
      break;
    }

    // read value
    if (json[pos] == '"') {
      const auto val_end = json_find_string_end(json, pos);
      if (val_end == std::string::npos) {
        break;
      }
      result[key] = json_unescape(json.substr(pos + 1, val_end - pos - 1));
      pos = val_end + 1;
    } else if (json[pos] == '{' || json[pos] == '[') {
      const char open = json[pos];
      const char close = (open == '{') ? '}' : ']';
      const auto end = json_find_matching_token(json, pos, open, close);
      if (end == std::string::npos) {
        break;
      }
      if (!strings_only) {
        result[key] = json.substr(pos, end - pos + 1);
      }
      pos = end + 1;
    } else {
      // number, true/false/null
      const std::size_t start = pos;
      while (pos < json.size() && json[pos] != ',' && json[pos] != '}' && json[pos] != ']' &&
             std::isspace(static_cast<unsigned char>(json[pos])) == 0) {
        ++pos;
      }
      if (!strings_only) {
        result[key] = json.substr(start, pos - start);
      }
    }
  }

  return result;
}

} // namespace

JsonFlatMap json_parse_flat(const std::string &json) { return parse_flat_object(json, false); }

JsonFlatMap json_parse_flat_strings(const std::string &json) {
  return parse_flat_object(json, true);
}

std::vector<std::string> json_parse_string_array(const std::string &array_json) {
  std::vector<std::string> out;
  std::size_t pos = json_skip_ws(array_json, 0);
  if (pos >= array_json.size() || array_json[pos] != '[') {
    return out;
  }
  ++pos;
  while (pos < array_json.size()) {
    pos = json_skip_ws(array_json, pos);
    if (pos >= array_json.size() || array_json[pos] == ']') {
      break;
    }
    if (array_json[pos] == ',') {
      ++pos;
      continue;
    }
    if (array_json[pos] == '"') {
      const auto end = json_find_string_end(array_json, pos);
      if (end == std::string::npos || end <= pos) {
        break;
      }
      out.push_back(json_unescape(array_json.substr(pos + 1, end - pos - 1)));
      pos = end + 1;
    } else if (array_json[pos] == '{' || array_json[pos] == '[') {
      const char open = array_json[pos];
      const auto end = json_find_matching_token(array_json, pos, open, open == '{' ? '}' : ']');
      if (end == std::string::npos) {
        break;
      }
      pos = end + 1;
    } else {
      ++pos;
    }
  }
  return out;
}

std::string json_string_array(const std::vector<std::string> &values) {
  std::ostringstream out;
  out << "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out << ",";
    }
    out << "\"" << json_escape(values[i]) << "\"";
  }
  out << "]";
  return out.str();
}

std::vector<std::string> json_split_top_level_objects(const std::string &array_json) {
  std::vector<std::string> out;
  if (array_json.size() < 2 || array_json.front() != '[' || array_json.back() != ']') {
    return out;
  }

  bool in_string = false;
  bool escaped = false;
  std::size_t depth = 0;
  std::size_t current_start = std::string::npos;
  for (std::size_t i = 1; i + 1 < array_json.size(); ++i) {
    const char ch = array_json[i];
    if (in_string) {
      if (!escaped && ch == '"') {
        in_string = false;
      } else if (!escaped && ch == '\\') {
        escaped = true;
        continue;
      }
      escaped = false;
      continue;
    }
    if (ch == '"') {
      in_string = true;
      escaped = false;
      continue;
    }
    if (ch == '{') {
      if (depth == 0) {
        current_start = i;
      }
      ++depth;
      continue;
    }
    if (ch == '}') {
      if (depth == 0) {
        continue;
      }
      --depth;
      if (depth == 0 && current_start != std::string::npos) {
        out.push_back(array_json.substr(current_start, i - current_start + 1));
        current_start = std::string::npos;
      }
    }
  }
  return out;
}

} // namespace almanac::common
