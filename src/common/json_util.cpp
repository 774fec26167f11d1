#include "ragsync/common/json_util.hpp"

#include <cctype>
#include <cerrno>
#include <charconv>
#include <cstdlib>
#include <sstream>

namespace ragsync::common {

namespace {

void append_utf8(std::string &out, const std::uint32_t code_point) {
  if (code_point < 0x80) {
    out.push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  }
}

std::string array_body(const std::string &array_json, bool &ok) {
  std::size_t begin = json_skip_ws(array_json, 0);
  std::size_t end = array_json.size();
  while (end > begin && std::isspace(static_cast<unsigned char>(array_json[end - 1])) != 0) {
    --end;
  }
  ok = end - begin >= 2 && array_json[begin] == '[' && array_json[end - 1] == ']';
  if (!ok) {
    return "";
  }
  return array_json.substr(begin + 1, end - begin - 2);
}

std::vector<std::string> split_numbers(const std::string &body) {
  std::vector<std::string> out;
  std::stringstream stream(body);
  std::string item;
  while (std::getline(stream, item, ',')) {
    std::size_t first = json_skip_ws(item, 0);
    std::size_t last = item.size();
    while (last > first && std::isspace(static_cast<unsigned char>(item[last - 1])) != 0) {
      --last;
    }
    out.push_back(item.substr(first, last - first));
  }
  if (out.size() == 1 && out.front().empty()) {
    out.clear();
  }
  return out;
}

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
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        static constexpr char kHex[] = "0123456789abcdef";
        escaped += "\\u00";
        escaped.push_back(kHex[(static_cast<unsigned char>(ch) >> 4) & 0x0F]);
        escaped.push_back(kHex[static_cast<unsigned char>(ch) & 0x0F]);
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
    const char next = raw[++i];
    switch (next) {
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
      if (i + 4 < raw.size()) {
        const auto *first = raw.data() + i + 1;
        auto [ptr, ec] = std::from_chars(first, first + 4, code_point, 16);
        if (ec == std::errc() && ptr == first + 4) {
          append_utf8(out, code_point);
          i += 4;
          break;
        }
      }
      out.push_back('u');
      break;
    }
    default:
      out.push_back(next);
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

std::string json_get_number(const std::string &json, const std::string &field) {
  const auto key_pos = json_find_key(json, field);
  if (key_pos == std::string::npos) {
    return "";
  }
  const auto colon = json.find(':', key_pos + field.size() + 2);
  if (colon == std::string::npos) {
    return "";
  }
  std::size_t pos = json_skip_ws(json, colon + 1);
  if (pos >= json.size() || json[pos] == '"') {
    return "";
  }
  const std::size_t start = pos;
  while (pos < json.size()) {
    const char ch = json[pos];
    if (ch == ',' || ch == '}' || ch == ']' || std::isspace(static_cast<unsigned char>(ch)) != 0) {
      break;
    }
    ++pos;
  }
  if (pos <= start) {
    return "";
  }
  return json.substr(start, pos - start);
}

std::string json_get_object(const std::string &json, const std::string &field) {
  const auto key_pos = json_find_key(json, field);
  if (key_pos == std::string::npos) {
    return "";
  }
  const auto colon = json.find(':', key_pos + field.size() + 2);
  if (colon == std::string::npos) {
    return "";
  }
  std::size_t pos = json_skip_ws(json, colon + 1);
  if (pos >= json.size() || json[pos] != '{') {
    return "";
  }
  const auto end = json_find_matching_token(json, pos, '{', '}');
  if (end == std::string::npos || end < pos) {
    return "";
  }
  return json.substr(pos, end - pos + 1);
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

Result<std::vector<float>> json_parse_float_array(const std::string &array_json) {
  bool ok = false;
  const std::string body = array_body(array_json, ok);
  if (!ok) {
    return Result<std::vector<float>>::failure(ErrorCode::InvalidArgument, "not a JSON array");
  }

  std::vector<float> values;
  for (const auto &item : split_numbers(body)) {
    if (item.empty()) {
      return Result<std::vector<float>>::failure(ErrorCode::InvalidArgument,
                                                 "empty element in number array");
    }
    char *end = nullptr;
    errno = 0;
    const float value = std::strtof(item.c_str(), &end);
    if (end != item.c_str() + item.size() || errno == ERANGE) {
      return Result<std::vector<float>>::failure(ErrorCode::InvalidArgument,
                                                 "invalid number: " + item);
    }
    values.push_back(value);
  }
  return Result<std::vector<float>>::success(std::move(values));
}

Result<std::vector<std::int64_t>> json_parse_int_array(const std::string &array_json) {
  bool ok = false;
  const std::string body = array_body(array_json, ok);
  if (!ok) {
    return Result<std::vector<std::int64_t>>::failure(ErrorCode::InvalidArgument,
                                                      "not a JSON array");
  }

  std::vector<std::int64_t> values;
  for (const auto &item : split_numbers(body)) {
    std::int64_t parsed = 0;
    const auto *first = item.data();
    const auto *last = first + item.size();
    auto [ptr, ec] = std::from_chars(first, last, parsed);
    if (item.empty() || ec != std::errc() || ptr != last) {
      return Result<std::vector<std::int64_t>>::failure(ErrorCode::InvalidArgument,
                                                        "invalid integer: " + item);
    }
    values.push_back(parsed);
  }
  return Result<std::vector<std::int64_t>>::success(std::move(values));
}

std::string json_int_array(const std::vector<std::int64_t> &values) {
  std::string out = "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out.push_back(',');
    }
    out += std::to_string(values[i]);
  }
  out.push_back(']');
  return out;
}

} // namespace ragsync::common
