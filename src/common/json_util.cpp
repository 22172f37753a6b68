#include "paramvault/common/json_util.hpp"

#include <cctype>
#include <charconv>
#include <cstdint>

namespace paramvault::common {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

int hex_value(const char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

bool read_hex4(const std::string &raw, const std::size_t pos, std::uint32_t &out) {
  if (pos + 4 > raw.size()) {
    return false;
  }
  out = 0;
  for (std::size_t i = pos; i < pos + 4; ++i) {
    const int digit = hex_value(raw[i]);
    if (digit < 0) {
      return false;
    }
    out = (out << 4U) | static_cast<std::uint32_t>(digit);
  }
  return true;
}

std::size_t skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

// Index of the quote closing the string that opens at `open`.
std::size_t string_end(const std::string &json, const std::size_t open) {
  for (std::size_t i = open + 1; i < json.size(); ++i) {
    if (json[i] == '\\') {
      ++i;
    } else if (json[i] == '"') {
      return i;
    }
  }
  return std::string::npos;
}

// Index of the '}' matching the '{' at `open`, skipping over strings.
std::size_t closing_brace(const std::string &json, const std::size_t open) {
  std::size_t depth = 0;
  for (std::size_t i = open; i < json.size(); ++i) {
    if (json[i] == '"') {
      i = string_end(json, i);
      if (i == std::string::npos) {
        return i;
      }
    } else if (json[i] == '{') {
      ++depth;
    } else if (json[i] == '}' && --depth == 0) {
      return i;
    }
  }
  return std::string::npos;
}

// Start of the value of a member of the outermost object, or npos.
std::size_t member_value(const std::string &json, const std::string &field) {
  std::size_t depth = 0;
  for (std::size_t i = 0; i < json.size(); ++i) {
    const char ch = json[i];
    if (ch == '"') {
      const auto end = string_end(json, i);
      if (end == std::string::npos) {
        return end;
      }
      if (depth == 1) {
        const auto colon = skip_ws(json, end + 1);
        if (colon < json.size() && json[colon] == ':' &&
            json_unescape(json.substr(i + 1, end - i - 1)) == field) {
          const auto value = skip_ws(json, colon + 1);
          return value < json.size() ? value : std::string::npos;
        }
      }
      i = end;
    } else if (ch == '{' || ch == '[') {
      ++depth;
    } else if (ch == '}' || ch == ']') {
      if (depth == 0) {
        return std::string::npos;
      }
      --depth;
    }
  }
  return std::string::npos;
}

void append_utf8(std::string &out, const std::uint32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
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
    case '\b':
      escaped += "\\b";
      break;
    case '\f':
      escaped += "\\f";
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
        const auto byte = static_cast<unsigned char>(ch);
        escaped += "\\u00";
        escaped.push_back(HEX_DIGITS[byte >> 4U]);
        escaped.push_back(HEX_DIGITS[byte & 0x0FU]);
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_quote(const std::string &value) { return "\"" + json_escape(value) + "\""; }

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
      std::uint32_t cp = 0;
      if (!read_hex4(raw, i + 1, cp)) {
        out.push_back(next);
        break;
      }
      i += 4;
      std::uint32_t low = 0;
      if (cp >= 0xD800 && cp <= 0xDBFF && i + 2 < raw.size() && raw[i + 1] == '\\' &&
          raw[i + 2] == 'u' && read_hex4(raw, i + 3, low) && low >= 0xDC00 && low <= 0xDFFF) {
        cp = 0x10000 + ((cp - 0xD800) << 10U) + (low - 0xDC00);
        i += 6;
      }
      append_utf8(out, cp);
      break;
    }
    default:
      out.push_back(next);
      break;
    }
  }
  return out;
}

bool json_has_key(const std::string &json, const std::string &field) {
  return member_value(json, field) != std::string::npos;
}

std::optional<std::string> json_get_string(const std::string &json, const std::string &field) {
  const auto pos = member_value(json, field);
  if (pos == std::string::npos || json[pos] != '"') {
    return std::nullopt;
  }
  const auto end = string_end(json, pos);
  if (end == std::string::npos) {
    return std::nullopt;
  }
  return json_unescape(json.substr(pos + 1, end - pos - 1));
}

std::optional<std::uint32_t> json_get_u32(const std::string &json, const std::string &field) {
  const auto pos = member_value(json, field);
  if (pos == std::string::npos) {
    return std::nullopt;
  }
  std::uint32_t value = 0;
  const char *first = json.data() + pos;
  const char *last = json.data() + json.size();
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr == first) {
    return std::nullopt;
  }
  const auto next = skip_ws(json, static_cast<std::size_t>(ptr - json.data()));
  if (next >= json.size() || (json[next] != ',' && json[next] != '}')) {
    return std::nullopt;
  }
  return value;
}

std::optional<std::string> json_get_object(const std::string &json, const std::string &field) {
  const auto pos = member_value(json, field);
  if (pos == std::string::npos || json[pos] != '{') {
    return std::nullopt;
  }
  const auto end = closing_brace(json, pos);
  if (end == std::string::npos) {
    return std::nullopt;
  }
  return json.substr(pos, end - pos + 1);
}

} // namespace paramvault::common
