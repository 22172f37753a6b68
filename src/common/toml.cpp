#include "paramvault/common/toml.hpp"

#include "paramvault/common/fs.hpp"

#include <charconv>
#include <sstream>

namespace paramvault::common {

namespace {

template <typename T> Result<T> type_error(const std::string &key, const TomlValue &value,
                                           const std::string &expected) {
  return Result<T>::failure("line " + std::to_string(value.line) + ": " + key + " must be " +
                                expected,
                            ErrorCode::InvalidArgument);
}

// Index one past the closing quote of the string opening at `open`, or npos.
std::size_t string_end(const std::string &text, const std::size_t open) {
  const char quote = text[open];
  for (std::size_t i = open + 1; i < text.size(); ++i) {
    if (quote == '"' && text[i] == '\\') {
      ++i;
      continue;
    }
    if (text[i] == quote) {
      return i + 1;
    }
  }
  return std::string::npos;
}

// Drops a trailing "# comment" that is not inside a string. Fails on an
// unterminated string.
bool strip_comment(const std::string &line, std::string &out) {
  std::size_t i = 0;
  while (i < line.size()) {
    if (line[i] == '"' || line[i] == '\'') {
      const auto end = string_end(line, i);
      if (end == std::string::npos) {
        return false;
      }
      i = end;
      continue;
    }
    if (line[i] == '#') {
      break;
    }
    ++i;
  }
  out = line.substr(0, i);
  return true;
}

bool decode_string(const std::string &raw, std::string &out) {
  if (raw.size() < 2 || raw.front() != raw.back() || (raw.front() != '"' && raw.front() != '\'')) {
    return false;
  }
  if (string_end(raw, 0) != raw.size()) {
    return false;
  }
  const std::string body = raw.substr(1, raw.size() - 2);
  if (raw.front() == '\'') {
    out = body;
    return true;
  }

  out.clear();
  for (std::size_t i = 0; i < body.size(); ++i) {
    if (body[i] != '\\') {
      out.push_back(body[i]);
      continue;
    }
    switch (body[++i]) {
    case 'n':
      out.push_back('\n');
      break;
    case 't':
      out.push_back('\t');
      break;
    case '"':
    case '\\':
      out.push_back(body[i]);
      break;
    default:
      return false;
    }
  }
  return true;
}

} // namespace

Result<std::string> TomlDocument::get_string(const std::string &key,
                                             const std::string &fallback) const {
  const auto it = values_.find(key);
  if (it == values_.end()) {
    return Result<std::string>::success(fallback);
  }
  std::string decoded;
  if (!decode_string(it->second.raw, decoded)) {
    return type_error<std::string>(key, it->second, "a quoted string");
  }
  return Result<std::string>::success(std::move(decoded));
}

Result<bool> TomlDocument::get_bool(const std::string &key, const bool fallback) const {
  const auto it = values_.find(key);
  if (it == values_.end()) {
    return Result<bool>::success(fallback);
  }
  if (it->second.raw == "true") {
    return Result<bool>::success(true);
  }
  if (it->second.raw == "false") {
    return Result<bool>::success(false);
  }
  return type_error<bool>(key, it->second, "true or false");
}

Result<std::uint32_t> TomlDocument::get_u32(const std::string &key,
                                            const std::uint32_t fallback) const {
  const auto it = values_.find(key);
  if (it == values_.end()) {
    return Result<std::uint32_t>::success(fallback);
  }
  const std::string &raw = it->second.raw;
  std::uint32_t parsed = 0;
  const auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), parsed);
  if (ec != std::errc() || ptr != raw.data() + raw.size()) {
    return type_error<std::uint32_t>(key, it->second, "a non-negative integer");
  }
  return Result<std::uint32_t>::success(parsed);
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string section;
  std::size_t line_number = 0;

  const auto fail = [&line_number](const std::string &message) {
    return Result<TomlDocument>::failure("line " + std::to_string(line_number) + ": " + message,
                                         ErrorCode::InvalidArgument);
  };

  while (std::getline(stream, line)) {
    ++line_number;
    std::string uncommented;
    if (!strip_comment(line, uncommented)) {
      return fail("unterminated string");
    }
    const std::string text = trim(uncommented);
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

    const auto equals = text.find('=');
    if (equals == std::string::npos) {
      return fail("expected key = value");
    }
    const std::string key = trim(text.substr(0, equals));
    const std::string value = trim(text.substr(equals + 1));
    if (key.empty() || value.empty()) {
      return fail("expected key = value");
    }

    const std::string full_key = section.empty() ? key : section + "." + key;
    const auto [it, inserted] =
        document.values_.emplace(full_key, TomlValue{.raw = value, .line = line_number});
    if (!inserted) {
      return fail(full_key + " is defined twice (first on line " +
                  std::to_string(it->second.line) + ")");
    }
  }

  return Result<TomlDocument>::success(std::move(document));
}

} // namespace paramvault::common
