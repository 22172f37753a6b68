#include "paramvault/common/fs.hpp"

#include <cctype>
#include <cstdlib>

#include <pwd.h>
#include <unistd.h>

namespace paramvault::common {

namespace {

constexpr std::string_view WHITESPACE = " \t\r\n\f\v";

bool is_var_char(const char ch, const bool first) {
  const auto c = static_cast<unsigned char>(ch);
  return std::isalpha(c) != 0 || ch == '_' || (!first && std::isdigit(c) != 0);
}

std::string env_or_empty(const std::string &name) {
  const char *value = std::getenv(name.c_str());
  return value == nullptr ? std::string() : std::string(value);
}

} // namespace

std::string trim(const std::string_view input) {
  const auto first = input.find_first_not_of(WHITESPACE);
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = input.find_last_not_of(WHITESPACE);
  return std::string(input.substr(first, last - first + 1));
}

bool starts_with(const std::string_view value, const std::string_view prefix) {
  return value.substr(0, prefix.size()) == prefix;
}

std::string to_lower(std::string value) {
  for (auto &ch : value) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  return value;
}

Result<std::filesystem::path> home_dir() {
  if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    return Result<std::filesystem::path>::success(std::filesystem::path(home));
  }
  if (const passwd *entry = getpwuid(getuid()); entry != nullptr && entry->pw_dir != nullptr) {
    return Result<std::filesystem::path>::success(std::filesystem::path(entry->pw_dir));
  }
  return Result<std::filesystem::path>::failure("unable to determine home directory",
                                                ErrorCode::InvalidArgument);
}

Status ensure_private_dir(const std::filesystem::path &path) {
  std::error_code ec;
  if (std::filesystem::is_directory(path, ec)) {
    return Status::success();
  }
  std::filesystem::create_directories(path, ec);
  if (ec) {
    return Status::error("cannot create " + path.string() + ": " + ec.message(),
                         ErrorCode::StorageError);
  }
  std::filesystem::permissions(path, std::filesystem::perms::owner_all,
                               std::filesystem::perm_options::replace, ec);
  if (ec) {
    return Status::error("cannot restrict " + path.string() + ": " + ec.message(),
                         ErrorCode::StorageError);
  }
  return Status::success();
}

std::string expand_path(const std::string_view value) {
  std::string out;
  out.reserve(value.size());

  std::size_t i = 0;
  if (!value.empty() && value[0] == '~' && (value.size() == 1 || value[1] == '/')) {
    if (const auto home = home_dir(); home.ok()) {
      out = home.value().string();
      i = 1;
    }
  }

  while (i < value.size()) {
    if (value[i] != '$' || i + 1 >= value.size()) {
      out.push_back(value[i++]);
      continue;
    }
    if (value[i + 1] == '{') {
      const auto close = value.find('}', i + 2);
      if (close == std::string_view::npos) {
        out.append(value.substr(i));
        break;
      }
      out += env_or_empty(std::string(value.substr(i + 2, close - i - 2)));
      i = close + 1;
      continue;
    }
    std::size_t end = i + 1;
    while (end < value.size() && is_var_char(value[end], end == i + 1)) {
      ++end;
    }
    if (end == i + 1) {
      out.push_back(value[i++]);
      continue;
    }
    out += env_or_empty(std::string(value.substr(i + 1, end - i - 1)));
    i = end;
  }
  return out;
}

} // namespace paramvault::common
