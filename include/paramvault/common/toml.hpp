#pragma once

#include "paramvault/common/result.hpp"

#include <cstdint>
#include <map>
#include <string>

namespace paramvault::common {

struct TomlValue {
  std::string raw;
  std::size_t line = 0;
};

/// The flat subset of TOML used for configuration: "[section]" headers and
/// "key = value" lines with string, boolean and integer values. Section names are
/// folded into dotted keys ("[kdf] profile" is "kdf.profile").
///
/// Getters return the fallback for absent keys and InvalidArgument, naming the
/// line, when a present value has the wrong type.
class TomlDocument {
public:
  [[nodiscard]] Result<std::string> get_string(const std::string &key,
                                               const std::string &fallback) const;
  [[nodiscard]] Result<bool> get_bool(const std::string &key, bool fallback) const;
  [[nodiscard]] Result<std::uint32_t> get_u32(const std::string &key,
                                               std::uint32_t fallback) const;

  [[nodiscard]] bool contains(const std::string &key) const { return values_.contains(key); }
  [[nodiscard]] std::size_t size() const { return values_.size(); }

private:
  friend Result<TomlDocument> parse_toml(const std::string &content);

  std::map<std::string, TomlValue> values_;
};

/// Rejects malformed lines, unterminated strings and keys defined twice.
[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);

} // namespace paramvault::common
