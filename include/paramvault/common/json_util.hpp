#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace paramvault::common {

/// Escape a string for embedding inside a JSON string literal. Control characters
/// without a short form are written as \u00XX; bytes >= 0x80 pass through as UTF-8.
[[nodiscard]] std::string json_escape(const std::string &value);

/// The complete JSON string literal for value, including the surrounding quotes.
[[nodiscard]] std::string json_quote(const std::string &value);

/// Unescape the body of a JSON string literal (short escapes and \uXXXX).
[[nodiscard]] std::string json_unescape(const std::string &raw);

// Field accessors for flat records. They look only at members of the outermost
// object, so a key nested inside a member value never matches.

[[nodiscard]] bool json_has_key(const std::string &json, const std::string &field);
[[nodiscard]] std::optional<std::string> json_get_string(const std::string &json,
                                                         const std::string &field);
[[nodiscard]] std::optional<std::uint32_t> json_get_u32(const std::string &json,
                                                        const std::string &field);
/// The member's object text, braces included.
[[nodiscard]] std::optional<std::string> json_get_object(const std::string &json,
                                                         const std::string &field);

} // namespace paramvault::common
