#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <vector>

namespace paramvault::crypto {

constexpr std::size_t KEY_SIZE = 32;

using Bytes = std::vector<unsigned char>;
using SecretKey = std::array<unsigned char, KEY_SIZE>;

void wipe(SecretKey &key);
void wipe(Bytes &bytes);
void wipe(std::string &text);

[[nodiscard]] Bytes to_bytes(const std::string &text);
[[nodiscard]] std::string to_string(const Bytes &bytes);

} // namespace paramvault::crypto
