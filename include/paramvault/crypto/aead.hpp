#pragma once

#include "paramvault/common/result.hpp"
#include "paramvault/crypto/key.hpp"

#include <array>
#include <string>

namespace paramvault::crypto {

constexpr std::size_t NONCE_SIZE = 12;
constexpr std::size_t TAG_SIZE = 16;

using Nonce = std::array<unsigned char, NONCE_SIZE>;

[[nodiscard]] common::Result<Nonce> random_nonce();

// ChaCha20-Poly1305. The returned buffer is ciphertext followed by the tag.
[[nodiscard]] common::Result<Bytes> seal(const SecretKey &key, const Nonce &nonce,
                                         const Bytes &plaintext, const std::string &aad);

// Any failure, including a tag mismatch, is reported as AuthenticationFailed.
[[nodiscard]] common::Result<Bytes> open(const SecretKey &key, const Nonce &nonce,
                                         const Bytes &ciphertext_with_tag,
                                         const std::string &aad);

} // namespace paramvault::crypto
