#pragma once

#include "paramvault/common/result.hpp"
#include "paramvault/crypto/key.hpp"

#include <string>

namespace paramvault::params {

struct SecretPair {
  std::string name;
  std::string value;
};

/// Lookup key for a secret name: keyed BLAKE2b-256 of the name's JSON string
/// literal, lowercase hex. Deterministic for a given NameKey.
[[nodiscard]] common::Result<std::string> digest(const crypto::SecretKey &name_key,
                                                 const std::string &name);

/// base64(nonce || ChaCha20-Poly1305(pair)) with the digest as associated data.
/// The pair is 0x01 || u32_be(name length) || name || value.
[[nodiscard]] common::Result<std::string> encode(const crypto::SecretKey &value_key,
                                                 const std::string &digest,
                                                 const std::string &name,
                                                 const std::string &value);

/// Every failure is AuthenticationFailed.
[[nodiscard]] common::Result<SecretPair> decode(const crypto::SecretKey &value_key,
                                                const std::string &digest,
                                                const std::string &ciphertext);

} // namespace paramvault::params
