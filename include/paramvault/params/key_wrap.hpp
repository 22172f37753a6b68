#pragma once

#include "paramvault/common/result.hpp"
#include "paramvault/crypto/aead.hpp"
#include "paramvault/crypto/key.hpp"

namespace paramvault::params {

/// NameKey and ValueKey. Wiped on destruction.
struct KeyPair {
  crypto::SecretKey name_key{};
  crypto::SecretKey value_key{};

  KeyPair() = default;
  KeyPair(const KeyPair &) = default;
  KeyPair &operator=(const KeyPair &) = default;
  ~KeyPair();
};

struct WrappedKey {
  crypto::Nonce nonce{};
  crypto::Bytes ciphertext;
};

struct WrappedKeys {
  WrappedKey name_key;
  WrappedKey value_key;
};

[[nodiscard]] common::Result<KeyPair> generate_key_pair();

/// Seals each key under the KEK with its own nonce. The role name is bound as
/// associated data so the two ciphertexts cannot be swapped.
[[nodiscard]] common::Result<WrappedKeys> wrap_keys(const crypto::SecretKey &kek,
                                                    const KeyPair &keys);

/// AuthenticationFailed on a wrong KEK, tampering, or a plaintext of the wrong size.
[[nodiscard]] common::Result<KeyPair> unwrap_keys(const crypto::SecretKey &kek,
                                                  const WrappedKeys &wrapped);

} // namespace paramvault::params
