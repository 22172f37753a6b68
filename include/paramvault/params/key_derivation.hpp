#pragma once

#include "paramvault/common/result.hpp"
#include "paramvault/crypto/kdf.hpp"
#include "paramvault/crypto/key.hpp"

#include <string>

namespace paramvault::params {

constexpr std::size_t SALT_SIZE = 16;
constexpr std::size_t CHALLENGE_SIZE = 64;

constexpr const char *KDF_ARGON2ID = "argon2id";
constexpr const char *KDF_SCRYPT = "scrypt";
constexpr const char *KDF_NONE = "none";

/// KEK from a passphrase. The passphrase is NFKC-normalized first so that
/// equivalent spellings (composed vs decomposed, full-width digits) agree.
[[nodiscard]] common::Result<crypto::SecretKey>
derive_password_kek(const std::string &password, const crypto::Bytes &salt,
                    const crypto::KdfParams &params);

/// KEK from the HMAC-SHA1 response of a hardware token.
[[nodiscard]] common::Result<crypto::SecretKey>
derive_token_kek(const crypto::Bytes &response, const crypto::Bytes &salt,
                 const crypto::KdfParams &params);

/// A keyring secret is already a uniformly random key; it only has to be the right size.
[[nodiscard]] common::Result<crypto::SecretKey> keyring_kek(const crypto::Bytes &secret);

} // namespace paramvault::params
