#include "paramvault/params/key_derivation.hpp"

#include "paramvault/crypto/unicode.hpp"
#include "paramvault/observability/global.hpp"

#include <algorithm>
#include <chrono>

namespace paramvault::params {

namespace {

common::Result<crypto::SecretKey> timed_derive(const crypto::Bytes &secret,
                                               const crypto::Bytes &salt,
                                               const crypto::KdfParams &params) {
  const auto started = std::chrono::steady_clock::now();
  auto key = crypto::derive_key(secret, salt, params);
  observability::record_kdf_duration(std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started));
  return key;
}

} // namespace

common::Result<crypto::SecretKey> derive_password_kek(const std::string &password,
                                                      const crypto::Bytes &salt,
                                                      const crypto::KdfParams &params) {
  auto normalized = crypto::normalize_nfkc(password);
  if (!normalized.ok()) {
    return common::Result<crypto::SecretKey>::failure(normalized.error(), normalized.code());
  }
  crypto::Bytes secret = crypto::to_bytes(normalized.value());
  crypto::wipe(normalized.value());
  auto key = timed_derive(secret, salt, params);
  crypto::wipe(secret);
  return key;
}

common::Result<crypto::SecretKey> derive_token_kek(const crypto::Bytes &response,
                                                   const crypto::Bytes &salt,
                                                   const crypto::KdfParams &params) {
  if (response.empty()) {
    return common::Result<crypto::SecretKey>::failure("hardware token returned an empty response",
                                                      common::ErrorCode::DeviceUnavailable);
  }
  return timed_derive(response, salt, params);
}

common::Result<crypto::SecretKey> keyring_kek(const crypto::Bytes &secret) {
  if (secret.size() != crypto::KEY_SIZE) {
    return common::Result<crypto::SecretKey>::failure("keyring secret has the wrong size",
                                                      common::ErrorCode::AuthenticationFailed);
  }
  crypto::SecretKey key{};
  std::copy(secret.begin(), secret.end(), key.begin());
  return common::Result<crypto::SecretKey>::success(key);
}

} // namespace paramvault::params
