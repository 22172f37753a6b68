#include "paramvault/params/key_wrap.hpp"

#include "paramvault/crypto/random.hpp"

#include <algorithm>

namespace paramvault::params {

namespace {

constexpr const char *NAME_KEY_AAD = "name_key";
constexpr const char *VALUE_KEY_AAD = "value_key";

common::Result<WrappedKey> wrap_one(const crypto::SecretKey &kek, const crypto::SecretKey &key,
                                    const std::string &role) {
  auto nonce = crypto::random_nonce();
  if (!nonce.ok()) {
    return common::Result<WrappedKey>::failure(nonce.error(), nonce.code());
  }
  crypto::Bytes plaintext(key.begin(), key.end());
  auto sealed = crypto::seal(kek, nonce.value(), plaintext, role);
  crypto::wipe(plaintext);
  if (!sealed.ok()) {
    return common::Result<WrappedKey>::failure(sealed.error(), sealed.code());
  }
  return common::Result<WrappedKey>::success(
      WrappedKey{.nonce = nonce.value(), .ciphertext = std::move(sealed.value())});
}

common::Status unwrap_one(const crypto::SecretKey &kek, const WrappedKey &wrapped,
                          const std::string &role, crypto::SecretKey &out) {
  auto opened = crypto::open(kek, wrapped.nonce, wrapped.ciphertext, role);
  if (!opened.ok() || opened.value().size() != crypto::KEY_SIZE) {
    if (opened.ok()) {
      crypto::wipe(opened.value());
    }
    return common::Status::error("authentication failed", common::ErrorCode::AuthenticationFailed);
  }
  std::copy(opened.value().begin(), opened.value().end(), out.begin());
  crypto::wipe(opened.value());
  return common::Status::success();
}

} // namespace

KeyPair::~KeyPair() {
  crypto::wipe(name_key);
  crypto::wipe(value_key);
}

common::Result<KeyPair> generate_key_pair() {
  auto name_key = crypto::generate_key();
  if (!name_key.ok()) {
    return common::Result<KeyPair>::failure(name_key.error(), name_key.code());
  }
  auto value_key = crypto::generate_key();
  if (!value_key.ok()) {
    return common::Result<KeyPair>::failure(value_key.error(), value_key.code());
  }
  KeyPair keys;
  keys.name_key = name_key.value();
  keys.value_key = value_key.value();
  crypto::wipe(name_key.value());
  crypto::wipe(value_key.value());
  return common::Result<KeyPair>::success(keys);
}

common::Result<WrappedKeys> wrap_keys(const crypto::SecretKey &kek, const KeyPair &keys) {
  auto name = wrap_one(kek, keys.name_key, NAME_KEY_AAD);
  if (!name.ok()) {
    return common::Result<WrappedKeys>::failure(name.error(), name.code());
  }
  auto value = wrap_one(kek, keys.value_key, VALUE_KEY_AAD);
  if (!value.ok()) {
    return common::Result<WrappedKeys>::failure(value.error(), value.code());
  }
  return common::Result<WrappedKeys>::success(
      WrappedKeys{.name_key = std::move(name.value()), .value_key = std::move(value.value())});
}

common::Result<KeyPair> unwrap_keys(const crypto::SecretKey &kek, const WrappedKeys &wrapped) {
  KeyPair keys;
  auto status = unwrap_one(kek, wrapped.name_key, NAME_KEY_AAD, keys.name_key);
  if (!status.ok()) {
    return common::Result<KeyPair>::failure(status.error(), status.code());
  }
  status = unwrap_one(kek, wrapped.value_key, VALUE_KEY_AAD, keys.value_key);
  if (!status.ok()) {
    return common::Result<KeyPair>::failure(status.error(), status.code());
  }
  return common::Result<KeyPair>::success(keys);
}

} // namespace paramvault::params
