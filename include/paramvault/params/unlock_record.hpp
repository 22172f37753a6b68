#pragma once

#include "paramvault/common/result.hpp"
#include "paramvault/crypto/kdf.hpp"
#include "paramvault/params/key_wrap.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace paramvault::params {

/// Persisted form of one unlock method: how to rebuild its KEK and the keys it wraps.
struct UnlockRecord {
  /// "argon2id" or "scrypt" for derived KEKs, "none" for keyring secrets.
  std::string kdf = "scrypt";
  crypto::Bytes salt;
  /// Meaningful unless kdf is "none"; its algorithm matches kdf.
  crypto::KdfParams kdf_params;
  WrappedKeys keys;
  /// Hardware token only.
  std::optional<crypto::Bytes> challenge;
  std::optional<std::uint32_t> slot;
};

[[nodiscard]] std::string serialize_record(const UnlockRecord &record);

/// Malformed or out-of-range records fail with AuthenticationFailed; a record
/// that cannot be trusted is indistinguishable from a tampered one.
[[nodiscard]] common::Result<UnlockRecord> parse_record(const std::string &json);

} // namespace paramvault::params
