#include "paramvault/params/unlock_record.hpp"

#include "paramvault/common/json_util.hpp"
#include "paramvault/crypto/encoding.hpp"
#include "paramvault/params/key_derivation.hpp"

#include <algorithm>
#include <optional>
#include <sstream>

namespace paramvault::params {

namespace {

common::Result<UnlockRecord> malformed(const std::string &detail) {
  return common::Result<UnlockRecord>::failure("unlock record is malformed: " + detail,
                                               common::ErrorCode::AuthenticationFailed);
}

std::string wrapped_to_json(const WrappedKey &key) {
  std::ostringstream out;
  out << "{\"nonce\":"
      << common::json_quote(crypto::base64_encode(key.nonce.data(), key.nonce.size()))
      << ",\"ciphertext\":" << common::json_quote(crypto::base64_encode(key.ciphertext)) << "}";
  return out.str();
}

// Decodes a base64 string member; absent, non-string and bad base64 are all false.
bool get_bytes(const std::string &json, const std::string &field, crypto::Bytes &out) {
  const auto text = common::json_get_string(json, field);
  if (!text.has_value()) {
    return false;
  }
  auto decoded = crypto::base64_decode(*text);
  if (!decoded.ok()) {
    return false;
  }
  out = std::move(decoded.value());
  return true;
}

bool parse_wrapped(const std::optional<std::string> &object, WrappedKey &out) {
  if (!object.has_value()) {
    return false;
  }
  crypto::Bytes nonce;
  if (!get_bytes(*object, "nonce", nonce) || nonce.size() != crypto::NONCE_SIZE) {
    return false;
  }
  crypto::Bytes ciphertext;
  if (!get_bytes(*object, "ciphertext", ciphertext) || ciphertext.size() < crypto::TAG_SIZE) {
    return false;
  }
  std::copy(nonce.begin(), nonce.end(), out.nonce.begin());
  out.ciphertext = std::move(ciphertext);
  return true;
}

} // namespace

std::string serialize_record(const UnlockRecord &record) {
  std::ostringstream out;
  out << "{\"kdf\":" << common::json_quote(record.kdf);
  out << ",\"salt\":" << common::json_quote(crypto::base64_encode(record.salt));
  out << ",\"kdf_time_cost\":" << record.kdf_params.time_cost;
  out << ",\"kdf_memory_cost\":" << record.kdf_params.memory_cost;
  out << ",\"kdf_block_size\":" << record.kdf_params.block_size;
  out << ",\"name_key\":" << wrapped_to_json(record.keys.name_key);
  out << ",\"value_key\":" << wrapped_to_json(record.keys.value_key);
  if (record.challenge.has_value()) {
    out << ",\"challenge\":" << common::json_quote(crypto::base64_encode(*record.challenge));
  }
  if (record.slot.has_value()) {
    out << ",\"slot\":" << *record.slot;
  }
  out << "}";
  return out.str();
}

common::Result<UnlockRecord> parse_record(const std::string &json) {
  UnlockRecord record;
  record.kdf = common::json_get_string(json, "kdf").value_or("");
  const auto algorithm = crypto::parse_kdf_algorithm(record.kdf);
  if (!algorithm && record.kdf != KDF_NONE) {
    return malformed("unknown kdf");
  }
  if (!get_bytes(json, "salt", record.salt)) {
    return malformed("salt");
  }

  if (algorithm) {
    const auto time_cost = common::json_get_u32(json, "kdf_time_cost");
    const auto memory_cost = common::json_get_u32(json, "kdf_memory_cost");
    const auto block_size = common::json_get_u32(json, "kdf_block_size");
    if (!time_cost || !memory_cost || !block_size) {
      return malformed("kdf costs");
    }
    record.kdf_params = crypto::KdfParams{.algorithm = *algorithm,
                                          .memory_cost = *memory_cost,
                                          .time_cost = *time_cost,
                                          .block_size = *block_size};
    if (!crypto::params_in_range(record.kdf_params)) {
      return malformed("kdf costs out of range");
    }
    if (record.salt.empty()) {
      return malformed("salt");
    }
  }

  if (!parse_wrapped(common::json_get_object(json, "name_key"), record.keys.name_key) ||
      !parse_wrapped(common::json_get_object(json, "value_key"), record.keys.value_key)) {
    return malformed("wrapped keys");
  }

  if (common::json_has_key(json, "challenge")) {
    crypto::Bytes challenge;
    if (!get_bytes(json, "challenge", challenge) || challenge.empty()) {
      return malformed("challenge");
    }
    record.challenge = std::move(challenge);
  }
  if (common::json_has_key(json, "slot")) {
    const auto slot = common::json_get_u32(json, "slot");
    if (!slot || (*slot != 1 && *slot != 2)) {
      return malformed("slot");
    }
    record.slot = *slot;
  }

  return common::Result<UnlockRecord>::success(std::move(record));
}

} // namespace paramvault::params
