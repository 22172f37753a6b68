#include "paramvault/params/record_codec.hpp"

#include "paramvault/common/json_util.hpp"
#include "paramvault/crypto/aead.hpp"
#include "paramvault/crypto/encoding.hpp"
#include "paramvault/crypto/mac.hpp"

#include <algorithm>
#include <cstdint>

namespace paramvault::params {

namespace {

constexpr unsigned char PAIR_VERSION = 0x01;
constexpr std::size_t PAIR_HEADER_SIZE = 5;

common::Result<SecretPair> decode_failure() {
  return common::Result<SecretPair>::failure("authentication failed",
                                             common::ErrorCode::AuthenticationFailed);
}

crypto::Bytes encode_pair(const std::string &name, const std::string &value) {
  const auto length = static_cast<std::uint32_t>(name.size());
  crypto::Bytes out;
  out.reserve(PAIR_HEADER_SIZE + name.size() + value.size());
  out.push_back(PAIR_VERSION);
  out.push_back(static_cast<unsigned char>((length >> 24U) & 0xFFU));
  out.push_back(static_cast<unsigned char>((length >> 16U) & 0xFFU));
  out.push_back(static_cast<unsigned char>((length >> 8U) & 0xFFU));
  out.push_back(static_cast<unsigned char>(length & 0xFFU));
  out.insert(out.end(), name.begin(), name.end());
  out.insert(out.end(), value.begin(), value.end());
  return out;
}

bool decode_pair(const crypto::Bytes &plaintext, SecretPair &out) {
  if (plaintext.size() < PAIR_HEADER_SIZE || plaintext[0] != PAIR_VERSION) {
    return false;
  }
  const std::uint32_t length = (static_cast<std::uint32_t>(plaintext[1]) << 24U) |
                               (static_cast<std::uint32_t>(plaintext[2]) << 16U) |
                               (static_cast<std::uint32_t>(plaintext[3]) << 8U) |
                               static_cast<std::uint32_t>(plaintext[4]);
  if (length > plaintext.size() - PAIR_HEADER_SIZE) {
    return false;
  }
  const auto *data = reinterpret_cast<const char *>(plaintext.data());
  out.name.assign(data + PAIR_HEADER_SIZE, length);
  out.value.assign(data + PAIR_HEADER_SIZE + length,
                   plaintext.size() - PAIR_HEADER_SIZE - length);
  return true;
}

} // namespace

common::Result<std::string> digest(const crypto::SecretKey &name_key, const std::string &name) {
  auto mac = crypto::blake2b_mac(name_key, common::json_quote(name));
  if (!mac.ok()) {
    return common::Result<std::string>::failure(mac.error(), mac.code());
  }
  return common::Result<std::string>::success(crypto::hex_encode(mac.value()));
}

common::Result<std::string> encode(const crypto::SecretKey &value_key, const std::string &digest,
                                   const std::string &name, const std::string &value) {
  if (name.size() > 0xFFFFFFFFULL) {
    return common::Result<std::string>::failure("secret name is too long",
                                                common::ErrorCode::InvalidArgument);
  }
  auto nonce = crypto::random_nonce();
  if (!nonce.ok()) {
    return common::Result<std::string>::failure(nonce.error(), nonce.code());
  }

  crypto::Bytes plaintext = encode_pair(name, value);
  auto sealed = crypto::seal(value_key, nonce.value(), plaintext, digest);
  crypto::wipe(plaintext);
  if (!sealed.ok()) {
    return common::Result<std::string>::failure(sealed.error(), sealed.code());
  }

  crypto::Bytes blob(nonce.value().begin(), nonce.value().end());
  blob.insert(blob.end(), sealed.value().begin(), sealed.value().end());
  return common::Result<std::string>::success(crypto::base64_encode(blob));
}

common::Result<SecretPair> decode(const crypto::SecretKey &value_key, const std::string &digest,
                                  const std::string &ciphertext) {
  const auto blob = crypto::base64_decode(ciphertext);
  if (!blob.ok() || blob.value().size() < crypto::NONCE_SIZE + crypto::TAG_SIZE) {
    return decode_failure();
  }

  crypto::Nonce nonce{};
  std::copy_n(blob.value().begin(), crypto::NONCE_SIZE, nonce.begin());
  const crypto::Bytes sealed(blob.value().begin() + static_cast<std::ptrdiff_t>(crypto::NONCE_SIZE),
                             blob.value().end());

  auto opened = crypto::open(value_key, nonce, sealed, digest);
  if (!opened.ok()) {
    return decode_failure();
  }

  SecretPair pair;
  const bool parsed = decode_pair(opened.value(), pair);
  crypto::wipe(opened.value());
  if (!parsed) {
    return decode_failure();
  }
  return common::Result<SecretPair>::success(std::move(pair));
}

} // namespace paramvault::params
