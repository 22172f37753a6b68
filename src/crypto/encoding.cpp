#include "paramvault/crypto/encoding.hpp"

#include <openssl/evp.h>

namespace paramvault::crypto {

namespace {

int hex_nibble(const char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

} // namespace

std::string base64_encode(const unsigned char *data, const std::size_t size) {
  if (size == 0) {
    return "";
  }
  const int output_len = 4 * static_cast<int>((size + 2) / 3);
  std::string output(static_cast<std::size_t>(output_len), '\0');
  EVP_EncodeBlock(reinterpret_cast<unsigned char *>(output.data()), data, static_cast<int>(size));
  return output;
}

std::string base64_encode(const Bytes &bytes) { return base64_encode(bytes.data(), bytes.size()); }

common::Result<Bytes> base64_decode(const std::string &text) {
  if (text.empty()) {
    return common::Result<Bytes>::success({});
  }
  if (text.size() % 4 != 0) {
    return common::Result<Bytes>::failure("Invalid base64 input", common::ErrorCode::InvalidArgument);
  }

  Bytes decoded(text.size());
  const int len = EVP_DecodeBlock(decoded.data(), reinterpret_cast<const unsigned char *>(text.data()),
                                  static_cast<int>(text.size()));
  if (len < 0) {
    return common::Result<Bytes>::failure("Invalid base64 input", common::ErrorCode::InvalidArgument);
  }

  // EVP_DecodeBlock counts padding characters as zero bytes.
  std::size_t padding = 0;
  if (text.back() == '=') {
    ++padding;
  }
  if (text.size() > 1 && text[text.size() - 2] == '=') {
    ++padding;
  }

  decoded.resize(static_cast<std::size_t>(len) - padding);
  return common::Result<Bytes>::success(std::move(decoded));
}

std::string hex_encode(const Bytes &bytes) {
  static constexpr char DIGITS[] = "0123456789abcdef";
  std::string out;
  out.reserve(bytes.size() * 2);
  for (const unsigned char byte : bytes) {
    out.push_back(DIGITS[byte >> 4U]);
    out.push_back(DIGITS[byte & 0x0FU]);
  }
  return out;
}

common::Result<Bytes> hex_decode(const std::string &text) {
  if (text.size() % 2 != 0) {
    return common::Result<Bytes>::failure("hex input has odd length",
                                          common::ErrorCode::InvalidArgument);
  }
  Bytes out;
  out.reserve(text.size() / 2);
  for (std::size_t i = 0; i < text.size(); i += 2) {
    const int high = hex_nibble(text[i]);
    const int low = hex_nibble(text[i + 1]);
    if (high < 0 || low < 0) {
      return common::Result<Bytes>::failure("invalid hex digit",
                                            common::ErrorCode::InvalidArgument);
    }
    out.push_back(static_cast<unsigned char>((high << 4) | low));
  }
  return common::Result<Bytes>::success(std::move(out));
}

} // namespace paramvault::crypto
