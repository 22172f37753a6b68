#include "paramvault/crypto/aead.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

namespace paramvault::crypto {

namespace {

constexpr const char *DECRYPT_FAILED = "authentication failed";

common::Result<Bytes> open_failure() {
  return common::Result<Bytes>::failure(DECRYPT_FAILED, common::ErrorCode::AuthenticationFailed);
}

} // namespace

common::Result<Nonce> random_nonce() {
  Nonce nonce{};
  if (RAND_bytes(nonce.data(), static_cast<int>(nonce.size())) != 1) {
    return common::Result<Nonce>::failure("Failed to generate nonce");
  }
  return common::Result<Nonce>::success(nonce);
}

common::Result<Bytes> seal(const SecretKey &key, const Nonce &nonce, const Bytes &plaintext,
                           const std::string &aad) {
  EVP_CIPHER_CTX *ctx = EVP_CIPHER_CTX_new();
  if (ctx == nullptr) {
    return common::Result<Bytes>::failure("Failed to create cipher context");
  }

  Bytes ciphertext(plaintext.size() + TAG_SIZE);
  int out_len = 0;
  int total_len = 0;

  auto cleanup = [&ctx]() { EVP_CIPHER_CTX_free(ctx); };

  if (EVP_EncryptInit_ex(ctx, EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) != 1) {
    cleanup();
    return common::Result<Bytes>::failure("Encrypt init failed");
  }
  if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_SET_IVLEN, NONCE_SIZE, nullptr) != 1) {
    cleanup();
    return common::Result<Bytes>::failure("Failed to set nonce size");
  }
  if (EVP_EncryptInit_ex(ctx, nullptr, nullptr, key.data(), nonce.data()) != 1) {
    cleanup();
    return common::Result<Bytes>::failure("Failed to set key/nonce");
  }
  if (!aad.empty() &&
      EVP_EncryptUpdate(ctx, nullptr, &out_len, reinterpret_cast<const unsigned char *>(aad.data()),
                        static_cast<int>(aad.size())) != 1) {
    cleanup();
    return common::Result<Bytes>::failure("Failed to set associated data");
  }
  if (EVP_EncryptUpdate(ctx, ciphertext.data(), &out_len, plaintext.data(),
                        static_cast<int>(plaintext.size())) != 1) {
    cleanup();
    return common::Result<Bytes>::failure("Encrypt update failed");
  }
  total_len += out_len;

  if (EVP_EncryptFinal_ex(ctx, ciphertext.data() + total_len, &out_len) != 1) {
    cleanup();
    return common::Result<Bytes>::failure("Encrypt final failed");
  }
  total_len += out_len;

  std::array<unsigned char, TAG_SIZE> tag{};
  if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_GET_TAG, TAG_SIZE, tag.data()) != 1) {
    cleanup();
    return common::Result<Bytes>::failure("Failed to get tag");
  }

  cleanup();
  ciphertext.resize(static_cast<std::size_t>(total_len));
  ciphertext.insert(ciphertext.end(), tag.begin(), tag.end());
  return common::Result<Bytes>::success(std::move(ciphertext));
}

common::Result<Bytes> open(const SecretKey &key, const Nonce &nonce,
                           const Bytes &ciphertext_with_tag, const std::string &aad) {
  if (ciphertext_with_tag.size() < TAG_SIZE) {
    return open_failure();
  }

  const std::size_t data_size = ciphertext_with_tag.size() - TAG_SIZE;
  const unsigned char *tag = ciphertext_with_tag.data() + data_size;

  EVP_CIPHER_CTX *ctx = EVP_CIPHER_CTX_new();
  if (ctx == nullptr) {
    return common::Result<Bytes>::failure("Failed to create cipher context");
  }

  Bytes plaintext(data_size + TAG_SIZE);
  int out_len = 0;
  int total_len = 0;

  auto cleanup = [&ctx]() { EVP_CIPHER_CTX_free(ctx); };

  if (EVP_DecryptInit_ex(ctx, EVP_chacha20_poly1305(), nullptr, nullptr, nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_SET_IVLEN, NONCE_SIZE, nullptr) != 1 ||
      EVP_DecryptInit_ex(ctx, nullptr, nullptr, key.data(), nonce.data()) != 1) {
    cleanup();
    return open_failure();
  }
  if (!aad.empty() &&
      EVP_DecryptUpdate(ctx, nullptr, &out_len, reinterpret_cast<const unsigned char *>(aad.data()),
                        static_cast<int>(aad.size())) != 1) {
    cleanup();
    return open_failure();
  }
  if (EVP_DecryptUpdate(ctx, plaintext.data(), &out_len, ciphertext_with_tag.data(),
                        static_cast<int>(data_size)) != 1) {
    cleanup();
    return open_failure();
  }
  total_len += out_len;

  if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_AEAD_SET_TAG, TAG_SIZE,
                          const_cast<unsigned char *>(tag)) != 1) {
    cleanup();
    return open_failure();
  }

  if (EVP_DecryptFinal_ex(ctx, plaintext.data() + total_len, &out_len) != 1) {
    cleanup();
    wipe(plaintext);
    return open_failure();
  }
  total_len += out_len;

  cleanup();
  plaintext.resize(static_cast<std::size_t>(total_len));
  return common::Result<Bytes>::success(std::move(plaintext));
}

} // namespace paramvault::crypto
