#include "paramvault/crypto/unicode.hpp"

#include <unicode/normalizer2.h>
#include <unicode/unistr.h>
#include <unicode/ustring.h>

namespace paramvault::crypto {

common::Result<std::string> normalize_nfkc(const std::string &utf8) {
  if (utf8.empty()) {
    return common::Result<std::string>::success("");
  }

  UErrorCode status = U_ZERO_ERROR;
  const icu::Normalizer2 *nfkc = icu::Normalizer2::getNFKCInstance(status);
  if (U_FAILURE(status) || nfkc == nullptr) {
    return common::Result<std::string>::failure(std::string("ICU NFKC unavailable: ") +
                                                u_errorName(status));
  }

  int32_t length = 0;
  status = U_ZERO_ERROR;
  u_strFromUTF8(nullptr, 0, &length, utf8.data(), static_cast<int32_t>(utf8.size()), &status);
  if (status != U_BUFFER_OVERFLOW_ERROR && U_FAILURE(status)) {
    return common::Result<std::string>::failure("input is not valid UTF-8",
                                                common::ErrorCode::InvalidArgument);
  }

  icu::UnicodeString source;
  UChar *buffer = source.getBuffer(length);
  if (buffer == nullptr) {
    return common::Result<std::string>::failure("Failed to allocate UTF-16 buffer");
  }
  int32_t written = 0;
  status = U_ZERO_ERROR;
  u_strFromUTF8(buffer, length, &written, utf8.data(), static_cast<int32_t>(utf8.size()), &status);
  source.releaseBuffer(U_SUCCESS(status) ? written : 0);
  if (U_FAILURE(status)) {
    return common::Result<std::string>::failure("input is not valid UTF-8",
                                                common::ErrorCode::InvalidArgument);
  }

  status = U_ZERO_ERROR;
  const icu::UnicodeString normalized = nfkc->normalize(source, status);
  if (U_FAILURE(status)) {
    return common::Result<std::string>::failure(std::string("NFKC normalization failed: ") +
                                                u_errorName(status));
  }

  std::string out;
  normalized.toUTF8String(out);
  return common::Result<std::string>::success(std::move(out));
}

} // namespace paramvault::crypto
