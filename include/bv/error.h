#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace bv {
  enum class ErrorDomain : std::uint16_t {
    Security = 0x01,
    IO = 0x02,
    Crypto = 0x03,
    Validation = 0x04,
    Config = 0x05,
    Internal = 0x7F
  };

  // Each domain reserves a span of codes to avoid collisions with propagated
  // platform error numbers. Codes inside the reserved range are stable across
  // releases.
  inline constexpr int kErrorDomainSpan = 0x0100;

  inline constexpr int ErrorDomainBase(ErrorDomain domain) {
    switch (domain) {
    case ErrorDomain::Security:
      return 0x0100;
    case ErrorDomain::IO:
      return 0x0200;
    case ErrorDomain::Crypto:
      return 0x0300;
    case ErrorDomain::Validation:
      return 0x0400;
    case ErrorDomain::Config:
      return 0x0500;
    case ErrorDomain::Internal:
      return 0x7F00;
    }
    return 0; // unreachable but placates compilers without warnings enabled
  }

  inline constexpr int ErrorDomainMax(ErrorDomain domain) {
    return ErrorDomainBase(domain) + kErrorDomainSpan - 1;
  }

  inline constexpr bool IsFrameworkErrorCode(ErrorDomain domain, int code) {
    return code >= ErrorDomainBase(domain) && code <= ErrorDomainMax(domain);
  }

  enum class Retryability : std::uint8_t {
    kFatal = 0,
    kTransient,
    kRetryable
  };

  namespace errors {
    inline constexpr int Make(ErrorDomain domain, int offset) {
      return ErrorDomainBase(domain) + offset;
    }

    namespace io {
      inline constexpr int kBaseDirUnresolvable = Make(ErrorDomain::IO, 0x01);
      inline constexpr int kLogDirectoryUnavailable = Make(ErrorDomain::IO, 0x02);
    } // namespace io

    namespace validation {
      inline constexpr int kBookmarkNameEmpty = Make(ErrorDomain::Validation, 0x01);
      inline constexpr int kBookmarkNameTooLong = Make(ErrorDomain::Validation, 0x02);
      inline constexpr int kBookmarkNameCharset = Make(ErrorDomain::Validation, 0x03);
      inline constexpr int kProfileNameTooLong = Make(ErrorDomain::Validation, 0x04);
      inline constexpr int kProfileNameCharset = Make(ErrorDomain::Validation, 0x05);
      inline constexpr int kBucketNameLength = Make(ErrorDomain::Validation, 0x06);
      inline constexpr int kBucketNameFormat = Make(ErrorDomain::Validation, 0x07);
      inline constexpr int kPathTooLong = Make(ErrorDomain::Validation, 0x08);
    } // namespace validation

    namespace security {
      inline constexpr int kPathTraversal = Make(ErrorDomain::Security, 0x01);
      inline constexpr int kSystemPathDenied = Make(ErrorDomain::Security, 0x02);
    } // namespace security

    namespace crypto {
      inline constexpr int kDigestFailed = Make(ErrorDomain::Crypto, 0x01);
    } // namespace crypto

  } // namespace errors

  struct Error : public std::runtime_error {
    ErrorDomain domain;
    int code;
    std::optional<int> native_code;
    Retryability retryability{Retryability::kFatal};
    std::vector<std::string> context;
    explicit Error(ErrorDomain d, int c, std::string msg,
                   std::optional<int> native = std::nullopt,
                   Retryability retry = Retryability::kFatal,
                   std::vector<std::string> ctx = {})
        : std::runtime_error(std::move(msg)),
          domain(d),
          code(c),
          native_code(native),
          retryability(retry),
          context(std::move(ctx)) {}
  };
} // namespace bv
