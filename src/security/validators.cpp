#include "bv/security/validators.h"

#include <string>
#include <string_view>

#include "bv/error.h"
#include "bv/errors.h"

namespace bv::security {
namespace {

bool IsAsciiDigit(unsigned char ch) noexcept { return ch >= '0' && ch <= '9'; }

bool IsAsciiLower(unsigned char ch) noexcept { return ch >= 'a' && ch <= 'z'; }

bool IsAsciiAlnum(unsigned char ch) noexcept {
  return IsAsciiDigit(ch) || IsAsciiLower(ch) || (ch >= 'A' && ch <= 'Z');
}

bool IsWordChar(unsigned char ch) noexcept { return IsAsciiAlnum(ch) || ch == '_'; }

// Horizontal tab, newline, form feed, carriage return and space. Vertical tab
// is not whitespace for bookmark names.
bool IsBookmarkWhitespace(unsigned char ch) noexcept {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\f' || ch == '\r';
}

bool IsBookmarkChar(unsigned char ch) noexcept {
  return IsWordChar(ch) || IsBookmarkWhitespace(ch) || ch == '.' || ch == '/' || ch == '-';
}

bool IsProfileChar(unsigned char ch) noexcept {
  return IsAsciiAlnum(ch) || ch == '_' || ch == '-';
}

bool IsBucketEdgeChar(unsigned char ch) noexcept { return IsAsciiLower(ch) || IsAsciiDigit(ch); }

bool IsBucketInteriorChar(unsigned char ch) noexcept {
  return IsBucketEdgeChar(ch) || ch == '.' || ch == '-';
}

template <class Predicate>
bool AllOf(std::string_view text, Predicate predicate) noexcept {
  for (unsigned char ch : text) {
    if (!predicate(ch)) {
      return false;
    }
  }
  return true;
}

struct RejectionCode {
  int code;
  std::string_view message;
};

[[noreturn]] void ThrowRejection(int code, std::string_view message) {
  throw bv::Error{bv::ErrorDomain::Validation, code, std::string(message)};
}

}  // namespace

ValidationResult CheckBookmarkName(std::string_view name) noexcept {
  if (name.empty()) {
    return ValidationResult::kEmpty;
  }
  if (name.size() > kMaxBookmarkNameLen) {
    return ValidationResult::kTooLong;
  }
  if (!AllOf(name, IsBookmarkChar)) {
    return ValidationResult::kInvalidCharacters;
  }
  return ValidationResult::kOk;
}

ValidationResult CheckProfileName(std::string_view name) noexcept {
  if (name.empty()) {
    return ValidationResult::kOk;
  }
  if (name.size() > kMaxProfileNameLen) {
    return ValidationResult::kTooLong;
  }
  if (!AllOf(name, IsProfileChar)) {
    return ValidationResult::kInvalidCharacters;
  }
  return ValidationResult::kOk;
}

ValidationResult CheckBucketName(std::string_view name) noexcept {
  if (name.empty()) {
    return ValidationResult::kOk;
  }
  if (name.size() < kMinBucketNameLen) {
    return ValidationResult::kTooShort;
  }
  if (name.size() > kMaxBucketNameLen) {
    return ValidationResult::kTooLong;
  }
  const auto first = static_cast<unsigned char>(name.front());
  const auto last = static_cast<unsigned char>(name.back());
  if (!IsBucketEdgeChar(first) || !IsBucketEdgeChar(last) ||
      !AllOf(name.substr(1, name.size() - 2), IsBucketInteriorChar)) {
    return ValidationResult::kInvalidFormat;
  }
  return ValidationResult::kOk;
}

std::string_view ValidationMessage(IdentifierKind kind, ValidationResult result) noexcept {
  if (result == ValidationResult::kOk) {
    return {};
  }
  switch (kind) {
    case IdentifierKind::kBookmarkName:
      switch (result) {
        case ValidationResult::kEmpty:
          return bv::errors::msg::kBookmarkNameEmpty;
        case ValidationResult::kTooLong:
          return bv::errors::msg::kBookmarkNameTooLong;
        default:
          return bv::errors::msg::kBookmarkNameCharset;
      }
    case IdentifierKind::kProfileName:
      if (result == ValidationResult::kTooLong) {
        return bv::errors::msg::kProfileNameTooLong;
      }
      return bv::errors::msg::kProfileNameCharset;
    case IdentifierKind::kBucketName:
      if (result == ValidationResult::kTooShort || result == ValidationResult::kTooLong) {
        return bv::errors::msg::kBucketNameLength;
      }
      return bv::errors::msg::kBucketNameFormat;
  }
  return {};
}

void RequireValidBookmarkName(std::string_view name) {
  const auto result = CheckBookmarkName(name);
  if (result == ValidationResult::kOk) {
    return;
  }
  RejectionCode rejection{bv::errors::validation::kBookmarkNameCharset,
                          ValidationMessage(IdentifierKind::kBookmarkName, result)};
  if (result == ValidationResult::kEmpty) {
    rejection.code = bv::errors::validation::kBookmarkNameEmpty;
  } else if (result == ValidationResult::kTooLong) {
    rejection.code = bv::errors::validation::kBookmarkNameTooLong;
  }
  ThrowRejection(rejection.code, rejection.message);
}

void RequireValidProfileName(std::string_view name) {
  const auto result = CheckProfileName(name);
  if (result == ValidationResult::kOk) {
    return;
  }
  const int code = result == ValidationResult::kTooLong ? bv::errors::validation::kProfileNameTooLong
                                                        : bv::errors::validation::kProfileNameCharset;
  ThrowRejection(code, ValidationMessage(IdentifierKind::kProfileName, result));
}

void RequireValidBucketName(std::string_view name) {
  const auto result = CheckBucketName(name);
  if (result == ValidationResult::kOk) {
    return;
  }
  const bool length_violation =
      result == ValidationResult::kTooShort || result == ValidationResult::kTooLong;
  const int code = length_violation ? bv::errors::validation::kBucketNameLength
                                    : bv::errors::validation::kBucketNameFormat;
  ThrowRejection(code, ValidationMessage(IdentifierKind::kBucketName, result));
}

void RequireValidBookmarkDraft(const BookmarkDraft& draft) {
  RequireValidBookmarkName(draft.name);
  RequireValidProfileName(draft.profile);
  RequireValidBucketName(draft.bucket);
}

}  // namespace bv::security
