#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace bv::security {

inline constexpr std::size_t kMaxBookmarkNameLen = 255;
inline constexpr std::size_t kMaxProfileNameLen = 128;
inline constexpr std::size_t kMinBucketNameLen = 3;
inline constexpr std::size_t kMaxBucketNameLen = 63;

enum class IdentifierKind { kBookmarkName, kProfileName, kBucketName };

enum class ValidationResult {
  kOk,
  kEmpty,
  kTooShort,
  kTooLong,
  kInvalidCharacters,
  kInvalidFormat
};

// Non-throwing classification. Lengths are byte counts.
[[nodiscard]] ValidationResult CheckBookmarkName(std::string_view name) noexcept;
// Empty means "use the default profile" and is accepted.
[[nodiscard]] ValidationResult CheckProfileName(std::string_view name) noexcept;
// Empty means "unset" and is accepted. Simplified naming grammar: lowercase
// alphanumerics with interior dots and hyphens, 3-63 bytes.
[[nodiscard]] ValidationResult CheckBucketName(std::string_view name) noexcept;

// Display text for a rejection; empty for kOk.
std::string_view ValidationMessage(IdentifierKind kind, ValidationResult result) noexcept;

// Throwing forms used before persisting a value. The bv::Error message is the
// verbatim rejection reason.
void RequireValidBookmarkName(std::string_view name);
void RequireValidProfileName(std::string_view name);
void RequireValidBucketName(std::string_view name);

// Fields of a bookmark that the validators constrain. The prefix is free-form.
struct BookmarkDraft {
  std::string name;
  std::string profile;
  std::string bucket;
  std::string prefix;
};

// Validates name, profile and bucket in that order and throws on the first
// rejection.
void RequireValidBookmarkDraft(const BookmarkDraft& draft);

}  // namespace bv::security
