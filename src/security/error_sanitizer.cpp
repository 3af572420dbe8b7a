#include "bv/security/error_sanitizer.h"

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

#include "bv/common.h"
#include "bv/errors.h"

namespace bv::security {
namespace {

constexpr std::size_t kNoMatch = std::string_view::npos;
constexpr std::size_t kAccountIdDigits = 12;
constexpr std::size_t kAccessKeyTailLen = 16;

bool IsSpace(unsigned char ch) noexcept {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\f' || ch == '\r';
}

bool IsDigit(unsigned char ch) noexcept { return ch >= '0' && ch <= '9'; }

bool IsWordChar(unsigned char ch) noexcept {
  return IsDigit(ch) || (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || ch == '_';
}

template <class Predicate>
std::size_t SpanWhile(std::string_view text, std::size_t pos, Predicate predicate) noexcept {
  while (pos < text.size() && predicate(static_cast<unsigned char>(text[pos]))) {
    ++pos;
  }
  return pos;
}

// Matcher for what follows an anchor literal: returns the end of the match or
// kNoMatch.
using TailMatcher = std::size_t (*)(std::string_view text, std::size_t pos) noexcept;

// Leftmost, non-overlapping replacement of `anchor` + tail, scanning resumes
// after each match.
std::string ReplaceAnchored(std::string_view text, std::string_view anchor, TailMatcher tail,
                            std::string_view replacement) {
  std::string out;
  out.reserve(text.size());
  std::size_t cursor = 0;
  std::size_t search = 0;
  while (search < text.size()) {
    const auto hit = text.find(anchor, search);
    if (hit == std::string_view::npos) {
      break;
    }
    const auto end = tail(text, hit + anchor.size());
    if (end == kNoMatch) {
      search = hit + 1;
      continue;
    }
    out.append(text.substr(cursor, hit - cursor));
    out.append(replacement);
    cursor = end;
    search = end;
  }
  out.append(text.substr(cursor));
  return out;
}

// A 12-digit account id is a whole word: the digits are bounded on both sides
// by non-word characters or the ends of the text.
std::string RedactAccountIds(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  std::size_t pos = 0;
  while (pos < text.size()) {
    if (!IsWordChar(static_cast<unsigned char>(text[pos]))) {
      out.push_back(text[pos]);
      ++pos;
      continue;
    }
    const auto end = SpanWhile(text, pos, IsWordChar);
    const auto word = text.substr(pos, end - pos);
    if (word.size() == kAccountIdDigits &&
        SpanWhile(word, 0, IsDigit) == kAccountIdDigits) {
      out.append("[account-id]");
    } else {
      out.append(word);
    }
    pos = end;
  }
  return out;
}

// arn:aws:<service>:<region>:<account>:<resource>
std::size_t MatchArnTail(std::string_view text, std::size_t pos) noexcept {
  auto segment = [](unsigned char ch) { return ch != ':' && !IsSpace(ch); };
  auto end = SpanWhile(text, pos, segment);
  if (end == pos) {
    return kNoMatch;
  }
  for (int separators = 0; separators < 2; ++separators) {
    if (end >= text.size() || text[end] != ':') {
      return kNoMatch;
    }
    end = SpanWhile(text, end + 1, segment);
  }
  if (end >= text.size() || text[end] != ':') {
    return kNoMatch;
  }
  const auto resource_begin = end + 1;
  end = SpanWhile(text, resource_begin, [](unsigned char ch) { return !IsSpace(ch); });
  return end == resource_begin ? kNoMatch : end;
}

bool IsBucketNameChar(unsigned char ch) noexcept {
  return (ch >= 'a' && ch <= 'z') || IsDigit(ch) || ch == '.' || ch == '-';
}

bool IsQuote(unsigned char ch) noexcept { return ch == '\'' || ch == '"'; }

// bucket[:\s]+ optional quote, name, optional quote
std::size_t MatchBucketTail(std::string_view text, std::size_t pos) noexcept {
  auto end = SpanWhile(text, pos, [](unsigned char ch) { return ch == ':' || IsSpace(ch); });
  if (end == pos) {
    return kNoMatch;
  }
  if (end < text.size() && IsQuote(static_cast<unsigned char>(text[end]))) {
    ++end;
  }
  const auto name_begin = end;
  end = SpanWhile(text, name_begin, IsBucketNameChar);
  if (end == name_begin) {
    return kNoMatch;
  }
  if (end < text.size() && IsQuote(static_cast<unsigned char>(text[end]))) {
    ++end;
  }
  return end;
}

std::size_t MatchAccessKeyTail(std::string_view text, std::size_t pos) noexcept {
  if (text.size() - pos < kAccessKeyTailLen) {
    return kNoMatch;
  }
  for (std::size_t i = pos; i < pos + kAccessKeyTailLen; ++i) {
    const auto ch = static_cast<unsigned char>(text[i]);
    if (!IsDigit(ch) && !(ch >= 'A' && ch <= 'Z')) {
      return kNoMatch;
    }
  }
  return pos + kAccessKeyTailLen;
}

std::size_t MatchUserNameTail(std::string_view text, std::size_t pos) noexcept {
  const auto end = SpanWhile(text, pos, [](unsigned char ch) { return ch != '/' && !IsSpace(ch); });
  return end == pos ? kNoMatch : end;
}

struct RedactionRule {
  std::string_view anchor;
  TailMatcher tail;
  std::string_view replacement;
};

// Applied in order between the two account id passes. No two rules match
// overlapping shapes, and no placeholder matches any rule except the
// home-directory ones, which reproduce themselves.
constexpr std::array<RedactionRule, 5> kRedactionRules = {{
    {"arn:aws:", MatchArnTail, "[arn]"},
    {"bucket", MatchBucketTail, "bucket: [bucket]"},
    {"AKIA", MatchAccessKeyTail, "[access-key]"},
    {"/Users/", MatchUserNameTail, "/Users/[user]"},
    {"/home/", MatchUserNameTail, "/home/[user]"},
}};

struct ErrorSignature {
  ErrorClass category;
  std::array<std::string_view, 2> needles;  // lowercase; empty entries unused
  std::string_view message;
};

// Priority order matters: a credential failure that mentions a timeout is
// reported as a credential failure.
constexpr std::array<ErrorSignature, 7> kErrorSignatures = {{
    {ErrorClass::kAccessDenied, {"access denied", "accessdenied"}, bv::errors::msg::kFriendlyAccessDenied},
    {ErrorClass::kBucketNotFound, {"no such bucket", "nosuchbucket"}, bv::errors::msg::kFriendlyBucketNotFound},
    {ErrorClass::kObjectNotFound, {"no such key", "nosuchkey"}, bv::errors::msg::kFriendlyObjectNotFound},
    {ErrorClass::kCredentialsExpired, {"expired", "token"}, bv::errors::msg::kFriendlyCredentialsExpired},
    {ErrorClass::kCredentialError, {"credential", ""}, bv::errors::msg::kFriendlyCredentialError},
    {ErrorClass::kTimeout, {"timeout", "deadline"}, bv::errors::msg::kFriendlyTimeout},
    {ErrorClass::kConnectionError, {"connection", ""}, bv::errors::msg::kFriendlyConnectionError},
}};

bool MatchesSignature(std::string_view lowered, const ErrorSignature& signature) noexcept {
  for (auto needle : signature.needles) {
    if (!needle.empty() && lowered.find(needle) != std::string_view::npos) {
      return true;
    }
  }
  return false;
}

std::string WithContext(std::string_view context, std::string_view detail) {
  std::string out;
  out.reserve(context.size() + 2 + detail.size());
  out.append(context);
  out.append(": ");
  out.append(detail);
  return out;
}

}  // namespace

std::string RedactErrorMessage(std::string_view message) {
  std::string redacted = RedactAccountIds(message);
  for (const auto& rule : kRedactionRules) {
    redacted = ReplaceAnchored(redacted, rule.anchor, rule.tail, rule.replacement);
  }
  // A placeholder can end a digit run that had no word boundary before
  // ("123456789012AKIA..." becomes "123456789012[access-key]").
  return RedactAccountIds(redacted);
}

std::string RedactError(const std::exception* error) {
  if (error == nullptr) {
    return {};
  }
  return RedactErrorMessage(error->what());
}

std::string RedactError(const std::exception& error) { return RedactError(&error); }

ErrorClass ClassifyError(std::string_view message) {
  const std::string lowered = bv::AsciiLower(message);
  for (const auto& signature : kErrorSignatures) {
    if (MatchesSignature(lowered, signature)) {
      return signature.category;
    }
  }
  return ErrorClass::kUnknown;
}

std::string_view ClassificationMessage(ErrorClass category) noexcept {
  for (const auto& signature : kErrorSignatures) {
    if (signature.category == category) {
      return signature.message;
    }
  }
  return {};
}

std::string DescribeError(std::string_view message, std::string_view context) {
  const auto category = ClassifyError(message);
  if (category == ErrorClass::kUnknown) {
    return WithContext(context, RedactErrorMessage(message));
  }
  return WithContext(context, ClassificationMessage(category));
}

std::string DescribeError(const std::exception* error, std::string_view context) {
  if (error == nullptr) {
    return {};
  }
  return DescribeError(std::string_view(error->what()), context);
}

std::string DescribeError(const std::exception& error, std::string_view context) {
  return DescribeError(&error, context);
}

}  // namespace bv::security
