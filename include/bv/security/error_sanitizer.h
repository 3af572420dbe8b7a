#pragma once

#include <exception>
#include <string>
#include <string_view>

namespace bv::security {

enum class ErrorClass {
  kAccessDenied,
  kBucketNotFound,
  kObjectNotFound,
  kCredentialsExpired,
  kCredentialError,
  kTimeout,
  kConnectionError,
  kUnknown
};

// Replaces sensitive substrings with fixed placeholders:
//   12-digit account ids         -> [account-id]
//   arn:aws:... resource names   -> [arn]
//   "bucket: <name>"             -> bucket: [bucket]
//   AKIA access key ids          -> [access-key]
//   /Users/<name>, /home/<name>  -> /Users/[user], /home/[user]
// Applying it to its own output changes nothing.
std::string RedactErrorMessage(std::string_view message);

// Null maps to an empty string.
std::string RedactError(const std::exception* error);
std::string RedactError(const std::exception& error);

// First matching signature in priority order; kUnknown when none matches.
// Matching is case-insensitive.
ErrorClass ClassifyError(std::string_view message);

// Canned text for a category; empty for kUnknown.
std::string_view ClassificationMessage(ErrorClass category) noexcept;

// "<context>: <canned message>" for a recognized failure, otherwise
// "<context>: <redacted message>". Null maps to an empty string.
std::string DescribeError(std::string_view message, std::string_view context);
std::string DescribeError(const std::exception* error, std::string_view context);
std::string DescribeError(const std::exception& error, std::string_view context);

}  // namespace bv::security
