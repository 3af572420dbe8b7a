#pragma once

#include <string_view>

namespace bv::errors::msg {
// Centralized catalog of user-facing messages. Every string here is safe to
// show on screen or write to a log.
inline constexpr std::string_view kBookmarkNameEmpty{"bookmark name cannot be empty"};
inline constexpr std::string_view kBookmarkNameTooLong{"bookmark name too long (max 255 characters)"};
inline constexpr std::string_view kBookmarkNameCharset{"bookmark name contains invalid characters"};
inline constexpr std::string_view kProfileNameTooLong{"profile name too long (max 128 characters)"};
inline constexpr std::string_view kProfileNameCharset{"profile name contains invalid characters"};
inline constexpr std::string_view kBucketNameLength{"bucket name must be 3-63 characters"};
inline constexpr std::string_view kBucketNameFormat{"invalid bucket name format"};
inline constexpr std::string_view kInvalidBaseDirectory{"invalid base directory"};
inline constexpr std::string_view kPathTraversal{"path traversal detected: path escapes base directory"};
inline constexpr std::string_view kSystemPathDenied{"invalid path: cannot write to system directories"};
inline constexpr std::string_view kPathTooLong{"path too long (max 4096 characters)"};
inline constexpr std::string_view kUnableToResolveWorkingDirectory{"Unable to resolve working directory"};
inline constexpr std::string_view kDigestFailed{"SHA-256 digest failed"};

// Friendly classifications, rendered as "<context>: <message>".
inline constexpr std::string_view kFriendlyAccessDenied{"access denied - check your permissions"};
inline constexpr std::string_view kFriendlyBucketNotFound{"bucket not found"};
inline constexpr std::string_view kFriendlyObjectNotFound{"object not found"};
inline constexpr std::string_view kFriendlyCredentialsExpired{"credentials expired - run 'aws sso login'"};
inline constexpr std::string_view kFriendlyCredentialError{"credential error - check your AWS configuration"};
inline constexpr std::string_view kFriendlyTimeout{"request timed out"};
inline constexpr std::string_view kFriendlyConnectionError{"connection error - check your network"};
}  // namespace bv::errors::msg
