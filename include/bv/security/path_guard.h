#pragma once

#include <array>
#include <cstddef>
#include <filesystem>
#include <string_view>

namespace bv::security {

inline constexpr std::size_t kMaxPathLen = 4096;

// Substrings that must never appear in a destination path. Matched against the
// whole normalized path, not per segment.
inline constexpr std::array<std::string_view, 4> kDeniedSystemPathFragments = {
    "/dev/", "/proc/", "/sys/", "/etc/"};

// Resolves `base_dir` to an absolute, lexically normalized path. An empty base
// means the current working directory. Throws bv::Error (IO,
// kBaseDirUnresolvable) when the working directory cannot be determined.
std::filesystem::path ResolveBaseDirectory(const std::filesystem::path& base_dir);

// Confines `relative_path` to `base_dir` and returns the normalized absolute
// destination. An absolute `relative_path` is appended to the base like any
// other. Checks run in order and the first violation is thrown as bv::Error:
//   base unresolvable   IO          errors::io::kBaseDirUnresolvable
//   escapes base        Security    errors::security::kPathTraversal
//   system fragment     Security    errors::security::kSystemPathDenied
//   over kMaxPathLen    Validation  errors::validation::kPathTooLong
// Normalization is lexical; symlinks below the base are not resolved.
std::filesystem::path SafePath(const std::filesystem::path& base_dir,
                               const std::filesystem::path& relative_path);

// True when `candidate` equals `base` or lies under `base` followed by a
// separator. Both arguments must already be normalized absolute paths.
[[nodiscard]] bool IsContainedIn(std::string_view candidate, std::string_view base) noexcept;

}  // namespace bv::security
