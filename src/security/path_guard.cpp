#include "bv/security/path_guard.h"

#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

#include "bv/common.h"
#include "bv/error.h"
#include "bv/errors.h"

namespace bv::security {
namespace {

constexpr char kSeparator = '/';

// lexically_normal keeps a trailing separator ("/a/b/" stays "/a/b/"); drop it
// so containment compares like with like. The root path is left alone.
std::filesystem::path StripTrailingSeparator(const std::filesystem::path& path) {
  if (!path.has_filename() && path.has_relative_path()) {
    return path.parent_path();
  }
  return path;
}

[[noreturn]] void ThrowBaseUnresolvable(const std::error_code& ec) {
  std::string message(bv::errors::msg::kInvalidBaseDirectory);
  message.append(": ");
  message.append(ec.message());
  throw bv::Error{bv::ErrorDomain::IO, bv::errors::io::kBaseDirUnresolvable, std::move(message),
                  ec.value()};
}

bool ContainsDeniedFragment(std::string_view path) noexcept {
  for (auto fragment : kDeniedSystemPathFragments) {
    if (path.find(fragment) != std::string_view::npos) {
      return true;
    }
  }
  return false;
}

}  // namespace

bool IsContainedIn(std::string_view candidate, std::string_view base) noexcept {
  if (base.empty()) {
    return false;
  }
  if (candidate == base) {
    return true;
  }
  if (candidate.size() <= base.size() || candidate.compare(0, base.size(), base) != 0) {
    return false;
  }
  // The root already ends in a separator; everything else must be followed by
  // one, so "/data/basefoo" is not inside "/data/base".
  return base.back() == kSeparator || candidate[base.size()] == kSeparator;
}

std::filesystem::path ResolveBaseDirectory(const std::filesystem::path& base_dir) {
  std::error_code ec;
  std::filesystem::path base = base_dir;
  if (base.empty()) {
    base = std::filesystem::current_path(ec);
    if (ec) {
      ThrowBaseUnresolvable(ec);
    }
  }
  auto absolute = std::filesystem::absolute(base, ec);
  if (ec) {
    ThrowBaseUnresolvable(ec);
  }
  return StripTrailingSeparator(absolute.lexically_normal());
}

std::filesystem::path SafePath(const std::filesystem::path& base_dir,
                               const std::filesystem::path& relative_path) {
  const auto base = ResolveBaseDirectory(base_dir);
  const std::string base_text = bv::PathToUtf8String(base);

  // Plain concatenation: operator/ would let an absolute relative_path replace
  // the base entirely.
  std::string joined = base_text;
  if (joined.empty() || joined.back() != kSeparator) {
    joined.push_back(kSeparator);
  }
  joined.append(bv::PathToUtf8String(relative_path));
  const auto normalized = StripTrailingSeparator(std::filesystem::path(joined).lexically_normal());
  const std::string normalized_text = bv::PathToUtf8String(normalized);

  if (!IsContainedIn(normalized_text, base_text)) {
    throw bv::Error{bv::ErrorDomain::Security, bv::errors::security::kPathTraversal,
                    std::string(bv::errors::msg::kPathTraversal)};
  }
  if (ContainsDeniedFragment(normalized_text)) {
    throw bv::Error{bv::ErrorDomain::Security, bv::errors::security::kSystemPathDenied,
                    std::string(bv::errors::msg::kSystemPathDenied)};
  }
  if (normalized_text.size() > kMaxPathLen) {
    throw bv::Error{bv::ErrorDomain::Validation, bv::errors::validation::kPathTooLong,
                    std::string(bv::errors::msg::kPathTooLong)};
  }
  return normalized;
}

}  // namespace bv::security
