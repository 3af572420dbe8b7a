#include "bv/orchestrator/settings.h"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <limits>
#include <string>
#include <system_error>

#include "bv/error.h"
#include "bv/errors.h"
#include "bv/security/path_guard.h"

namespace bv::orchestrator {

std::filesystem::path ComputeDownloadRoot() {
  const char* env_root = std::getenv(kDownloadRootEnv);
  std::filesystem::path base;
  if (env_root && *env_root) {
    base = std::filesystem::path(env_root);
  }
  // An empty base resolves to the working directory.
  return bv::security::ResolveBaseDirectory(base);
}

const std::filesystem::path& DownloadRoot() {
  static const std::filesystem::path root = ComputeDownloadRoot();
  return root;
}

std::filesystem::path LogDirectory() {
  const char* env_dir = std::getenv(kLogDirEnv);
  if (env_dir && *env_dir) {
    return std::filesystem::path(env_dir);
  }
  std::error_code ec;
  auto cwd = std::filesystem::current_path(ec);
  if (ec) {
    throw bv::Error{bv::ErrorDomain::IO, bv::errors::io::kLogDirectoryUnavailable,
                    std::string(bv::errors::msg::kUnableToResolveWorkingDirectory), ec.value(),
                    bv::Retryability::kTransient};
  }
  return cwd / "logs";
}

size_t LogMaxBytes() {
  const char* env = std::getenv(kLogMaxSizeEnv);
  if (!env || *env == '\0') {
    return kDefaultLogMaxBytes;
  }
  const auto length = std::strlen(env);
  unsigned long long value = 0;
  auto [ptr, ec] = std::from_chars(env, env + length, value);
  if (ec != std::errc() || ptr != env + length || value == 0) {
    return kDefaultLogMaxBytes;
  }
  return static_cast<size_t>(std::min<unsigned long long>(value, std::numeric_limits<size_t>::max()));
}

}  // namespace bv::orchestrator
