#pragma once

#include <cstddef>
#include <filesystem>

namespace bv::orchestrator {

inline constexpr const char* kDownloadRootEnv = "BV_DOWNLOAD_ROOT";
inline constexpr const char* kLogDirEnv = "BV_LOG_DIR";
inline constexpr const char* kLogMaxSizeEnv = "BV_LOG_MAX_SIZE";
inline constexpr size_t kDefaultLogMaxBytes = 10 * 1024 * 1024;

// BV_DOWNLOAD_ROOT when set, otherwise the working directory; absolute and
// normalized. Throws bv::Error when neither can be resolved.
std::filesystem::path ComputeDownloadRoot();

// ComputeDownloadRoot() evaluated once per process.
const std::filesystem::path& DownloadRoot();

// BV_LOG_DIR when set, otherwise <cwd>/logs. Not created here.
std::filesystem::path LogDirectory();

// BV_LOG_MAX_SIZE in bytes; unset, zero or malformed values give the default.
size_t LogMaxBytes();

}  // namespace bv::orchestrator
