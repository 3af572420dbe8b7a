#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace bv::orchestrator {

enum class DownloadMode {
  kSingleObject,  // one selected object
  kPrefix,        // everything under a prefix
  kMultiSelect,   // several selected objects
  kSync           // mirror a prefix into the destination
};

struct DownloadRequest {
  DownloadMode mode{DownloadMode::kSingleObject};
  std::string prefix;             // stripped from keys in kPrefix and kSync
  std::vector<std::string> keys;  // object keys as listed by the store
};

struct PlannedFile {
  std::string key;
  std::string relative_path;
  std::filesystem::path destination;
};

struct RejectedFile {
  std::string key;
  std::string reason;  // display-safe
};

struct DownloadPlan {
  std::filesystem::path destination_root;  // resolved, absolute
  std::vector<PlannedFile> files;
  std::vector<RejectedFile> rejected;
  std::vector<std::string> skipped;  // folder markers and empty keys
};

// Relative local path for `key` under `request`: the final key segment for
// single and multi-select downloads, the key minus the prefix for prefix and
// sync downloads.
std::string RelativePathForKey(const DownloadRequest& request, const std::string& key);

// Confines every key of `request` to `destination_root`. A rejected key does
// not affect the others; each rejection is published as a warning event.
// Throws bv::Error only when the destination root itself cannot be resolved.
DownloadPlan PlanDownloads(const std::filesystem::path& destination_root,
                           const DownloadRequest& request);

}  // namespace bv::orchestrator
