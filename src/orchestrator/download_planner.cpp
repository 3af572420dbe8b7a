#include "bv/orchestrator/download_planner.h"

#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>

#include "bv/error.h"
#include "bv/orchestrator/event_bus.h"
#include "bv/security/error_sanitizer.h"
#include "bv/security/path_guard.h"

namespace bv::orchestrator {
namespace {

bool IsFolderMarker(std::string_view key) noexcept { return key.empty() || key.back() == '/'; }

std::string FinalSegment(const std::string& key) {
  const auto slash = key.find_last_of('/');
  return slash == std::string::npos ? key : key.substr(slash + 1);
}

const char* ModeToString(DownloadMode mode) {
  switch (mode) {
    case DownloadMode::kSingleObject:
      return "single";
    case DownloadMode::kPrefix:
      return "prefix";
    case DownloadMode::kMultiSelect:
      return "multi";
    case DownloadMode::kSync:
      return "sync";
  }
  return "single";
}

void PublishRejection(const DownloadRequest& request, const std::string& key, const bv::Error& err) {
  Event rejected;
  rejected.category = EventCategory::kSecurity;
  rejected.severity = EventSeverity::kWarning;
  rejected.event_id = "download_destination_rejected";
  rejected.message = err.what();
  rejected.fields.emplace_back("mode", ModeToString(request.mode));
  rejected.fields.emplace_back("object_key", key, FieldPrivacy::kHash);
  rejected.fields.emplace_back("code", std::to_string(err.code), FieldPrivacy::kPublic, true);
  try {
    EventBus::Instance().Publish(rejected);
  } catch (const std::exception& publish_error) {
    // Fatal to the rejected file only.
    std::clog << "{\"event\":\"eventbus_error\",\"message\":\"rejection publish failed\",\"detail\":\""
              << bv::security::RedactError(publish_error) << "\"}" << std::endl;
  }
}

}  // namespace

std::string RelativePathForKey(const DownloadRequest& request, const std::string& key) {
  switch (request.mode) {
    case DownloadMode::kSingleObject:
    case DownloadMode::kMultiSelect:
      return FinalSegment(key);
    case DownloadMode::kPrefix:
    case DownloadMode::kSync:
      if (!request.prefix.empty() && key.size() > request.prefix.size() &&
          key.compare(0, request.prefix.size(), request.prefix) == 0) {
        return key.substr(request.prefix.size());
      }
      // The key is the prefix itself or lies outside it.
      return key == request.prefix ? FinalSegment(key) : key;
  }
  return key;
}

DownloadPlan PlanDownloads(const std::filesystem::path& destination_root,
                           const DownloadRequest& request) {
  DownloadPlan plan;
  plan.destination_root = bv::security::ResolveBaseDirectory(destination_root);

  for (const auto& key : request.keys) {
    if (IsFolderMarker(key)) {
      plan.skipped.push_back(key);
      continue;
    }
    auto relative = RelativePathForKey(request, key);
    try {
      auto destination = bv::security::SafePath(plan.destination_root, relative);
      plan.files.push_back(PlannedFile{key, std::move(relative), std::move(destination)});
    } catch (const bv::Error& err) {
      // Fatal to this file only.
      plan.rejected.push_back(RejectedFile{key, err.what()});
      PublishRejection(request, key, err);
    }
  }
  return plan;
}

}  // namespace bv::orchestrator
