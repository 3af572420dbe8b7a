#include "bv/orchestrator/download_planner.h"

#include "bv/error.h"
#include "bv/errors.h"
#include "bv/orchestrator/event_bus.h"
#include "bv/orchestrator/settings.h"
#include "bv/security/path_guard.h"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace {

class TempDir {
 public:
  TempDir() {
    path_ = std::filesystem::temp_directory_path() /
            ("bv_planner_" + std::to_string(static_cast<unsigned long long>(
                                 std::chrono::steady_clock::now().time_since_epoch().count())));
    std::filesystem::create_directories(path_);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }
  const std::filesystem::path& path() const noexcept { return path_; }

 private:
  std::filesystem::path path_{};
};

struct CapturedEvent {
  std::string event_id;
  std::vector<bv::orchestrator::EventField> fields;
};

const bv::orchestrator::EventField* FindField(const CapturedEvent& event, std::string_view key) {
  for (const auto& field : event.fields) {
    if (field.key == key) {
      return &field;
    }
  }
  return nullptr;
}

void TestRelativePaths() {
  using bv::orchestrator::DownloadMode;
  using bv::orchestrator::DownloadRequest;
  using bv::orchestrator::RelativePathForKey;

  DownloadRequest single{DownloadMode::kSingleObject, "", {}};
  assert(RelativePathForKey(single, "photos/2024/a.jpg") == "a.jpg");
  assert(RelativePathForKey(single, "top.txt") == "top.txt");

  DownloadRequest multi{DownloadMode::kMultiSelect, "ignored/", {}};
  assert(RelativePathForKey(multi, "ignored/deep/b.txt") == "b.txt");

  DownloadRequest prefix{DownloadMode::kPrefix, "photos/", {}};
  assert(RelativePathForKey(prefix, "photos/2024/a.jpg") == "2024/a.jpg");
  assert(RelativePathForKey(prefix, "videos/c.mp4") == "videos/c.mp4");

  DownloadRequest exact{DownloadMode::kPrefix, "photos/readme", {}};
  assert(RelativePathForKey(exact, "photos/readme") == "readme");

  DownloadRequest sync{DownloadMode::kSync, "", {}};
  assert(RelativePathForKey(sync, "a/b/c.txt") == "a/b/c.txt");
}

void TestPrefixPlan(const std::filesystem::path& root, std::vector<CapturedEvent>& events) {
  using bv::orchestrator::DownloadMode;
  using bv::orchestrator::DownloadRequest;

  DownloadRequest request;
  request.mode = DownloadMode::kPrefix;
  request.prefix = "photos/";
  request.keys = {"photos/2024/a.jpg", "photos/../../escape.txt", "photos/", "photos/etc/passwd",
                  "photos/b.png", ""};

  events.clear();
  auto plan = bv::orchestrator::PlanDownloads(root, request);
  const auto resolved = bv::security::ResolveBaseDirectory(root);
  assert(plan.destination_root == resolved);

  assert(plan.files.size() == 2);
  assert(plan.files[0].key == "photos/2024/a.jpg");
  assert(plan.files[0].relative_path == "2024/a.jpg");
  assert(plan.files[0].destination == resolved / "2024" / "a.jpg");
  assert(plan.files[1].key == "photos/b.png" && "a rejected key must not stop the rest");
  assert(plan.files[1].destination == resolved / "b.png");

  assert(plan.skipped.size() == 2);
  assert(std::find(plan.skipped.begin(), plan.skipped.end(), "photos/") != plan.skipped.end());

  assert(plan.rejected.size() == 2);
  assert(plan.rejected[0].key == "photos/../../escape.txt");
  assert(plan.rejected[0].reason == bv::errors::msg::kPathTraversal);
  assert(plan.rejected[1].key == "photos/etc/passwd");
  assert(plan.rejected[1].reason == bv::errors::msg::kSystemPathDenied);

  std::size_t rejected_events = 0;
  for (const auto& event : events) {
    if (event.event_id != "download_destination_rejected") {
      continue;
    }
    ++rejected_events;
    const auto* key = FindField(event, "object_key");
    assert(key && key->privacy == bv::orchestrator::FieldPrivacy::kHash);
    const auto* mode = FindField(event, "mode");
    assert(mode && mode->value == "prefix");
    const auto* code = FindField(event, "code");
    assert(code && code->numeric);
  }
  assert(rejected_events == 2);
}

void TestSelectionPlans(const std::filesystem::path& root, std::vector<CapturedEvent>& events) {
  using bv::orchestrator::DownloadMode;
  using bv::orchestrator::DownloadRequest;

  DownloadRequest multi;
  multi.mode = DownloadMode::kMultiSelect;
  multi.keys = {"photos/2024/a.jpg", "b.txt", "folder/"};
  events.clear();
  auto plan = bv::orchestrator::PlanDownloads(root, multi);
  assert(plan.files.size() == 2);
  assert(plan.files[0].relative_path == "a.jpg");
  assert(plan.files[1].relative_path == "b.txt");
  assert(plan.skipped.size() == 1 && plan.skipped[0] == "folder/");
  assert(plan.rejected.empty());
  assert(events.empty());

  // The final segment of "evil/.." is "..", which climbs out of the root.
  DownloadRequest single;
  single.mode = DownloadMode::kSingleObject;
  single.keys = {"evil/.."};
  plan = bv::orchestrator::PlanDownloads(root, single);
  assert(plan.files.empty());
  assert(plan.rejected.size() == 1);
  assert(plan.rejected[0].reason == bv::errors::msg::kPathTraversal);

  DownloadRequest sync;
  sync.mode = DownloadMode::kSync;
  sync.prefix = "mirror/";
  sync.keys = {"mirror/a/b.txt", "other/c.txt", "mirror/proc/cpuinfo"};
  plan = bv::orchestrator::PlanDownloads(root, sync);
  assert(plan.files.size() == 2);
  assert(plan.files[0].relative_path == "a/b.txt");
  assert(plan.files[1].relative_path == "other/c.txt");
  assert(plan.rejected.size() == 1 && plan.rejected[0].key == "mirror/proc/cpuinfo");
}

void TestFailingSubscriber(const std::filesystem::path& root) {
  using bv::orchestrator::DownloadMode;
  using bv::orchestrator::DownloadRequest;

  bv::orchestrator::ResetEventBusForTesting();
  bv::orchestrator::EventBus::Instance().Subscribe([](const bv::orchestrator::Event&) {
    throw std::runtime_error("status line full");
  });

  DownloadRequest request;
  request.mode = DownloadMode::kPrefix;
  request.prefix = "good/";
  request.keys = {"good/a.txt", "../escape.txt", "good/b.txt"};
  auto plan = bv::orchestrator::PlanDownloads(root, request);
  assert(plan.files.size() == 2 && "a failing subscriber must not drop the plan");
  assert(plan.files[0].relative_path == "a.txt");
  assert(plan.files[1].relative_path == "b.txt");
  assert(plan.rejected.size() == 1 && plan.rejected[0].key == "../escape.txt");
  assert(plan.rejected[0].reason == bv::errors::msg::kPathTraversal);

  bv::orchestrator::ResetEventBusForTesting();
}

void TestEnvironmentRoot(const std::filesystem::path& root) {
  ::setenv(bv::orchestrator::kDownloadRootEnv, root.c_str(), 1);
  assert(bv::orchestrator::ComputeDownloadRoot() == bv::security::ResolveBaseDirectory(root));
  ::unsetenv(bv::orchestrator::kDownloadRootEnv);

  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  assert(!ec);
  assert(bv::orchestrator::ComputeDownloadRoot() == cwd.lexically_normal());
}

}  // namespace

int main() {
  TempDir temp;
  const auto log_dir = temp.path() / "logs";
  ::setenv(bv::orchestrator::kLogDirEnv, log_dir.c_str(), 1);

  std::vector<CapturedEvent> events;
  bv::orchestrator::EventBus::Instance().Subscribe([&events](const bv::orchestrator::Event& event) {
    events.push_back(CapturedEvent{event.event_id, event.fields});
  });

  const auto root = temp.path() / "downloads";
  TestRelativePaths();
  TestPrefixPlan(root, events);
  TestSelectionPlans(root, events);
  TestFailingSubscriber(root);
  TestEnvironmentRoot(root);

  bv::orchestrator::ResetEventBusForTesting();
  std::cout << "download planner tests ok\n";
  return 0;
}
