#include <exception>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "bv/common.h"
#include "bv/error.h"
#include "bv/orchestrator/download_planner.h"
#include "bv/orchestrator/event_bus.h"
#include "bv/orchestrator/settings.h"
#include "bv/security/error_sanitizer.h"
#include "bv/security/path_guard.h"
#include "bv/security/validators.h"

namespace {

  constexpr int kExitOk = 0;
  constexpr int kExitUsage = 64;
  constexpr int kExitIO = 74;
  constexpr int kExitSecurity = 77;

  void PrintUsage() {
    std::cerr << "bv-guard: BucketView input and path checks\n";
    std::cerr << "Usage:\n";
    std::cerr << "  bv-guard check-bookmark <name>\n";
    std::cerr << "  bv-guard check-profile <name>\n";
    std::cerr << "  bv-guard check-bucket <name>\n";
    std::cerr << "  bv-guard resolve [--base=<dir>] <relative-path>\n";
    std::cerr << "  bv-guard redact <text...>\n";
    std::cerr << "  bv-guard describe <context> <text...>\n";
    std::cerr << "  bv-guard plan [--mode=single|prefix|multi|sync] [--prefix=<p>] <key...>\n";
    std::cerr << "\nGlobal flags:\n";
    std::cerr << "  --download-root=<dir>   Destination root (default: $BV_DOWNLOAD_ROOT or cwd)\n";
  }

  bool TryParsePathArgument(std::string_view raw, std::filesystem::path& out,
                            std::string_view description) {
    if (raw.empty()) {
      std::cerr << "Validation error: " << description << " is required." << std::endl;
      return false;
    }
    out = std::filesystem::path(std::string(raw));
    return true;
  }

  std::optional<bv::orchestrator::DownloadMode> ParseMode(std::string_view value) {
    if (value == "single") {
      return bv::orchestrator::DownloadMode::kSingleObject;
    }
    if (value == "prefix") {
      return bv::orchestrator::DownloadMode::kPrefix;
    }
    if (value == "multi") {
      return bv::orchestrator::DownloadMode::kMultiSelect;
    }
    if (value == "sync") {
      return bv::orchestrator::DownloadMode::kSync;
    }
    return std::nullopt;
  }

  std::string JoinArguments(int argc, char** argv, int first) {
    std::string joined;
    for (int i = first; i < argc; ++i) {
      if (i > first) {
        joined.push_back(' ');
      }
      joined.append(argv[i]);
    }
    return joined;
  }

  std::string_view DomainPrefix(bv::ErrorDomain domain) {
    switch (domain) {
    case bv::ErrorDomain::IO:
      return "I/O error";
    case bv::ErrorDomain::Security:
      return "Security error";
    case bv::ErrorDomain::Crypto:
      return "Cryptography error";
    case bv::ErrorDomain::Validation:
      return "Validation error";
    case bv::ErrorDomain::Config:
      return "Configuration error";
    case bv::ErrorDomain::Internal:
      return "Internal error";
    }
    return "Error";
  }

  void ReportError(const bv::Error& err) {
    // Messages raised by the boundary layer are already display-safe.
    std::cerr << DomainPrefix(err.domain) << ": " << err.what() << '\n';

    bv::orchestrator::Event event;
    event.category = bv::orchestrator::EventCategory::kDiagnostics;
    event.severity = bv::orchestrator::EventSeverity::kError;
    event.event_id = "cli_error";
    event.message = err.what();
    event.fields.emplace_back("domain", std::string(DomainPrefix(err.domain)));
    event.fields.emplace_back("code", std::to_string(err.code),
                              bv::orchestrator::FieldPrivacy::kPublic, true);
    if (err.native_code.has_value()) {
      event.fields.emplace_back("native_code", std::to_string(*err.native_code),
                                bv::orchestrator::FieldPrivacy::kHash, true);
    }
    try {
      bv::orchestrator::EventBus::Instance().Publish(event);
    } catch (const std::exception& publish_error) {
      std::clog << "{\"event\":\"eventbus_error\",\"message\":\"error report publish failed\",\"detail\":\""
                << bv::security::RedactError(publish_error) << "\"}" << std::endl;
    }
  }

  int ExitCodeFor(const bv::Error& err) {
    switch (err.domain) {
    case bv::ErrorDomain::IO:
      return kExitIO;
    case bv::ErrorDomain::Security:
      return kExitSecurity;
    case bv::ErrorDomain::Validation:
    case bv::ErrorDomain::Config:
      return kExitUsage;
    case bv::ErrorDomain::Crypto:
    case bv::ErrorDomain::Internal:
    default:
      return kExitIO;
    }
  }

  std::filesystem::path EffectiveDownloadRoot(const std::optional<std::filesystem::path>& override_root) {
    if (override_root) {
      return bv::security::ResolveBaseDirectory(*override_root);
    }
    return bv::orchestrator::DownloadRoot();
  }

  int HandleResolve(const std::filesystem::path& base, const std::filesystem::path& relative) {
    auto resolved = bv::security::SafePath(base, relative);
    std::cout << bv::PathToUtf8String(resolved) << '\n';
    return kExitOk;
  }

  int HandlePlan(const std::filesystem::path& root, const bv::orchestrator::DownloadRequest& request) {
    auto plan = bv::orchestrator::PlanDownloads(root, request);
    for (const auto& file : plan.files) {
      std::cout << "ok       " << file.key << " -> " << bv::PathToUtf8String(file.destination) << '\n';
    }
    for (const auto& key : plan.skipped) {
      std::cout << "skipped  " << key << '\n';
    }
    for (const auto& rejected : plan.rejected) {
      std::cout << "rejected " << rejected.key << ": " << rejected.reason << '\n';
    }
    return plan.rejected.empty() ? kExitOk : kExitSecurity;
  }

} // namespace

int main(int argc, char** argv) {
  try {
    if (argc < 2) {
      PrintUsage();
      return kExitUsage;
    }

    int index = 1;
    std::optional<std::filesystem::path> download_root;
    for (; index < argc; ++index) {
      std::string_view arg = argv[index];
      if (arg.rfind("--", 0) != 0) {
        break;
      }
      if (arg.rfind("--download-root=", 0) == 0) {
        std::filesystem::path parsed;
        if (!TryParsePathArgument(arg.substr(std::string_view("--download-root=").size()), parsed,
                                  "download root")) {
          PrintUsage();
          return kExitUsage;
        }
        download_root = parsed;
        continue;
      }

      PrintUsage();
      return kExitUsage;
    }

    if (index >= argc) {
      PrintUsage();
      return kExitUsage;
    }

    std::string cmd = argv[index++];
    if (cmd == "check-bookmark" || cmd == "check-profile" || cmd == "check-bucket") {
      if (argc - index != 1) {
        PrintUsage();
        return kExitUsage;
      }
      std::string_view value = argv[index];
      if (cmd == "check-bookmark") {
        bv::security::RequireValidBookmarkName(value);
      } else if (cmd == "check-profile") {
        bv::security::RequireValidProfileName(value);
      } else {
        bv::security::RequireValidBucketName(value);
      }
      std::cout << "ok\n";
      return kExitOk;
    }
    if (cmd == "resolve") {
      std::optional<std::filesystem::path> base;
      std::optional<std::filesystem::path> relative;
      for (int i = index; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg.rfind("--base=", 0) == 0) {
          std::filesystem::path parsed;
          if (!TryParsePathArgument(arg.substr(std::string_view("--base=").size()), parsed, "base directory")) {
            PrintUsage();
            return kExitUsage;
          }
          base = parsed;
          continue;
        }
        if (relative) {
          PrintUsage();
          return kExitUsage;
        }
        std::filesystem::path parsed;
        if (!TryParsePathArgument(arg, parsed, "relative path")) {
          PrintUsage();
          return kExitUsage;
        }
        relative = parsed;
      }
      if (!relative) {
        PrintUsage();
        return kExitUsage;
      }
      return HandleResolve(base ? *base : EffectiveDownloadRoot(download_root), *relative);
    }
    if (cmd == "redact") {
      if (argc - index < 1) {
        PrintUsage();
        return kExitUsage;
      }
      std::cout << bv::security::RedactErrorMessage(JoinArguments(argc, argv, index)) << '\n';
      return kExitOk;
    }
    if (cmd == "describe") {
      if (argc - index < 2) {
        PrintUsage();
        return kExitUsage;
      }
      std::string_view context = argv[index];
      std::cout << bv::security::DescribeError(JoinArguments(argc, argv, index + 1), context) << '\n';
      return kExitOk;
    }
    if (cmd == "plan") {
      bv::orchestrator::DownloadRequest request;
      request.mode = bv::orchestrator::DownloadMode::kMultiSelect;
      for (int i = index; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg.rfind("--mode=", 0) == 0) {
          auto mode = ParseMode(arg.substr(std::string_view("--mode=").size()));
          if (!mode) {
            PrintUsage();
            return kExitUsage;
          }
          request.mode = *mode;
          continue;
        }
        if (arg.rfind("--prefix=", 0) == 0) {
          request.prefix = std::string(arg.substr(std::string_view("--prefix=").size()));
          continue;
        }
        request.keys.emplace_back(arg);
      }
      if (request.keys.empty()) {
        PrintUsage();
        return kExitUsage;
      }
      return HandlePlan(EffectiveDownloadRoot(download_root), request);
    }

    PrintUsage();
    return kExitUsage;
  } catch (const bv::Error& err) {
    ReportError(err);
    return ExitCodeFor(err);
  } catch (const std::exception& err) {
    std::cerr << bv::security::DescribeError(err, "I/O error") << std::endl;
    return kExitIO;
  }
}
