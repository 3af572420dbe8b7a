#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace bv::orchestrator {

  // Structured logging primitives
  enum class EventSeverity { kDebug, kInfo, kWarning, kError, kCritical };

  enum class EventCategory { kTelemetry, kLifecycle, kSecurity, kDiagnostics };

  enum class FieldPrivacy { kPublic, kRedact, kHash };

  struct EventField {
    std::string key;
    std::string value;
    FieldPrivacy privacy{FieldPrivacy::kPublic};
    bool numeric{false};

    EventField(std::string k, std::string v, FieldPrivacy p = FieldPrivacy::kPublic,
               bool is_numeric = false)
        : key(std::move(k)), value(std::move(v)), privacy(p), numeric(is_numeric) {}
  };

  struct Event {
    EventCategory category{EventCategory::kDiagnostics};
    EventSeverity severity{EventSeverity::kInfo};
    std::string event_id;
    std::string message;
    std::vector<EventField> fields;
  };

  // "hash:<sha256 hex>" tag used for kHash fields; "hash:" for empty input.
  std::string HashForTelemetry(std::string_view input);

  // Serializes one event as a single JSON object. Messages and public string
  // fields are passed through the error redaction pipeline; fields whose key
  // or value suggests a path or secret are hashed. Returns false when the
  // payload would exceed `max_bytes`.
  bool BuildEventJson(const Event& event, std::string_view timestamp, size_t max_bytes,
                      std::string& out);

  class JsonLineLogger {
  public:
    // Path and rotation size from BV_LOG_DIR and BV_LOG_MAX_SIZE.
    JsonLineLogger();
    JsonLineLogger(std::filesystem::path log_path, size_t max_bytes);
    void Log(const Event& event);

    const std::filesystem::path& path() const noexcept { return log_path_; }

  private:
    std::string FormatTimestamp(std::chrono::system_clock::time_point tp);
    void EnsureOpen();
    void RotateIfNeeded(size_t incoming_bytes);

    std::mutex mutex_;
    std::ofstream stream_;
    std::filesystem::path log_path_;
    size_t max_bytes_;
    const size_t max_files_ = 3;
    uint64_t dropped_streak_{0};
  };

  JsonLineLogger& DefaultJsonLogger();

  class EventBus {
  public:
    using Subscriber = std::function<void(const Event&)>;

    static EventBus& Instance();

    void Publish(const Event& event);
    void Subscribe(Subscriber fn);

    ~EventBus();

  private:
    EventBus();

    using SubscriberList = std::vector<Subscriber>;

    std::shared_ptr<const SubscriberList> subscribers_snapshot_;
    std::mutex subscribers_mutex_;
  };

  void ResetEventBusForTesting(); // test-only teardown; drops all subscribers

} // namespace bv::orchestrator
