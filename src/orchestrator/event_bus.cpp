#include "bv/orchestrator/event_bus.h"

#include "bv/common.h"
#include "bv/crypto/sha256.h"
#include "bv/error.h"
#include "bv/orchestrator/settings.h"
#include "bv/security/error_sanitizer.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace bv::orchestrator {
namespace {

struct EventBusSingletonStorage {
  std::mutex mutex;
  std::unique_ptr<EventBus> instance;
};

EventBusSingletonStorage& EventBusSingleton() {
  static EventBusSingletonStorage storage;
  return storage;
}

struct PublishReentrancyGuard {  // suppress recursive publish from inside a subscriber
  explicit PublishReentrancyGuard(bool& flag) : flag_(flag) { flag_ = true; }
  ~PublishReentrancyGuard() { flag_ = false; }
  PublishReentrancyGuard(const PublishReentrancyGuard&) = delete;
  PublishReentrancyGuard& operator=(const PublishReentrancyGuard&) = delete;

 private:
  bool& flag_;
};

constexpr size_t kMaxEventBytes = 16 * 1024;

bool LooksLikeFilesystemPath(std::string_view value) {
  return value.find('/') != std::string_view::npos || value.find('\\') != std::string_view::npos;
}

bool FieldKeyImpliesSensitive(std::string_view key) {
  const std::string lowered = bv::AsciiLower(key);
  return lowered.find("path") != std::string::npos || lowered.find("destination") != std::string::npos ||
         lowered.find("secret") != std::string::npos || lowered.find("credential") != std::string::npos;
}

bool AppendWithLimit(std::string& out, std::string_view chunk, size_t limit) {
  if (chunk.size() > limit - out.size()) {
    return false;
  }
  out.append(chunk.data(), chunk.size());
  return true;
}

bool AppendEscapedWithLimit(std::string& out, std::string_view text, size_t limit) {
  for (unsigned char c : text) {
    std::string_view escaped;
    char buffer[7];
    switch (c) {
    case '\\':
      escaped = "\\\\";
      break;
    case '"':
      escaped = "\\\"";
      break;
    case '\b':
      escaped = "\\b";
      break;
    case '\f':
      escaped = "\\f";
      break;
    case '\n':
      escaped = "\\n";
      break;
    case '\r':
      escaped = "\\r";
      break;
    case '\t':
      escaped = "\\t";
      break;
    default:
      if (c < 0x20) {
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<int>(c));
        escaped = std::string_view(buffer, 6);
      } else {
        buffer[0] = static_cast<char>(c);
        escaped = std::string_view(buffer, 1);
      }
      break;
    }
    if (!AppendWithLimit(out, escaped, limit)) {
      return false;
    }
  }
  return true;
}

Event BuildOversizeEvent(const Event& original) {
  Event replacement;
  replacement.category = EventCategory::kDiagnostics;
  replacement.severity = EventSeverity::kWarning;
  replacement.event_id = "event_too_large";
  replacement.message = "Event payload exceeded logger limits";
  if (!original.event_id.empty()) {
    replacement.fields.emplace_back("original_event_id", original.event_id, FieldPrivacy::kHash);
  }
  replacement.fields.emplace_back("limit_bytes", std::to_string(kMaxEventBytes), FieldPrivacy::kPublic, true);
  return replacement;
}

const char* SeverityToString(EventSeverity severity) {
  switch (severity) {
  case EventSeverity::kDebug:
    return "debug";
  case EventSeverity::kInfo:
    return "info";
  case EventSeverity::kWarning:
    return "warning";
  case EventSeverity::kError:
    return "error";
  case EventSeverity::kCritical:
    return "critical";
  }
  return "info";
}

const char* CategoryToString(EventCategory category) {
  switch (category) {
  case EventCategory::kTelemetry:
    return "telemetry";
  case EventCategory::kLifecycle:
    return "lifecycle";
  case EventCategory::kSecurity:
    return "security";
  case EventCategory::kDiagnostics:
    return "diagnostics";
  }
  return "diagnostics";
}

std::string SanitizeFieldValue(const EventField& field) {
  switch (field.privacy) {
  case FieldPrivacy::kRedact:
    return "[REDACTED]";
  case FieldPrivacy::kHash:
    return HashForTelemetry(field.value);
  case FieldPrivacy::kPublic:
    break;
  }
  if (field.numeric) {
    return field.value;
  }
  if (FieldKeyImpliesSensitive(field.key) || LooksLikeFilesystemPath(field.value)) {
    return HashForTelemetry(field.value); // hash inferred sensitive values
  }
  return bv::security::RedactErrorMessage(field.value);
}

}  // namespace

std::string HashForTelemetry(std::string_view input) {
  return std::string{"hash:"} + bv::crypto::SHA256_Hex(input);
}

bool BuildEventJson(const Event& event, std::string_view timestamp, size_t max_bytes,
                    std::string& payload) {
  payload.clear();
  payload.reserve(std::min<size_t>(max_bytes, 256));
  if (!AppendWithLimit(payload, "{\"ts\":\"", max_bytes) ||
      !AppendEscapedWithLimit(payload, timestamp, max_bytes) ||
      !AppendWithLimit(payload, "\",\"severity\":\"", max_bytes) ||
      !AppendWithLimit(payload, SeverityToString(event.severity), max_bytes) ||
      !AppendWithLimit(payload, "\",\"category\":\"", max_bytes) ||
      !AppendWithLimit(payload, CategoryToString(event.category), max_bytes) ||
      !AppendWithLimit(payload, "\"", max_bytes)) {
    return false;
  }
  if (!event.event_id.empty()) {
    if (!AppendWithLimit(payload, ",\"event_id\":\"", max_bytes) ||
        !AppendEscapedWithLimit(payload, event.event_id, max_bytes) ||
        !AppendWithLimit(payload, "\"", max_bytes)) {
      return false;
    }
  }
  if (!event.message.empty()) {
    // Callers describe failures before publishing; this is the last stop
    // before the file.
    const auto sanitized_message = bv::security::RedactErrorMessage(event.message);
    if (!AppendWithLimit(payload, ",\"message\":\"", max_bytes) ||
        !AppendEscapedWithLimit(payload, sanitized_message, max_bytes) ||
        !AppendWithLimit(payload, "\"", max_bytes)) {
      return false;
    }
  }
  for (const auto& field : event.fields) {
    if (!AppendWithLimit(payload, ",\"", max_bytes) ||
        !AppendEscapedWithLimit(payload, field.key, max_bytes) ||
        !AppendWithLimit(payload, "\":", max_bytes)) {
      return false;
    }
    const std::string sanitized = SanitizeFieldValue(field);
    const bool bare_number = field.numeric && field.privacy == FieldPrivacy::kPublic;
    if (bare_number) {
      if (!AppendWithLimit(payload, sanitized, max_bytes)) {
        return false;
      }
    } else if (!AppendWithLimit(payload, "\"", max_bytes) ||
               !AppendEscapedWithLimit(payload, sanitized, max_bytes) ||
               !AppendWithLimit(payload, "\"", max_bytes)) {
      return false;
    }
  }
  return AppendWithLimit(payload, "}", max_bytes);
}

JsonLineLogger::JsonLineLogger()
    : JsonLineLogger(LogDirectory() / "bucketview.log", LogMaxBytes()) {}

JsonLineLogger::JsonLineLogger(std::filesystem::path log_path, size_t max_bytes)
    : log_path_(std::move(log_path)), max_bytes_(max_bytes) {}

std::string JsonLineLogger::FormatTimestamp(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &tt);
#else
  gmtime_r(&tt, &tm);
#endif
  auto fractional = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()) %
                    std::chrono::seconds(1);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  oss << '.' << std::setw(6) << std::setfill('0') << fractional.count() << 'Z';
  return oss.str();
}

void JsonLineLogger::EnsureOpen() {
  if (stream_.is_open()) {
    return;
  }
  std::error_code ec;
  auto parent = log_path_.parent_path();
  if (!parent.empty()) {
    const bool parent_exists = std::filesystem::exists(parent, ec);
    if (ec) {
      std::clog << "{\"event\":\"logger_error\",\"message\":\"log directory stat failed\",\"error_code\":"
                << ec.value() << "}" << std::endl;
      return;
    }
    if (!parent_exists) {
      std::filesystem::create_directories(parent, ec);
      if (ec) {
        std::clog << "{\"event\":\"logger_error\",\"message\":\"log directory create failed\",\"error_code\":"
                  << ec.value() << "}" << std::endl;
        return;
      }
    }
  }
  stream_.open(log_path_, std::ios::out | std::ios::app);
}

void JsonLineLogger::RotateIfNeeded(size_t incoming_bytes) {
  std::error_code ec;
  auto current_size = std::filesystem::file_size(log_path_, ec);
  if (ec) {
    // Missing file: nothing to rotate yet.
    return;
  }
  if (current_size + incoming_bytes <= max_bytes_) {
    return;
  }
  if (stream_.is_open()) {
    stream_.close();
  }
  for (size_t idx = max_files_; idx > 0; --idx) {
    std::filesystem::path src =
        idx == 1 ? log_path_ : std::filesystem::path(log_path_.string() + "." + std::to_string(idx - 1));
    std::filesystem::path dst =
        std::filesystem::path(log_path_.string() + "." + std::to_string(idx));
    std::error_code rotate_ec;
    const bool source_exists = std::filesystem::exists(src, rotate_ec);
    if (rotate_ec) {
      std::clog << "{\"event\":\"logger_error\",\"message\":\"log rotation stat failed\",\"error_code\":"
                << rotate_ec.value() << "}" << std::endl;
      continue;
    }
    if (!source_exists) {
      continue;
    }
    std::filesystem::remove(dst, rotate_ec);
    if (rotate_ec) {
      std::clog << "{\"event\":\"logger_error\",\"message\":\"log rotation cleanup failed\",\"error_code\":"
                << rotate_ec.value() << "}" << std::endl;
      rotate_ec.clear();
    }
    std::filesystem::rename(src, dst, rotate_ec);
    if (rotate_ec) {
      std::clog << "{\"event\":\"logger_error\",\"message\":\"log rotate rename failed\",\"error_code\":"
                << rotate_ec.value() << "}" << std::endl;
    }
  }
}

void JsonLineLogger::Log(const Event& event) {
  std::lock_guard<std::mutex> guard(mutex_);
  auto timestamp = FormatTimestamp(std::chrono::system_clock::now());
  std::string line;
  if (!BuildEventJson(event, timestamp, kMaxEventBytes, line)) {
    Event replacement = BuildOversizeEvent(event);
    if (!BuildEventJson(replacement, timestamp, kMaxEventBytes, line)) {
      return;
    }
  }

  RotateIfNeeded(line.size() + 1);
  EnsureOpen();
  if (!stream_.is_open()) {
    ++dropped_streak_;
    if (dropped_streak_ == 1) {
      std::clog << "{\"event\":\"logger_error\",\"message\":\"failed to open log file\"}"
                << std::endl;
    }
    return;
  }

  stream_ << line << '\n';
  stream_.flush();
  dropped_streak_ = 0;
}

JsonLineLogger& DefaultJsonLogger() {
  static JsonLineLogger logger;
  return logger;
}

EventBus::EventBus() {
  auto initial = std::make_shared<SubscriberList>();
  initial->push_back([](const Event& e) {
    try {
      DefaultJsonLogger().Log(e);
    } catch (const bv::Error& err) {
      // The log directory could not be resolved; keep publishing to the
      // remaining subscribers.
      std::clog << "{\"event\":\"logger_error\",\"message\":\"default logger unavailable\",\"error_code\":"
                << err.code << "}" << std::endl;
    }
  });
  std::lock_guard<std::mutex> guard(subscribers_mutex_);
  std::atomic_store_explicit(&subscribers_snapshot_, std::const_pointer_cast<const SubscriberList>(initial),
                             std::memory_order_release);
}

EventBus::~EventBus() {
  std::lock_guard<std::mutex> guard(subscribers_mutex_);
  std::atomic_store_explicit(&subscribers_snapshot_, std::shared_ptr<const SubscriberList>{},
                             std::memory_order_release);
}

EventBus& EventBus::Instance() {
  auto& storage = EventBusSingleton();
  std::lock_guard<std::mutex> guard(storage.mutex);
  if (!storage.instance) {
    storage.instance.reset(new EventBus()); // lazy init; constructor is private
  }
  return *storage.instance;
}

void EventBus::Publish(const Event& event) {
  static thread_local bool in_publish = false;
  if (in_publish) {
    std::clog << "{\"event\":\"event_bus_reentrancy\",\"message\":\"recursive publish suppressed\"}"
              << std::endl;
    return;
  }
  PublishReentrancyGuard guard(in_publish);
  auto targets = std::atomic_load_explicit(&subscribers_snapshot_, std::memory_order_acquire);
  if (!targets) {
    return;
  }
  for (const auto& subscriber : *targets) {
    if (subscriber) {
      subscriber(event);
    }
  }
}

void EventBus::Subscribe(Subscriber fn) {
  std::lock_guard<std::mutex> guard(subscribers_mutex_);
  auto current = std::atomic_load_explicit(&subscribers_snapshot_, std::memory_order_acquire);
  auto updated = current ? std::make_shared<SubscriberList>(*current) : std::make_shared<SubscriberList>();
  updated->push_back(std::move(fn));
  std::atomic_store_explicit(&subscribers_snapshot_, std::const_pointer_cast<const SubscriberList>(updated),
                             std::memory_order_release);
}

void ResetEventBusForTesting() {
  auto& storage = EventBusSingleton();
  std::lock_guard<std::mutex> guard(storage.mutex);
  storage.instance.reset();
}

} // namespace bv::orchestrator
