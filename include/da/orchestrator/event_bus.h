#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace da::orchestrator {

  // Structured logging primitives
  enum class EventSeverity { kDebug, kInfo, kWarning, kError, kCritical };

  enum class EventCategory { kTelemetry, kLifecycle, kStorage, kDiagnostics };

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

  // SHA-256 hex digest of the value, empty for empty input.
  std::string HashForTelemetry(std::string_view input);

  // Serializes one event as a single JSON object (no trailing newline).
  std::string FormatEventJson(const Event& event, std::chrono::system_clock::time_point tp);

  class JsonLineLogger {
  public:
    JsonLineLogger();
    explicit JsonLineLogger(std::filesystem::path log_path, size_t max_bytes = 0);
    void Log(const Event& event);

    const std::filesystem::path& path() const noexcept { return log_path_; }

  private:
    void EnsureOpen();
    void RotateIfNeeded(size_t incoming_bytes);
    static std::filesystem::path DefaultLogPath();
    static size_t ResolveMaxBytes();

    std::mutex mutex_;
    std::ofstream stream_;
    std::filesystem::path log_path_;
    size_t max_bytes_;
    const size_t max_files_ = 3;
    uint64_t failed_streak_{0};
  };

  inline JsonLineLogger& DefaultJsonLogger() {
    static JsonLineLogger logger;
    return logger;
  }

  class EventBus {
  public:
    using Subscriber = std::function<void(const Event&)>;

    static EventBus& Instance();

    void Publish(const Event& event);
    void Subscribe(Subscriber fn);

    // Drops every subscriber, the default JSON logger included.
    void ClearSubscribers();

    EventBus();
    ~EventBus();

  private:
    using SubscriberList = std::vector<Subscriber>;

    std::shared_ptr<const SubscriberList> subscribers_snapshot_;
    std::mutex subscribers_mutex_;
  };

  void ResetEventBusForTesting();

} // namespace da::orchestrator
