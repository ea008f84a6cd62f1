#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sqrl::orchestrator {

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

  // Hex SHA-256 of |input|; empty input yields an empty string.
  std::string HashForTelemetry(std::string_view input);

  // Parses debug|info|warning|error|critical. "off" and unknown names yield nullopt.
  std::optional<EventSeverity> ParseSeverity(std::string_view name);

  // Serializes |event| as a single JSON object with privacy rules applied.
  std::string FormatEventJson(const Event& event, std::string_view timestamp);

  class JsonLineLogger {
  public:
    // Threshold from SQRL_LOG_LEVEL (default info, "off" disables output).
    JsonLineLogger();
    JsonLineLogger(std::ostream& out, std::optional<EventSeverity> threshold);

    void Log(const Event& event);

  private:
    std::string FormatTimestamp() const;

    std::mutex mutex_;
    std::ostream* out_;
    std::optional<EventSeverity> threshold_;
  };

  JsonLineLogger& DefaultJsonLogger();

  class EventBus {
  public:
    using Subscriber = std::function<void(const Event&)>;

    static EventBus& Instance();

    // Delivers |event| to every subscriber. Never throws; a subscriber that
    // throws anything is reported on std::clog and skipped.
    void Publish(const Event& event) noexcept;
    void Subscribe(Subscriber fn);

    EventBus();

  private:
    using SubscriberList = std::vector<Subscriber>;

    std::shared_ptr<const SubscriberList> SnapshotSubscribers();

    std::shared_ptr<const SubscriberList> subscribers_snapshot_;
    std::mutex subscribers_mutex_;
  };

  // Drops all subscribers and restores the default JSON sink.
  void ResetEventBusForTesting();

} // namespace sqrl::orchestrator
