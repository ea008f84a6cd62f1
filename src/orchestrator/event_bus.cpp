#include "sqrl/orchestrator/event_bus.h"

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <exception>
#include <iomanip>
#include <iostream>
#include <span>
#include <sstream>

#include "sqrl/crypto/provider.h"

namespace sqrl::orchestrator {
namespace {

struct EventBusSingletonStorage {
  std::mutex mutex;
  std::unique_ptr<EventBus> instance;
};

EventBusSingletonStorage& EventBusSingleton() {
  static EventBusSingletonStorage storage;
  return storage;
}

struct PublishReentrancyGuard {
  explicit PublishReentrancyGuard(bool& flag) : flag_(flag) { flag_ = true; }
  ~PublishReentrancyGuard() { flag_ = false; }
  PublishReentrancyGuard(const PublishReentrancyGuard&) = delete;
  PublishReentrancyGuard& operator=(const PublishReentrancyGuard&) = delete;

 private:
  bool& flag_;
};

std::string HashTag(std::string_view value) {
  auto digest = HashForTelemetry(value);
  if (digest.empty()) {
    return std::string{"hash:"};
  }
  return std::string{"hash:"} + digest;
}

std::string EscapeJson(std::string_view text) {
  std::string out;
  out.reserve(text.size() + 8);
  for (unsigned char c : text) {
    switch (c) {
    case '\\':
      out += "\\\\";
      break;
    case '"':
      out += "\\\"";
      break;
    case '\b':
      out += "\\b";
      break;
    case '\f':
      out += "\\f";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (c < 0x20) {
        std::ostringstream hex;
        hex << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c);
        out += hex.str();
      } else {
        out.push_back(static_cast<char>(c));
      }
      break;
    }
  }
  return out;
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

std::optional<EventSeverity> ThresholdFromEnvironment() {
  const char* env = std::getenv("SQRL_LOG_LEVEL");
  if (!env || *env == '\0') {
    return EventSeverity::kInfo;
  }
  return ParseSeverity(env);
}

} // namespace

std::string HashForTelemetry(std::string_view input) {
  if (input.empty()) {
    return "";
  }
  const auto* data = reinterpret_cast<const uint8_t*>(input.data());
  auto digest = sqrl::crypto::GetCryptoProvider().SHA256(std::span<const uint8_t>(data, input.size()));
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (uint8_t byte : digest) {
    oss << std::setw(2) << static_cast<int>(byte);
  }
  return oss.str();
}

std::optional<EventSeverity> ParseSeverity(std::string_view name) {
  if (name == "debug") {
    return EventSeverity::kDebug;
  }
  if (name == "info") {
    return EventSeverity::kInfo;
  }
  if (name == "warning") {
    return EventSeverity::kWarning;
  }
  if (name == "error") {
    return EventSeverity::kError;
  }
  if (name == "critical") {
    return EventSeverity::kCritical;
  }
  return std::nullopt;
}

std::string FormatEventJson(const Event& event, std::string_view timestamp) {
  std::string payload;
  payload.reserve(256);
  payload.append("{\"ts\":\"").append(EscapeJson(timestamp)).append("\"");
  payload.append(",\"severity\":\"").append(SeverityToString(event.severity)).append("\"");
  payload.append(",\"category\":\"").append(CategoryToString(event.category)).append("\"");
  if (!event.event_id.empty()) {
    payload.append(",\"event_id\":\"").append(EscapeJson(event.event_id)).append("\"");
  }
  if (!event.message.empty()) {
    payload.append(",\"message\":\"").append(EscapeJson(event.message)).append("\"");
  }
  for (const auto& field : event.fields) {
    payload.append(",\"").append(EscapeJson(field.key)).append("\":");
    std::string sanitized = field.value;
    if (field.privacy == FieldPrivacy::kRedact) {
      sanitized = "[REDACTED]";
    } else if (field.privacy == FieldPrivacy::kHash) {
      sanitized = HashTag(field.value);
    }
    if (field.numeric && field.privacy == FieldPrivacy::kPublic) {
      payload.append(sanitized);
    } else {
      payload.append("\"").append(EscapeJson(sanitized)).append("\"");
    }
  }
  payload.push_back('}');
  return payload;
}

JsonLineLogger::JsonLineLogger() : JsonLineLogger(std::clog, ThresholdFromEnvironment()) {}

JsonLineLogger::JsonLineLogger(std::ostream& out, std::optional<EventSeverity> threshold)
    : out_(&out), threshold_(threshold) {}

std::string JsonLineLogger::FormatTimestamp() const {
  const auto tp = std::chrono::system_clock::now();
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

void JsonLineLogger::Log(const Event& event) {
  std::lock_guard<std::mutex> guard(mutex_);
  if (!threshold_ || event.severity < *threshold_) {
    return;
  }
  *out_ << FormatEventJson(event, FormatTimestamp()) << std::endl;
}

JsonLineLogger& DefaultJsonLogger() {
  static JsonLineLogger logger;
  return logger;
}

EventBus::EventBus() {
  auto initial = std::make_shared<SubscriberList>();
  initial->push_back([](const Event& e) { DefaultJsonLogger().Log(e); });
  std::lock_guard<std::mutex> guard(subscribers_mutex_);
  subscribers_snapshot_ = std::move(initial);
}

EventBus& EventBus::Instance() {
  auto& storage = EventBusSingleton();
  std::lock_guard<std::mutex> guard(storage.mutex);
  if (!storage.instance) {
    storage.instance = std::make_unique<EventBus>();
  }
  return *storage.instance;
}

std::shared_ptr<const EventBus::SubscriberList> EventBus::SnapshotSubscribers() {
  std::lock_guard<std::mutex> guard(subscribers_mutex_);
  return subscribers_snapshot_;
}

void EventBus::Publish(const Event& event) noexcept {
  static thread_local bool in_publish = false;
  if (in_publish) {
    // Hashing a field may initialize the crypto provider, which publishes too.
    return;
  }
  PublishReentrancyGuard guard(in_publish);
  std::shared_ptr<const SubscriberList> targets;
  try {
    targets = SnapshotSubscribers();
  } catch (const std::exception& ex) {
    std::clog << "{\"event\":\"event_bus_error\",\"message\":\"" << EscapeJson(ex.what()) << "\"}"
              << std::endl;
    return;
  }
  if (!targets) {
    return;
  }
  for (const auto& subscriber : *targets) {
    if (!subscriber) {
      continue;
    }
    try {
      subscriber(event);
    } catch (const std::exception& ex) {
      std::clog << "{\"event\":\"event_bus_subscriber_error\",\"event_id\":\""
                << EscapeJson(event.event_id) << "\",\"message\":\"" << EscapeJson(ex.what())
                << "\"}" << std::endl;
    } catch (...) {
      std::clog << "{\"event\":\"event_bus_subscriber_error\",\"event_id\":\""
                << EscapeJson(event.event_id) << "\",\"message\":\"non-standard exception\"}"
                << std::endl;
    }
  }
}

void EventBus::Subscribe(Subscriber fn) {
  std::lock_guard<std::mutex> guard(subscribers_mutex_);
  auto updated = subscribers_snapshot_ ? std::make_shared<SubscriberList>(*subscribers_snapshot_)
                                       : std::make_shared<SubscriberList>();
  updated->push_back(std::move(fn));
  subscribers_snapshot_ = std::move(updated);
}

void ResetEventBusForTesting() {
  auto& storage = EventBusSingleton();
  std::lock_guard<std::mutex> guard(storage.mutex);
  storage.instance.reset();
}

} // namespace sqrl::orchestrator
