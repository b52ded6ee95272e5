#include "devid/orchestrator/event_bus.h"

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <exception>
#include <iostream>
#include <system_error>

namespace devid::orchestrator {
namespace {

constexpr size_t kMaxEventBytes = 16 * 1024;
constexpr size_t kHashTagChars = 16;

std::mutex& BusMutex() {
  static std::mutex mutex;
  return mutex;
}

std::unique_ptr<EventBus>& BusSlot() {
  static std::unique_ptr<EventBus> bus;
  return bus;
}

std::mutex& DefaultLoggerMutex() {
  static std::mutex mutex;
  return mutex;
}

std::unique_ptr<JsonLineLogger>& DefaultLoggerSlot() {
  static std::unique_ptr<JsonLineLogger> logger;
  return logger;
}

void AppendEscaped(std::string& out, std::string_view text) {
  for (const char ch : text) {
    switch (ch) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
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
      if (static_cast<unsigned char>(ch) < 0x20) {
        char escape[8];
        std::snprintf(escape, sizeof(escape), "\\u%04x", static_cast<unsigned>(ch));
        out += escape;
      } else {
        out += ch;
      }
    }
  }
}

// Builds one flat JSON object; keys are emitted in insertion order.
class JsonObject {
 public:
  void Add(std::string_view key, std::string_view value, bool quoted = true) {
    body_ += body_.empty() ? "{\"" : ",\"";
    AppendEscaped(body_, key);
    body_ += "\":";
    if (quoted) {
      body_ += '"';
      AppendEscaped(body_, value);
      body_ += '"';
    } else {
      body_ += value;
    }
  }

  std::string Finish() && {
    if (body_.empty()) {
      return "{}";
    }
    body_ += '}';
    return std::move(body_);
  }

 private:
  std::string body_;
};

std::string_view SeverityName(EventSeverity severity) {
  switch (severity) {
  case EventSeverity::kInfo:
    return "info";
  case EventSeverity::kWarning:
    return "warning";
  case EventSeverity::kError:
    return "error";
  }
  return "info";
}

std::string_view CategoryName(EventCategory category) {
  switch (category) {
  case EventCategory::kLifecycle:
    return "lifecycle";
  case EventCategory::kSecurity:
    return "security";
  case EventCategory::kDiagnostics:
    return "diagnostics";
  }
  return "diagnostics";
}

// Identifiers are never written in the clear, even when a caller forgets to
// mark the field. TSK307_Identity_Telemetry_Privacy
bool IsIdentifierKey(std::string_view key) {
  static constexpr std::array<std::string_view, 6> kIdentifierKeys = {
      "device_id", "id", "previous_id", "hardware_id", "candidate_id", "record_id"};
  return std::find(kIdentifierKeys.begin(), kIdentifierKeys.end(), key) != kIdentifierKeys.end();
}

std::string RenderField(const EventField& field, bool& quoted) {
  auto privacy = field.privacy;
  if (privacy == FieldPrivacy::kPublic && IsIdentifierKey(field.key)) {
    privacy = FieldPrivacy::kHash;
  }
  quoted = !(field.numeric && privacy == FieldPrivacy::kPublic);
  switch (privacy) {
  case FieldPrivacy::kRedact:
    return "[REDACTED]";
  case FieldPrivacy::kHash:
    return "sha256:" + HashIdentifier(field.value).substr(0, kHashTagChars);
  case FieldPrivacy::kPublic:
    break;
  }
  return field.value;
}

std::string RenderEvent(const Event& event, std::string_view timestamp) {
  JsonObject json;
  if (!timestamp.empty()) {
    json.Add("ts", timestamp);
  }
  json.Add("severity", SeverityName(event.severity));
  json.Add("category", CategoryName(event.category));
  if (!event.event_id.empty()) {
    json.Add("event_id", event.event_id);
  }
  if (!event.message.empty()) {
    json.Add("message", event.message);
  }
  for (const auto& field : event.fields) {
    bool quoted = true;
    const auto value = RenderField(field, quoted);
    json.Add(field.key, value, quoted);
  }
  return std::move(json).Finish();
}

// Oversized events are replaced by a marker so one runaway field cannot
// flood the log.
std::string RenderBounded(const Event& event, std::string_view timestamp) {
  auto line = RenderEvent(event, timestamp);
  if (line.size() <= kMaxEventBytes) {
    return line;
  }
  Event marker;
  marker.severity = EventSeverity::kWarning;
  marker.event_id = "event_too_large";
  marker.message = "Event payload exceeded logger limits";
  marker.fields.emplace_back("original_event_id", event.event_id.substr(0, 128));
  marker.fields.emplace_back("limit_bytes", std::to_string(kMaxEventBytes), FieldPrivacy::kPublic, true);
  return RenderEvent(marker, timestamp);
}

void ReportLoggerError(std::string_view what, int code) {
  std::clog << "{\"event\":\"logger_error\",\"message\":\"" << what << "\",\"error_code\":" << code
            << "}" << std::endl;
}

void ReportSubscriberError(std::uint64_t subscriber, std::string_view event_id, std::string_view what) {
  std::string line = "{\"event\":\"event_bus_subscriber_error\",\"subscriber\":" + std::to_string(subscriber) +
                     ",\"event_id\":\"";
  AppendEscaped(line, event_id);
  line += "\",\"message\":\"";
  AppendEscaped(line, what);
  line += "\"}";
  std::clog << line << std::endl;
}

} // namespace

JsonLineLogger& DefaultJsonLogger() {
  std::lock_guard<std::mutex> guard(DefaultLoggerMutex());
  auto& slot = DefaultLoggerSlot();
  if (!slot) {
    slot = std::make_unique<JsonLineLogger>();
  }
  return *slot;
}

void ConfigureDefaultJsonLogger(const std::filesystem::path& log_dir, size_t max_bytes) {
  std::lock_guard<std::mutex> guard(DefaultLoggerMutex());
  DefaultLoggerSlot() = std::make_unique<JsonLineLogger>(log_dir / "identity.log", max_bytes);
}

std::string FormatEventJson(const Event& event) {
  return RenderBounded(event, {});
}

JsonLineLogger::JsonLineLogger() : JsonLineLogger(DefaultLogPath(), ResolveMaxBytes()) {}

JsonLineLogger::JsonLineLogger(std::filesystem::path log_path, size_t max_bytes)
    : log_path_(std::move(log_path)), max_bytes_(max_bytes == 0 ? kDefaultMaxBytes : max_bytes) {}

std::filesystem::path JsonLineLogger::DefaultLogPath() {
  const char* dir = std::getenv("DEVID_LOG_DIR");
  if (dir != nullptr && *dir != '\0') {
    return std::filesystem::path(dir) / "identity.log";
  }
  return std::filesystem::path("logs") / "identity.log";
}

size_t JsonLineLogger::ResolveMaxBytes() {
  const char* raw = std::getenv("DEVID_LOG_MAX_SIZE");
  if (raw == nullptr || *raw == '\0') {
    return kDefaultMaxBytes;
  }
  char* end = nullptr;
  const unsigned long long parsed = std::strtoull(raw, &end, 10);
  if (end == raw || *end != '\0' || parsed == 0) {
    return kDefaultMaxBytes;
  }
  return static_cast<size_t>(parsed);
}

std::string JsonLineLogger::FormatTimestamp(std::chrono::system_clock::time_point tp) {
  const auto seconds = std::chrono::system_clock::to_time_t(tp);
  std::tm utc{};
#if defined(_WIN32)
  gmtime_s(&utc, &seconds);
#else
  gmtime_r(&seconds, &utc);
#endif
  const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count() %
                      1000000;
  char buffer[40];
  const size_t used = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &utc);
  std::snprintf(buffer + used, sizeof(buffer) - used, ".%06lldZ", static_cast<long long>(micros));
  return buffer;
}

void JsonLineLogger::EnsureOpen() {
  if (stream_.is_open() || disabled_) {
    return;
  }
  if (const auto parent = log_path_.parent_path(); !parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      ReportLoggerError("log directory create failed", ec.value());
      disabled_ = true;
      return;
    }
  }
  stream_.open(log_path_, std::ios::out | std::ios::app);
  if (!stream_.is_open()) {
    ReportLoggerError("failed to open log file", 0);
    disabled_ = true;
  }
}

// identity.log -> identity.log.1 -> ... -> identity.log.<max_files_>, the
// oldest copy falling off the end.
void JsonLineLogger::RotateIfNeeded(size_t incoming_bytes) {
  std::error_code ec;
  const auto size = std::filesystem::file_size(log_path_, ec);
  if (ec || size + incoming_bytes <= max_bytes_) {
    return;
  }
  stream_.close();
  const auto numbered = [this](size_t n) {
    auto path = log_path_;
    path += "." + std::to_string(n);
    return path;
  };
  std::filesystem::remove(numbered(max_files_), ec);
  for (size_t n = max_files_; n > 1; --n) {
    ec.clear();
    std::filesystem::rename(numbered(n - 1), numbered(n), ec);
  }
  ec.clear();
  std::filesystem::rename(log_path_, numbered(1), ec);
  if (ec) {
    ReportLoggerError("log rotate rename failed", ec.value());
  }
}

void JsonLineLogger::Log(const Event& event) {
  std::lock_guard<std::mutex> guard(mutex_);
  if (disabled_) {
    return;
  }
  const auto line = RenderBounded(event, FormatTimestamp(std::chrono::system_clock::now()));
  RotateIfNeeded(line.size() + 1);
  EnsureOpen();
  if (stream_.is_open()) {
    stream_ << line << '\n';
    stream_.flush();
  }
}

EventBus::EventBus() {
  // Id 0 is the default logger; Unsubscribe never removes it.
  auto initial = std::make_shared<SubscriberList>();
  initial->push_back(Entry{0, [](const Event& e) { DefaultJsonLogger().Log(e); }});
  std::atomic_store(&subscribers_snapshot_, std::shared_ptr<const SubscriberList>(std::move(initial)));
}

EventBus::~EventBus() = default;

EventBus& EventBus::Instance() {
  std::lock_guard<std::mutex> guard(BusMutex());
  auto& bus = BusSlot();
  if (!bus) {
    bus = std::make_unique<EventBus>();
  }
  return *bus;
}

void EventBus::Publish(const Event& event) {
  static thread_local bool publishing = false;
  if (publishing) {
    std::clog << "{\"event\":\"event_bus_reentrancy\",\"message\":\"recursive publish suppressed\"}"
              << std::endl;
    return;
  }
  struct PublishingScope {
    bool& flag;
    ~PublishingScope() { flag = false; }
  } scope{publishing};
  publishing = true;
  const auto subscribers = std::atomic_load(&subscribers_snapshot_);
  for (const auto& entry : *subscribers) {
    if (!entry.fn) {
      continue;
    }
    // A failing subscriber must not reach the publisher or starve the rest.
    try {
      entry.fn(event);
    } catch (const std::exception& ex) {
      ReportSubscriberError(entry.id, event.event_id, ex.what());
    }
  }
}

EventBus::SubscriptionId EventBus::Subscribe(Subscriber fn) {
  std::lock_guard<std::mutex> guard(subscribers_mutex_);
  const SubscriptionId id = next_id_++;
  auto updated = std::make_shared<SubscriberList>(*std::atomic_load(&subscribers_snapshot_));
  updated->push_back(Entry{id, std::move(fn)});
  std::atomic_store(&subscribers_snapshot_, std::shared_ptr<const SubscriberList>(std::move(updated)));
  return id;
}

void EventBus::Unsubscribe(SubscriptionId id) {
  if (id == 0) {
    return;
  }
  std::lock_guard<std::mutex> guard(subscribers_mutex_);
  auto updated = std::make_shared<SubscriberList>(*std::atomic_load(&subscribers_snapshot_));
  updated->erase(std::remove_if(updated->begin(), updated->end(),
                                [id](const Entry& entry) { return entry.id == id; }),
                 updated->end());
  std::atomic_store(&subscribers_snapshot_, std::shared_ptr<const SubscriberList>(std::move(updated)));
}

void ResetEventBusForTesting() {
  std::lock_guard<std::mutex> guard(BusMutex());
  BusSlot().reset();
}

} // namespace devid::orchestrator
