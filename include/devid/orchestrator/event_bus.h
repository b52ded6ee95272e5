#pragma once

#include <atomic> // lock-free subscriber snapshot
#include <chrono>
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

#include "devid/common.h"
#include "devid/crypto/sha256.h"

namespace devid::orchestrator {

  // Structured logging primitives shared by every identity component.
  enum class EventSeverity { kInfo, kWarning, kError };

  // kLifecycle: identity created, recovered or reset. kSecurity: conflicting
  // hardware claims. kDiagnostics: degraded backends.
  enum class EventCategory { kLifecycle, kSecurity, kDiagnostics };

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

  // Full hex SHA-256 of |value|; the logger keeps a 16 character prefix.
  inline std::string HashIdentifier(std::string_view value) {
    return value.empty() ? std::string() : devid::HexEncode(devid::crypto::Sha256(value));
  }

  // Appends one JSON object per line to <log dir>/identity.log, rotating to
  // identity.log.1..3 once the size cap is reached. The directory comes from DEVID_LOG_DIR
  // (default ./logs) and the size cap from DEVID_LOG_MAX_SIZE.
  class JsonLineLogger {
  public:
    JsonLineLogger();
    explicit JsonLineLogger(std::filesystem::path log_path, size_t max_bytes = kDefaultMaxBytes);
    void Log(const Event& event);

    static constexpr size_t kDefaultMaxBytes = 4 * 1024 * 1024;

  private:
    std::string FormatTimestamp(std::chrono::system_clock::time_point tp);
    void EnsureOpen();
    void RotateIfNeeded(size_t incoming_bytes);
    static std::filesystem::path DefaultLogPath();
    static size_t ResolveMaxBytes();

    std::mutex mutex_;
    std::ofstream stream_;
    std::filesystem::path log_path_;
    size_t max_bytes_;
    const size_t max_files_ = 3;
    bool disabled_{false};
  };

  JsonLineLogger& DefaultJsonLogger();

  // Points the default logger at <log_dir>/identity.log. Call before the
  // first event is published.
  void ConfigureDefaultJsonLogger(const std::filesystem::path& log_dir, size_t max_bytes = 0);

  // Serializes an event the way JsonLineLogger writes it, minus the timestamp.
  std::string FormatEventJson(const Event& event);

  class EventBus {
  public:
    using Subscriber = std::function<void(const Event&)>;
    using SubscriptionId = std::uint64_t;

    static EventBus& Instance();

    // Delivers synchronously on the publishing thread. Recursive publishes
    // from inside a subscriber are dropped.
    void Publish(const Event& event);
    SubscriptionId Subscribe(Subscriber fn);
    void Unsubscribe(SubscriptionId id);

    EventBus();
    ~EventBus();

  private:
    struct Entry {
      SubscriptionId id;
      Subscriber fn;
    };
    using SubscriberList = std::vector<Entry>;

    std::shared_ptr<const SubscriberList> subscribers_snapshot_;
    std::mutex subscribers_mutex_;
    std::atomic<SubscriptionId> next_id_{1};
  };

  void ResetEventBusForTesting(); // test-only teardown

} // namespace devid::orchestrator
