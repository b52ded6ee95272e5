#pragma once

#include <exception>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "devid/error.h"
#include "devid/orchestrator/event_bus.h"

namespace devid::orchestrator {

enum class Backend {
  kLocalStore,
  kLocalSecureStore,
  kCloudSecureStore,
  kHardwareId,
  kRemoteDirectory,
};

std::string_view BackendName(Backend backend) noexcept;

enum class LookupStatus { kFound, kAbsent, kUnavailable };

template <typename T>
struct Lookup {
  LookupStatus status{LookupStatus::kAbsent};
  std::optional<T> value{};

  [[nodiscard]] bool found() const noexcept { return status == LookupStatus::kFound; }
};

void PublishIdentityEvent(EventCategory category, EventSeverity severity, std::string_view event_id,
                          std::string_view message, std::vector<EventField> fields = {});

// While alive, PublishIdentityEvent calls made on this thread are held back
// and delivered when the scope ends. Declare it before taking a lock so
// subscribers run after the lock is released. Nested scopes join the
// outermost one.
class DeferredEvents {
 public:
  DeferredEvents();
  ~DeferredEvents();
  DeferredEvents(const DeferredEvents&) = delete;
  DeferredEvents& operator=(const DeferredEvents&) = delete;

  // Delivers the held events now and stops deferring.
  void Release();

 private:
  bool owner_{false};
  std::vector<Event> events_;
};

// Warning event for a read that failed for a reason other than "not found".
void ReportBackendUnavailable(Backend backend, std::string_view operation, const std::exception& err);
// Warning event for a best-effort write that did not land.
void ReportPersistFailure(Backend backend, std::string_view operation, const std::exception& err);

// Runs a read that yields std::optional<T>. Missing values and kNotFound
// errors are kAbsent; every other failure is reported and becomes
// kUnavailable. Exceptions from event subscribers are contained by the bus,
// so reporting never turns a failed read into a throw.
template <typename T, typename Fn>
Lookup<T> GuardedLookup(Backend backend, std::string_view operation, Fn&& fn) {
  try {
    std::optional<T> value = fn();
    if (value) {
      return Lookup<T>{LookupStatus::kFound, std::move(value)};
    }
    return Lookup<T>{};
  } catch (const Error& err) {
    if (errors::IsNotFound(err.domain, err.code)) {
      return Lookup<T>{};
    }
    ReportBackendUnavailable(backend, operation, err);
  } catch (const std::exception& ex) {
    ReportBackendUnavailable(backend, operation, ex);
  }
  return Lookup<T>{LookupStatus::kUnavailable, std::nullopt};
}

// Runs a best-effort write. Returns false, after reporting, when it throws.
template <typename Fn>
bool GuardedWrite(Backend backend, std::string_view operation, Fn&& fn) {
  try {
    fn();
    return true;
  } catch (const Error& err) {
    ReportPersistFailure(backend, operation, err);
  } catch (const std::exception& ex) {
    ReportPersistFailure(backend, operation, ex);
  }
  return false;
}

}  // namespace devid::orchestrator
