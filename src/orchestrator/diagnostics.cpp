#include "devid/orchestrator/diagnostics.h"

#include <iostream>

#include "devid/errors.h"

namespace devid::orchestrator {
namespace {

thread_local std::vector<Event>* t_deferred = nullptr;

void PublishBackendFailure(std::string_view event_id, std::string_view message, Backend backend,
                           std::string_view operation, const std::exception& err) {
  std::vector<EventField> fields;
  fields.emplace_back("backend", std::string(BackendName(backend)));
  fields.emplace_back("operation", std::string(operation));
  if (const auto* typed = dynamic_cast<const Error*>(&err)) {
    fields.emplace_back("error_code", std::to_string(typed->code), FieldPrivacy::kPublic, true);
    if (typed->native_code) {
      fields.emplace_back("native_code", std::to_string(*typed->native_code), FieldPrivacy::kPublic, true);
    }
  }
  // Messages may embed paths or record ids.
  fields.emplace_back("error", err.what(), FieldPrivacy::kRedact);
  PublishIdentityEvent(EventCategory::kDiagnostics, EventSeverity::kWarning, event_id, message,
                       std::move(fields));
}

}  // namespace

std::string_view BackendName(Backend backend) noexcept {
  switch (backend) {
  case Backend::kLocalStore:
    return "local_store";
  case Backend::kLocalSecureStore:
    return "local_secure_store";
  case Backend::kCloudSecureStore:
    return "cloud_secure_store";
  case Backend::kHardwareId:
    return "hardware_id";
  case Backend::kRemoteDirectory:
    return "remote_directory";
  }
  return "unknown";
}

void PublishIdentityEvent(EventCategory category, EventSeverity severity, std::string_view event_id,
                          std::string_view message, std::vector<EventField> fields) {
  Event event;
  event.category = category;
  event.severity = severity;
  event.event_id = std::string(event_id);
  event.message = std::string(message);
  event.fields = std::move(fields);
  if (t_deferred != nullptr) {
    t_deferred->push_back(std::move(event));
    return;
  }
  EventBus::Instance().Publish(event);
}

DeferredEvents::DeferredEvents() {
  if (t_deferred == nullptr) {
    t_deferred = &events_;
    owner_ = true;
  }
}

DeferredEvents::~DeferredEvents() {
  try {
    Release();
  } catch (const std::exception& ex) {
    std::clog << "{\"event\":\"deferred_events_dropped\",\"message\":\"" << ex.what() << "\"}" << std::endl;
  }
}

void DeferredEvents::Release() {
  if (!owner_) {
    return;
  }
  owner_ = false;
  t_deferred = nullptr;
  auto held = std::move(events_);
  events_.clear();
  for (const auto& event : held) {
    EventBus::Instance().Publish(event);
  }
}

void ReportBackendUnavailable(Backend backend, std::string_view operation, const std::exception& err) {
  PublishBackendFailure("identity_backend_unavailable", errors::msg::kBackendUnavailable, backend,
                        operation, err);
}

void ReportPersistFailure(Backend backend, std::string_view operation, const std::exception& err) {
  PublishBackendFailure("identity_persist_failed", errors::msg::kPersistFailed, backend, operation, err);
}

}  // namespace devid::orchestrator
