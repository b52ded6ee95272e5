#include "devid/platform/secure_store.h"

#include <string>
#include <utility>

#include "devid/errors.h"
#include "devid/orchestrator/diagnostics.h"

namespace devid::platform {
namespace {

bool Usable(const SecureStorePtr& store) {
  if (!store) {
    return false;
  }
  if (store->IsAvailable()) {
    return true;
  }
  namespace orch = devid::orchestrator;
  orch::PublishIdentityEvent(orch::EventCategory::kDiagnostics, orch::EventSeverity::kWarning,
                             "secure_store_unavailable", errors::msg::kSecureStoreUnavailable,
                             {orch::EventField("store", std::string(store->Id()))});
  return false;
}

}  // namespace

SecureStorePtr SelectSecureStore(SecureStorePtr preferred, SecureStorePtr fallback) {
  if (Usable(preferred)) {
    return preferred;
  }
  if (Usable(fallback)) {
    return fallback;
  }
  return nullptr;
}

}  // namespace devid::platform
