#include "devid/storage/device_id_store.h"

#include <utility>
#include <vector>

#include "devid/error.h"
#include "devid/errors.h"
#include "devid/orchestrator/diagnostics.h"

namespace devid::storage {
namespace {

bool NonEmpty(const std::optional<std::string>& value) {
  return value.has_value() && !value->empty();
}

void PublishWriteFailure(std::string_view operation, const std::exception& err) {
  namespace orch = devid::orchestrator;
  std::vector<orch::EventField> fields;
  fields.emplace_back("backend", "local_store");
  fields.emplace_back("operation", std::string(operation));
  fields.emplace_back("error", err.what(), orch::FieldPrivacy::kRedact);
  orch::PublishIdentityEvent(orch::EventCategory::kDiagnostics, orch::EventSeverity::kWarning,
                             "identity_persist_failed", errors::msg::kPersistFailed, std::move(fields));
}

}  // namespace

DeviceIdStore::DeviceIdStore(KeyValueStore& store, LocalStoreKeys keys)
    : store_(store), keys_(std::move(keys)) {}

std::optional<std::string> DeviceIdStore::PeekDeviceId() const {
  auto canonical = store_.GetString(keys_.device_id);
  if (NonEmpty(canonical)) {
    return canonical;
  }
  auto legacy = store_.GetString(keys_.legacy_device_id);
  if (NonEmpty(legacy)) {
    return legacy;
  }
  return std::nullopt;
}

std::optional<std::string> DeviceIdStore::ReadDeviceId() {
  auto canonical = store_.GetString(keys_.device_id);
  if (NonEmpty(canonical)) {
    return canonical;
  }
  auto legacy = store_.GetString(keys_.legacy_device_id);
  if (!NonEmpty(legacy)) {
    return std::nullopt;
  }
  try {
    store_.SetString(keys_.device_id, *legacy);
  } catch (const Error& err) {
    PublishWriteFailure("legacy_backfill", err);
  }
  return legacy;
}

void DeviceIdStore::WriteDeviceId(const std::string& id) {
  if (id.empty()) {
    throw Error{ErrorDomain::Validation, errors::validation::kInvalidIdentifier,
                std::string(errors::msg::kInvalidDeviceId)};
  }
  store_.SetString(keys_.device_id, id);
  try {
    store_.SetString(keys_.legacy_device_id, id); // older builds read only this key
  } catch (const Error& err) {
    PublishWriteFailure("legacy_mirror", err);
  }
}

void DeviceIdStore::ClearDeviceId() {
  store_.Remove(keys_.device_id);
  store_.Remove(keys_.legacy_device_id);
  store_.Remove(keys_.backup_id);
}

std::optional<std::string> DeviceIdStore::ReadBackupId() const {
  auto value = store_.GetString(keys_.backup_id);
  return NonEmpty(value) ? value : std::nullopt;
}

void DeviceIdStore::WriteBackupId(const std::string& id) {
  store_.SetString(keys_.backup_id, id);
}

bool DeviceIdStore::IsFirstLaunch() const {
  return store_.GetBool(keys_.first_launch).value_or(true);
}

void DeviceIdStore::SetFirstLaunch(bool value) {
  store_.SetBool(keys_.first_launch, value);
}

void DeviceIdStore::ClearFirstLaunch() {
  store_.Remove(keys_.first_launch);
}

bool DeviceIdStore::IsOnboardingComplete() const {
  return store_.GetBool(keys_.onboarding_complete).value_or(false);
}

}  // namespace devid::storage
