#pragma once

#include <optional>
#include <string>

#include "devid/storage/key_value_store.h"

namespace devid::storage {

// Local key-value store key names. The legacy names predate the devid
// library and must stay readable.
struct LocalStoreKeys {
  std::string device_id{"devid.device_id"};
  std::string legacy_device_id{"mystic_device_id"};
  std::string backup_id{"devid.backup_id"};
  std::string first_launch{"mystic_first_launch"};
  // Owned by onboarding; read for diagnostics only.
  std::string onboarding_complete{"devid.onboarding_complete"};
};

// Device-id view over a KeyValueStore. Reads prefer the canonical key and
// fall back to the legacy key; writes always land under the canonical key.
// TSK302_Legacy_Key_Migration
class DeviceIdStore {
 public:
  DeviceIdStore(KeyValueStore& store, LocalStoreKeys keys);

  // Canonical, then legacy. A legacy hit is copied under the canonical key;
  // a failed copy is reported and the value is still returned.
  std::optional<std::string> ReadDeviceId();
  // Same lookup order without any write.
  std::optional<std::string> PeekDeviceId() const;
  // Throws devid::Error(Storage, kPersistenceFailure) when the canonical
  // write fails. The legacy copy is best effort.
  void WriteDeviceId(const std::string& id);
  void ClearDeviceId();

  std::optional<std::string> ReadBackupId() const;
  void WriteBackupId(const std::string& id);

  // Defaults to true when never written.
  bool IsFirstLaunch() const;
  void SetFirstLaunch(bool value);
  void ClearFirstLaunch();

  bool IsOnboardingComplete() const;

  const LocalStoreKeys& keys() const noexcept { return keys_; }

 private:
  KeyValueStore& store_;
  LocalStoreKeys keys_;
};

}  // namespace devid::storage
