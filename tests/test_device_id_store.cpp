#include "devid/storage/device_id_store.h"

#include <iostream>
#include <string>

#include "identity_test_fakes.h"

using devid::testing::Expect;

namespace {

void TestLegacyKeyIsBackFilled() {
  devid::testing::MemoryKeyValueStore kv;
  kv.Seed("mystic_device_id", "legacy-id");
  devid::storage::DeviceIdStore ids(kv, {});

  Expect(ids.PeekDeviceId() == std::optional<std::string>("legacy-id"), "peek sees legacy value");
  Expect(!kv.Raw("devid.device_id").has_value(), "peek does not write");

  Expect(ids.ReadDeviceId() == std::optional<std::string>("legacy-id"), "read falls back to legacy key");
  Expect(kv.Raw("devid.device_id") == std::optional<std::string>("legacy-id"), "canonical key back-filled");
}

void TestCanonicalWinsOverLegacy() {
  devid::testing::MemoryKeyValueStore kv;
  kv.Seed("mystic_device_id", "old");
  kv.Seed("devid.device_id", "new");
  devid::storage::DeviceIdStore ids(kv, {});
  Expect(ids.ReadDeviceId() == std::optional<std::string>("new"), "canonical key read first");
  Expect(kv.Raw("mystic_device_id") == std::optional<std::string>("old"), "legacy key left alone on read");
}

void TestEmptyValuesAreAbsent() {
  devid::testing::MemoryKeyValueStore kv;
  kv.Seed("devid.device_id", "");
  kv.Seed("mystic_device_id", "");
  devid::storage::DeviceIdStore ids(kv, {});
  Expect(!ids.ReadDeviceId().has_value(), "empty strings count as missing");
}

void TestBackFillFailureStillReturnsValue() {
  devid::testing::MemoryKeyValueStore kv;
  kv.Seed("mystic_device_id", "legacy-id");
  kv.fail_writes = true;
  devid::testing::EventRecorder recorder;
  devid::storage::DeviceIdStore ids(kv, {});
  Expect(ids.ReadDeviceId() == std::optional<std::string>("legacy-id"), "value returned despite failed copy");
  Expect(recorder.Count("identity_persist_failed") == 1, "failed back-fill reported");
}

void TestWriteMirrorsLegacyAndClears() {
  devid::testing::MemoryKeyValueStore kv;
  devid::storage::DeviceIdStore ids(kv, {});
  ids.WriteDeviceId("abc");
  Expect(kv.Raw("devid.device_id") == std::optional<std::string>("abc"), "canonical written");
  Expect(kv.Raw("mystic_device_id") == std::optional<std::string>("abc"), "legacy mirror written");

  ids.WriteBackupId("previous");
  Expect(ids.ReadBackupId() == std::optional<std::string>("previous"), "backup id round trip");

  ids.ClearDeviceId();
  Expect(!ids.PeekDeviceId().has_value(), "clear removes both id keys");
  Expect(!ids.ReadBackupId().has_value(), "clear removes backup id");
}

void TestFirstLaunchFlag() {
  devid::testing::MemoryKeyValueStore kv;
  devid::storage::DeviceIdStore ids(kv, {});
  Expect(ids.IsFirstLaunch(), "defaults to true");
  ids.SetFirstLaunch(false);
  Expect(!ids.IsFirstLaunch(), "cleared flag reads false");
  ids.ClearFirstLaunch();
  Expect(ids.IsFirstLaunch(), "removed flag defaults to true again");
  Expect(!ids.IsOnboardingComplete(), "onboarding defaults to false");
  kv.SetBool("devid.onboarding_complete", true);
  Expect(ids.IsOnboardingComplete(), "onboarding flag read from its own key");
}

void TestCanonicalWriteFailureThrows() {
  devid::testing::MemoryKeyValueStore kv;
  kv.fail_writes = true;
  devid::storage::DeviceIdStore ids(kv, {});
  bool threw = false;
  try {
    ids.WriteDeviceId("abc");
  } catch (const devid::Error& err) {
    threw = err.code == devid::errors::storage::kPersistenceFailure;
  }
  Expect(threw, "canonical write failure propagates");
}

void TestEmptyIdRejected() {
  devid::testing::MemoryKeyValueStore kv;
  devid::storage::DeviceIdStore ids(kv, {});
  bool rejected = false;
  try {
    ids.WriteDeviceId("");
  } catch (const devid::Error& err) {
    rejected = err.domain == devid::ErrorDomain::Validation &&
               err.code == devid::errors::validation::kInvalidIdentifier;
  }
  Expect(rejected, "empty id rejected before touching the store");
  Expect(!kv.Raw("devid.device_id").has_value(), "nothing written for an empty id");
}

}  // namespace

int main() {
  devid::testing::TempDir temp("devid_ids_");
  devid::testing::RouteLogsTo(temp.path());
  TestLegacyKeyIsBackFilled();
  TestCanonicalWinsOverLegacy();
  TestEmptyValuesAreAbsent();
  TestBackFillFailureStillReturnsValue();
  TestWriteMirrorsLegacyAndClears();
  TestFirstLaunchFlag();
  TestCanonicalWriteFailureThrows();
  TestEmptyIdRejected();
  std::cout << "device id store tests ok\n";
  return 0;
}
