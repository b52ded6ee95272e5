#include "devid/orchestrator/identity_resolver.h"

#include <iostream>
#include <string>

#include "devid/core/uuid.h"
#include "identity_test_fakes.h"

using devid::core::IdentitySource;
using devid::platform::kCloudSyncNamespace;
using devid::platform::kDeviceLocalNamespace;
using devid::testing::Expect;
using devid::testing::ResolverRig;

namespace {

void TestCloudItemSurvivesReinstall() {
  ResolverRig rig;
  rig.cloud->Put(kCloudSyncNamespace, "cloud-id");
  auto resolver = rig.Cloud();
  resolver->Initialize();

  Expect(resolver->GetOrCreateId() == "cloud-id", "cloud item adopted after reinstall");
  Expect(resolver->Current().source == IdentitySource::kCloudSecureStore, "provenance is the cloud store");
  Expect(rig.device->Get(kDeviceLocalNamespace) == std::optional<std::string>("cloud-id"), "mirrored to device store");
  Expect(rig.LocalId() == std::optional<std::string>("cloud-id"), "mirrored to local store");
  Expect(!rig.BackupId().has_value(), "nothing replaced on an empty install");
}

void TestDeviceStoreCopiedUpToCloud() {
  ResolverRig rig;
  rig.device->Put(kDeviceLocalNamespace, "abc-123");
  auto resolver = rig.Cloud();
  resolver->Initialize();

  Expect(resolver->GetOrCreateId() == "abc-123", "device store value adopted");
  Expect(resolver->Current().source == IdentitySource::kLocalSecureStore, "provenance is the device store");
  Expect(rig.cloud->Get(kCloudSyncNamespace) == std::optional<std::string>("abc-123"), "copied up to the cloud");
}

void TestLocalValueMirroredToBothStores() {
  ResolverRig rig;
  rig.kv->Seed("mystic_device_id", "legacy-id");
  auto resolver = rig.Cloud();
  resolver->Initialize();

  Expect(resolver->GetOrCreateId() == "legacy-id", "legacy local value adopted");
  Expect(resolver->Current().source == IdentitySource::kLocalStore, "provenance is the local store");
  Expect(rig.LocalId() == std::optional<std::string>("legacy-id"), "canonical key back-filled");
  Expect(rig.device->Get(kDeviceLocalNamespace) == std::optional<std::string>("legacy-id"), "device store filled");
  Expect(rig.cloud->Get(kCloudSyncNamespace) == std::optional<std::string>("legacy-id"), "cloud store filled");
}

void TestGeneratesWhenEverythingEmpty() {
  ResolverRig rig;
  auto resolver = rig.Cloud();
  resolver->Initialize();

  const auto id = resolver->GetOrCreateId();
  Expect(devid::core::IsUuidV4(id), "generated id is a v4 uuid");
  Expect(resolver->Current().source == IdentitySource::kGenerated, "provenance is generated");
  Expect(resolver->IsFirstLaunch(), "first launch raised");
  Expect(rig.LocalId() == std::optional<std::string>(id), "local store written");
  Expect(rig.device->Get(kDeviceLocalNamespace) == std::optional<std::string>(id), "device store written");
  Expect(rig.cloud->Get(kCloudSyncNamespace) == std::optional<std::string>(id), "cloud store written");
  Expect(resolver->MarkFirstLaunchComplete(), "flag cleared");
  Expect(!resolver->IsFirstLaunch(), "first launch complete");
}

void TestCloudFailuresDegradeToAbsent() {
  ResolverRig rig;
  rig.device->Put(kDeviceLocalNamespace, "device-id");
  rig.cloud->fail_reads = true;
  rig.cloud->fail_writes = true;
  devid::testing::EventRecorder recorder;
  auto resolver = rig.Cloud();
  resolver->Initialize();

  Expect(resolver->GetOrCreateId() == "device-id", "unreadable cloud skipped");
  Expect(recorder.Count("identity_backend_unavailable") == 1, "unavailable cloud reported");
  Expect(recorder.Count("identity_persist_failed") == 1, "failed mirror reported");
  Expect(recorder.Count("identity_resolved") == 1, "resolution still completes");
}

void TestCloudOverridesStaleLocalValue() {
  ResolverRig rig;
  rig.cloud->Put(kCloudSyncNamespace, "cloud-id");
  rig.kv->Seed("devid.device_id", "stale-local");
  devid::testing::EventRecorder recorder;
  auto resolver = rig.Cloud();
  resolver->Initialize();

  Expect(resolver->GetOrCreateId() == "cloud-id", "cloud value wins");
  Expect(rig.LocalId() == std::optional<std::string>("cloud-id"), "local store realigned");
  Expect(rig.BackupId() == std::optional<std::string>("stale-local"), "displaced value kept as backup");
  Expect(recorder.Count("identity_recovered") == 1, "recovery reported");
}

void TestEarlyFallbackNeverClobbersCloud() {
  ResolverRig rig;
  rig.cloud->Put(kCloudSyncNamespace, "cloud-id");
  auto resolver = rig.Cloud();

  const auto early = resolver->GetOrCreateId();
  Expect(devid::core::IsUuidV4(early), "fallback generates before resolution");
  Expect(resolver->GetOrCreateId() == early, "fallback id stable until resolution");
  resolver->FlushBackgroundWrites();
  Expect(rig.cloud->Get(kCloudSyncNamespace) == std::optional<std::string>("cloud-id"),
         "write-if-absent left the cloud item alone");

  resolver->Initialize();
  Expect(resolver->GetOrCreateId() == "cloud-id", "resolution recovers the cloud id");
  Expect(rig.device->Get(kDeviceLocalNamespace) == std::optional<std::string>("cloud-id"), "device store realigned");
  Expect(rig.BackupId() == std::optional<std::string>(early), "fallback id kept as backup");
}

void TestIdempotentAcrossCalls() {
  ResolverRig rig;
  auto resolver = rig.Cloud();
  resolver->Initialize();
  const auto first = resolver->GetOrCreateId();
  for (int i = 0; i < 100; ++i) {
    Expect(resolver->GetOrCreateId() == first, "same id on every call");
  }
  resolver->Initialize();
  Expect(resolver->GetOrCreateId() == first, "second Initialize is a no-op");
  Expect(resolver->PeekId() == std::optional<std::string>(first), "peek returns the resolved id");

  auto restarted = rig.Cloud();
  Expect(!restarted->PeekId().has_value(), "peek never generates");
  restarted->Initialize();
  Expect(restarted->GetOrCreateId() == first, "same id after restart");
}

void TestResetClearsEveryLocalBackend() {
  ResolverRig rig;
  auto resolver = rig.Cloud();
  resolver->Initialize();
  const auto before = resolver->GetOrCreateId();

  resolver->Reset();
  Expect(resolver->State() == devid::core::ResolverState::kUninitialized, "back to uninitialized");
  Expect(!resolver->PeekId().has_value(), "no current id after reset");
  Expect(!rig.LocalId().has_value() && !rig.kv->Raw("mystic_device_id").has_value(), "local keys removed");
  Expect(!rig.device->Get(kDeviceLocalNamespace).has_value(), "device store cleared");
  Expect(!rig.cloud->Get(kCloudSyncNamespace).has_value(), "cloud store cleared");
  Expect(resolver->IsFirstLaunch(), "first launch flag reset");

  resolver->Initialize();
  const auto after = resolver->GetOrCreateId();
  Expect(after != before, "fresh id after reset");
  Expect(resolver->Current().source == IdentitySource::kGenerated, "new id generated");
}

}  // namespace

int main() {
  devid::testing::TempDir temp("devid_resolver_cloud_");
  devid::testing::RouteLogsTo(temp.path());
  TestCloudItemSurvivesReinstall();
  TestDeviceStoreCopiedUpToCloud();
  TestLocalValueMirroredToBothStores();
  TestGeneratesWhenEverythingEmpty();
  TestCloudFailuresDegradeToAbsent();
  TestCloudOverridesStaleLocalValue();
  TestEarlyFallbackNeverClobbersCloud();
  TestIdempotentAcrossCalls();
  TestResetClearsEveryLocalBackend();
  std::cout << "cloud resolver tests ok\n";
  return 0;
}
