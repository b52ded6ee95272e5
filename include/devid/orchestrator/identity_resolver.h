#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "devid/core/device_identity.h"
#include "devid/orchestrator/background_writer.h"
#include "devid/orchestrator/config.h"
#include "devid/orchestrator/resolution_strategy.h"
#include "devid/platform/capabilities.h"
#include "devid/platform/hardware_id.h"
#include "devid/platform/secure_store.h"
#include "devid/remote/identity_directory.h"
#include "devid/storage/device_id_store.h"
#include "devid/storage/key_value_store.h"

namespace devid::orchestrator {

// Collaborators handed to the resolver by the composition root. Only the
// local store is required.
struct ResolverBackends {
  std::shared_ptr<storage::KeyValueStore> local_store;
  platform::SecureStorePtr local_secure_store;
  platform::SecureStorePtr cloud_secure_store;
  platform::HardwareIdProviderPtr hardware_id;
  remote::RemoteIdentityDirectoryPtr directory;
};

// Owns the one device identifier of this process.
//
// Initialize runs the platform strategy once; concurrent callers block
// until the first one finishes. GetOrCreateId never waits on I/O beyond the
// local key-value store: before resolution completes it adopts or creates a
// local id and queues the secure-store copies on the background writer.
// Every backend failure is absorbed and reported on the EventBus; the only
// visible effect is DeviceIdentity::source and DeviceIdentity::persisted.
// Events are published with no resolver lock held, so subscribers may call
// PeekId, Current and State.
// TSK301_Device_Identity_Resolution
class IdentityResolver {
 public:
  // Throws devid::Error(Config, kMissingCollaborator) without a local store.
  IdentityResolver(ResolverBackends backends, platform::PlatformCapabilities capabilities,
                   ResolverConfig config = {});
  ~IdentityResolver();

  IdentityResolver(const IdentityResolver&) = delete;
  IdentityResolver& operator=(const IdentityResolver&) = delete;

  // No-op once resolved. Backend, strategy and random source failures all
  // end in kResolved.
  void Initialize();
  // Never empty. Stable for the rest of the process once returned.
  std::string GetOrCreateId();
  // Resolved id only; never generates.
  std::optional<std::string> PeekId() const;

  bool IsFirstLaunch() const;
  // Returns false, after reporting, when the flag could not be written.
  bool MarkFirstLaunchComplete();

  // Deletes the id from the local store and both secure stores and returns
  // to kUninitialized. The remote directory is left untouched.
  void Reset();

  // Snapshot for diagnostics. id is empty before any id is established.
  core::DeviceIdentity Current() const;
  core::ResolverState State() const;
  std::string_view StrategyName() const noexcept;

  // Waits for queued best-effort writes.
  void FlushBackgroundWrites();

 private:
  ResolutionOutcome RunStrategy();
  std::string ClaimId();
  void ScheduleSecureCopies(const std::string& id, std::uint64_t generation);
  void PublishOutcome(const ResolutionOutcome& outcome) const;

  ResolverBackends backends_;
  platform::PlatformCapabilities capabilities_;
  ResolverConfig config_;
  std::unique_ptr<ResolutionStrategy> strategy_;
  storage::DeviceIdStore local_ids_;

  mutable std::mutex mutex_;
  std::condition_variable resolved_cv_;
  core::ResolverState state_{core::ResolverState::kUninitialized};
  std::optional<core::DeviceIdentity> identity_;
  // Id handed out by GetOrCreateId or claimed by the running strategy.
  std::optional<core::DeviceIdentity> provisional_;
  // Set while Reset deletes stored copies outside mutex_.
  bool resetting_{false};
  // Bumped by Reset so queued copies of a wiped id are skipped.
  std::shared_ptr<std::atomic<std::uint64_t>> generation_;

  BackgroundWriter writer_;
};

}  // namespace devid::orchestrator
