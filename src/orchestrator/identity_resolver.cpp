#include "devid/orchestrator/identity_resolver.h"

#include <utility>
#include <vector>

#include "devid/core/uuid.h"
#include "devid/error.h"
#include "devid/errors.h"
#include "devid/orchestrator/diagnostics.h"
#include "devid/remote/deadline_directory.h"

namespace devid::orchestrator {
namespace {

storage::KeyValueStore& RequireLocalStore(const std::shared_ptr<storage::KeyValueStore>& store) {
  if (!store) {
    throw Error(ErrorDomain::Config, errors::config::kMissingCollaborator,
                "IdentityResolver requires a local key-value store");
  }
  return *store;
}

void PublishResolutionFailure(const std::exception& err) {
  std::vector<EventField> fields;
  if (const auto* typed = dynamic_cast<const Error*>(&err)) {
    fields.emplace_back("error_code", std::to_string(typed->code), FieldPrivacy::kPublic, true);
  }
  fields.emplace_back("error", err.what(), FieldPrivacy::kRedact);
  PublishIdentityEvent(EventCategory::kDiagnostics, EventSeverity::kError, "identity_resolution_failed",
                       errors::msg::kIdentityResolutionFailed, std::move(fields));
}

// A failed random source must not leave the process without an id.
std::string NewDeviceId() {
  try {
    return core::GenerateUuidV4();
  } catch (const Error& err) {
    PublishIdentityEvent(EventCategory::kSecurity, EventSeverity::kWarning, "identity_random_fallback",
                         errors::msg::kRandomUnavailable,
                         {EventField("error_code", std::to_string(err.code), FieldPrivacy::kPublic, true),
                          EventField("error", err.what(), FieldPrivacy::kRedact)});
  }
  return core::GenerateFallbackUuidV4();
}

void PublishInMemoryOnly(const std::string& id) {
  PublishIdentityEvent(EventCategory::kLifecycle, EventSeverity::kWarning, "identity_in_memory_only",
                       errors::msg::kIdentityInMemoryOnly, {EventField("device_id", id, FieldPrivacy::kHash)});
}

}  // namespace

IdentityResolver::IdentityResolver(ResolverBackends backends, platform::PlatformCapabilities capabilities,
                                   ResolverConfig config)
    : backends_(std::move(backends)),
      capabilities_(capabilities),
      config_(std::move(config)),
      strategy_(SelectStrategy(capabilities_)),
      local_ids_(RequireLocalStore(backends_.local_store), config_.keys),
      generation_(std::make_shared<std::atomic<std::uint64_t>>(0)),
      writer_(config_.background_queue_depth) {
  // TSK306_Remote_Deadlines
  backends_.directory = remote::WithDeadline(std::move(backends_.directory), config_.remote_timeout);
}

IdentityResolver::~IdentityResolver() = default;

void IdentityResolver::Initialize() {
  {
    std::unique_lock<std::mutex> lock(mutex_);
    resolved_cv_.wait(lock, [this] { return state_ != core::ResolverState::kResolving && !resetting_; });
    if (state_ == core::ResolverState::kResolved) {
      return;
    }
    state_ = core::ResolverState::kResolving;
  }

  // Waiters must not block forever if allocation fails below.
  struct RollBack {
    IdentityResolver* self;
    bool armed{true};
    ~RollBack() {
      if (!armed) {
        return;
      }
      {
        std::lock_guard<std::mutex> lock(self->mutex_);
        self->state_ = core::ResolverState::kUninitialized;
      }
      self->resolved_cv_.notify_all();
    }
  } rollback{this};

  // Copies queued by an early GetOrCreateId must land before the strategy
  // reads the secure stores.
  writer_.Flush();
  ResolutionOutcome outcome = RunStrategy();

  if (outcome.replaced_id) {
    GuardedWrite(Backend::kLocalStore, "write_backup_id",
                 [&] { local_ids_.WriteBackupId(*outcome.replaced_id); });
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    identity_ = core::DeviceIdentity{outcome.id, outcome.source, false, outcome.persisted_locally};
    provisional_.reset();
    state_ = core::ResolverState::kResolved;
    rollback.armed = false;
  }
  resolved_cv_.notify_all();
  PublishOutcome(outcome);
}

ResolutionOutcome IdentityResolver::RunStrategy() {
  ResolutionContext ctx{local_ids_,
                        backends_.local_secure_store.get(),
                        backends_.cloud_secure_store.get(),
                        backends_.hardware_id.get(),
                        backends_.directory.get(),
                        config_,
                        [this] { return ClaimId(); }};
  try {
    return strategy_->Resolve(ctx);
  } catch (const Error& err) {
    PublishResolutionFailure(err);
  } catch (const std::exception& ex) {
    PublishResolutionFailure(ex);
  }
  // The failed strategy may have stopped after the local store already
  // confirmed an id; that id must survive.
  return AdoptLocalOrGenerate(ctx);
}

std::string IdentityResolver::ClaimId() {
  DeferredEvents deferred;
  std::lock_guard<std::mutex> lock(mutex_);
  if (!provisional_) {
    provisional_ = core::DeviceIdentity{NewDeviceId(), core::IdentitySource::kGenerated, false, false};
  }
  return provisional_->id;
}

std::string IdentityResolver::GetOrCreateId() {
  // Declared before the lock: events raised below reach subscribers only
  // after mutex_ is released.
  DeferredEvents deferred;
  std::unique_lock<std::mutex> lock(mutex_);
  resolved_cv_.wait(lock, [this] { return !resetting_; });
  if (identity_) {
    return identity_->id;
  }
  if (provisional_) {
    return provisional_->id;
  }
  auto existing = GuardedLookup<std::string>(Backend::kLocalStore, "read_device_id",
                                             [&] { return local_ids_.ReadDeviceId(); });
  if (existing.found() && !existing.value->empty()) {
    provisional_ = core::DeviceIdentity{*existing.value, core::IdentitySource::kLocalStore, false, true};
    return provisional_->id;
  }

  const std::string id = NewDeviceId();
  const bool persisted =
      GuardedWrite(Backend::kLocalStore, "write_device_id", [&] { local_ids_.WriteDeviceId(id); });
  GuardedWrite(Backend::kLocalStore, "set_first_launch", [&] { local_ids_.SetFirstLaunch(true); });
  provisional_ = core::DeviceIdentity{id, core::IdentitySource::kGenerated, false, persisted};
  // Queued under the lock so Initialize's flush always covers them. A
  // running strategy writes the secure stores itself.
  if (state_ == core::ResolverState::kUninitialized) {
    ScheduleSecureCopies(id, generation_->load());
  }
  if (!persisted) {
    PublishInMemoryOnly(id);
  }
  return id;
}

// Write-if-absent so an id already present in a secure store, possibly one
// restored from the cloud, is never clobbered by the fallback.
// TSK305_Background_Persistence
void IdentityResolver::ScheduleSecureCopies(const std::string& id, std::uint64_t generation) {
  if (!capabilities_.has_cloud_secure_store && !capabilities_.has_hardware_id) {
    return;
  }
  auto current = generation_;
  auto submit = [&](platform::SecureStorePtr store, std::string_view ns, std::string name) {
    if (!store) {
      return;
    }
    writer_.Submit(std::move(name), [store, ns, id, current, generation] {
      if (current->load() != generation) {
        return;
      }
      auto existing = store->Read(ns, platform::kDeviceIdItemKey);
      if (existing && !existing->empty()) {
        return;
      }
      store->Write(ns, platform::kDeviceIdItemKey, id);
    });
  };
  submit(backends_.local_secure_store, platform::kDeviceLocalNamespace, "local_secure_store_copy");
  if (capabilities_.has_cloud_secure_store) {
    submit(backends_.cloud_secure_store, platform::kCloudSyncNamespace, "cloud_secure_store_copy");
  }
}

std::optional<std::string> IdentityResolver::PeekId() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (identity_) {
    return identity_->id;
  }
  return std::nullopt;
}

bool IdentityResolver::IsFirstLaunch() const {
  auto flag = GuardedLookup<bool>(Backend::kLocalStore, "read_first_launch",
                                  [&] { return std::optional<bool>(local_ids_.IsFirstLaunch()); });
  return flag.found() ? *flag.value : true;
}

bool IdentityResolver::MarkFirstLaunchComplete() {
  return GuardedWrite(Backend::kLocalStore, "set_first_launch", [&] { local_ids_.SetFirstLaunch(false); });
}

void IdentityResolver::Reset() {
  {
    std::unique_lock<std::mutex> lock(mutex_);
    resolved_cv_.wait(lock, [this] { return state_ != core::ResolverState::kResolving && !resetting_; });
    resetting_ = true;
    generation_->fetch_add(1);
    identity_.reset();
    provisional_.reset();
    state_ = core::ResolverState::kUninitialized;
  }

  struct EndReset {
    IdentityResolver* self;
    ~EndReset() {
      {
        std::lock_guard<std::mutex> lock(self->mutex_);
        self->resetting_ = false;
      }
      self->resolved_cv_.notify_all();
    }
  };

  // mutex_ is not held from here on: failures below are reported on the bus
  // and subscribers may query the resolver. resetting_ keeps Initialize and
  // GetOrCreateId out until the deletes finish.
  {
    EndReset end_reset{this};
    writer_.Flush();

    GuardedWrite(Backend::kLocalStore, "clear_device_id", [&] { local_ids_.ClearDeviceId(); });
    GuardedWrite(Backend::kLocalStore, "clear_first_launch", [&] { local_ids_.ClearFirstLaunch(); });
    if (auto& store = backends_.local_secure_store) {
      GuardedWrite(Backend::kLocalSecureStore, "delete",
                   [&] { store->Delete(platform::kDeviceLocalNamespace, platform::kDeviceIdItemKey); });
    }
    if (auto& store = backends_.cloud_secure_store) {
      GuardedWrite(Backend::kCloudSecureStore, "delete",
                   [&] { store->Delete(platform::kCloudSyncNamespace, platform::kDeviceIdItemKey); });
    }
  }
  PublishIdentityEvent(EventCategory::kLifecycle, EventSeverity::kInfo, "identity_reset", errors::msg::kIdentityReset);
}

core::DeviceIdentity IdentityResolver::Current() const {
  core::DeviceIdentity snapshot;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (identity_) {
      snapshot = *identity_;
    } else if (provisional_) {
      snapshot = *provisional_;
    }
  }
  snapshot.is_first_launch = IsFirstLaunch();
  return snapshot;
}

core::ResolverState IdentityResolver::State() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

std::string_view IdentityResolver::StrategyName() const noexcept {
  return strategy_->Name();
}

void IdentityResolver::FlushBackgroundWrites() {
  writer_.Flush();
}

void IdentityResolver::PublishOutcome(const ResolutionOutcome& outcome) const {
  if (outcome.replaced_id) {
    PublishIdentityEvent(EventCategory::kSecurity, EventSeverity::kWarning, "identity_recovered",
                         errors::msg::kIdentityRecovered,
                         {EventField("device_id", outcome.id, FieldPrivacy::kHash),
                          EventField("previous_id", *outcome.replaced_id, FieldPrivacy::kHash),
                          EventField("source", std::string(core::ToString(outcome.source)))});
  }
  if (!outcome.persisted_locally) {
    PublishInMemoryOnly(outcome.id);
  }
  PublishIdentityEvent(EventCategory::kLifecycle, EventSeverity::kInfo, "identity_resolved",
                       errors::msg::kIdentityResolved,
                       {EventField("device_id", outcome.id, FieldPrivacy::kHash),
                        EventField("source", std::string(core::ToString(outcome.source))),
                        EventField("strategy", std::string(strategy_->Name())),
                        EventField("persisted", outcome.persisted_locally ? "true" : "false")});
}

}  // namespace devid::orchestrator
