#include "devid/orchestrator/resolution_strategy.h"

#include <utility>

namespace devid::orchestrator {
namespace {

// Secure stores hold the id as plain text; an empty item counts as missing.
Lookup<std::string> DropEmpty(Lookup<std::string> lookup) {
  if (lookup.found() && lookup.value->empty()) {
    return Lookup<std::string>{};
  }
  return lookup;
}

}  // namespace

std::unique_ptr<ResolutionStrategy> SelectStrategy(const platform::PlatformCapabilities& caps) {
  if (caps.has_cloud_secure_store) {
    return MakeCloudSecureStoreStrategy();
  }
  if (caps.has_hardware_id) {
    return MakeHardwareIdStrategy();
  }
  return MakeLocalOnlyStrategy();
}

Lookup<std::string> ReadLocalId(ResolutionContext& ctx) {
  return DropEmpty(GuardedLookup<std::string>(Backend::kLocalStore, "read_device_id",
                                              [&] { return ctx.local.ReadDeviceId(); }));
}

Lookup<std::string> PeekLocalId(ResolutionContext& ctx) {
  return DropEmpty(GuardedLookup<std::string>(Backend::kLocalStore, "peek_device_id",
                                              [&] { return ctx.local.PeekDeviceId(); }));
}

bool PersistLocalId(ResolutionContext& ctx, const std::string& id) {
  return GuardedWrite(Backend::kLocalStore, "write_device_id", [&] { ctx.local.WriteDeviceId(id); });
}

Lookup<std::string> ReadSecureId(platform::SecureStore* store, Backend backend, std::string_view ns) {
  if (!store) {
    return Lookup<std::string>{LookupStatus::kUnavailable, std::nullopt};
  }
  return DropEmpty(GuardedLookup<std::string>(
      backend, "read", [&] { return store->Read(ns, platform::kDeviceIdItemKey); }));
}

bool MirrorSecureId(platform::SecureStore* store, Backend backend, std::string_view ns,
                    const std::string& id) {
  if (!store) {
    return false;
  }
  return GuardedWrite(backend, "write", [&] { store->Write(ns, platform::kDeviceIdItemKey, id); });
}

ResolutionOutcome GenerateIdentity(ResolutionContext& ctx) {
  ResolutionOutcome outcome;
  outcome.id = ctx.claim_id();
  outcome.source = core::IdentitySource::kGenerated;
  outcome.persisted_locally = PersistLocalId(ctx, outcome.id);
  GuardedWrite(Backend::kLocalStore, "set_first_launch", [&] { ctx.local.SetFirstLaunch(true); });
  return outcome;
}

ResolutionOutcome AdoptLocalOrGenerate(ResolutionContext& ctx) {
  auto local = ReadLocalId(ctx);
  if (local.found()) {
    ResolutionOutcome outcome;
    outcome.id = std::move(*local.value);
    outcome.source = core::IdentitySource::kLocalStore;
    return outcome;
  }
  return GenerateIdentity(ctx);
}

}  // namespace devid::orchestrator
