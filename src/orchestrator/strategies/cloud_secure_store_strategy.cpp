#include "devid/orchestrator/resolution_strategy.h"

namespace devid::orchestrator {
namespace {

// Platforms whose keychain replicates to the user's cloud account. The cloud
// item is the only thing that survives a reinstall, so it always wins.
// TSK303_Secure_Store_Mirroring
class CloudSecureStoreStrategy final : public ResolutionStrategy {
 public:
  std::string_view Name() const noexcept override { return "cloud_secure_store"; }

  ResolutionOutcome Resolve(ResolutionContext& ctx) override {
    auto cloud = ReadSecureId(ctx.cloud_secure, Backend::kCloudSecureStore, platform::kCloudSyncNamespace);
    if (cloud.found()) {
      MirrorSecureId(ctx.local_secure, Backend::kLocalSecureStore, platform::kDeviceLocalNamespace,
                     *cloud.value);
      return AdoptFromSecureStore(ctx, *cloud.value, core::IdentitySource::kCloudSecureStore);
    }

    auto device = ReadSecureId(ctx.local_secure, Backend::kLocalSecureStore, platform::kDeviceLocalNamespace);
    if (device.found()) {
      MirrorSecureId(ctx.cloud_secure, Backend::kCloudSecureStore, platform::kCloudSyncNamespace,
                     *device.value);
      return AdoptFromSecureStore(ctx, *device.value, core::IdentitySource::kLocalSecureStore);
    }

    auto local = ReadLocalId(ctx);
    if (local.found()) {
      MirrorBoth(ctx, *local.value);
      return ResolutionOutcome{*local.value, core::IdentitySource::kLocalStore, true, std::nullopt};
    }

    ResolutionOutcome outcome = GenerateIdentity(ctx);
    MirrorBoth(ctx, outcome.id);
    return outcome;
  }

 private:
  static void MirrorBoth(ResolutionContext& ctx, const std::string& id) {
    MirrorSecureId(ctx.local_secure, Backend::kLocalSecureStore, platform::kDeviceLocalNamespace, id);
    MirrorSecureId(ctx.cloud_secure, Backend::kCloudSecureStore, platform::kCloudSyncNamespace, id);
  }

  // Keeps the key-value store in step with the secure store and records the
  // local value it displaced, if any.
  static ResolutionOutcome AdoptFromSecureStore(ResolutionContext& ctx, const std::string& id,
                                                core::IdentitySource source) {
    ResolutionOutcome outcome{id, source, true, std::nullopt};
    auto previous = PeekLocalId(ctx);
    if (previous.found() && *previous.value == id) {
      return outcome;
    }
    outcome.persisted_locally = PersistLocalId(ctx, id);
    if (previous.found()) {
      outcome.replaced_id = *previous.value;
    }
    return outcome;
  }
};

}  // namespace

std::unique_ptr<ResolutionStrategy> MakeCloudSecureStoreStrategy() {
  return std::make_unique<CloudSecureStoreStrategy>();
}

}  // namespace devid::orchestrator
