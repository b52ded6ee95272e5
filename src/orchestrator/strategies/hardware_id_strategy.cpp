#include "devid/orchestrator/resolution_strategy.h"

#include <vector>

#include "devid/errors.h"

namespace devid::orchestrator {
namespace {

// Platforms with a reinstall-stable hardware identifier but no cloud
// keychain. The remote directory maps hardware id to user record and is the
// only recovery path after a reinstall.
// TSK304_Hardware_Id_Recovery
class HardwareIdStrategy final : public ResolutionStrategy {
 public:
  std::string_view Name() const noexcept override { return "hardware_id"; }

  ResolutionOutcome Resolve(ResolutionContext& ctx) override {
    std::optional<std::string> hardware_id;
    if (ctx.hardware) {
      hardware_id = ctx.hardware->GetId();
      if (hardware_id && hardware_id->empty()) {
        hardware_id.reset();
      }
    }

    auto local = ReadLocalId(ctx);
    if (local.found()) {
      if (!ctx.directory) {
        return ResolutionOutcome{*local.value, core::IdentitySource::kLocalStore, true, std::nullopt};
      }
      auto record = GuardedLookup<remote::UserRecord>(Backend::kRemoteDirectory, "get_user",
                                                      [&] { return ctx.directory->GetUser(*local.value); });
      if (record.found()) {
        return ConfirmLocal(ctx, *local.value, *record.value, hardware_id);
      }
      if (record.status == LookupStatus::kUnavailable) {
        // Unreachable directory neither confirms nor refutes the local id.
        return ResolutionOutcome{*local.value, core::IdentitySource::kLocalStore, true, std::nullopt};
      }
    }

    if (hardware_id && ctx.directory) {
      auto match = GuardedLookup<remote::UserRecord>(
          Backend::kRemoteDirectory, "find_by_hardware_id",
          [&] { return ctx.directory->FindByHardwareId(*hardware_id); });
      if (match.found() && !match.value->id.empty()) {
        ResolutionOutcome outcome{match.value->id, core::IdentitySource::kHardwareIdLookup, true, std::nullopt};
        outcome.persisted_locally = PersistLocalId(ctx, outcome.id);
        if (local.found() && *local.value != outcome.id) {
          outcome.replaced_id = *local.value;
        }
        MirrorDeviceLocal(ctx, outcome.id);
        return outcome;
      }
    }

    // An unconfirmed local id is kept rather than forking a second record.
    ResolutionOutcome outcome =
        local.found() ? ResolutionOutcome{*local.value, core::IdentitySource::kLocalStore, true, std::nullopt}
                      : GenerateIdentity(ctx);
    if (hardware_id && ctx.directory) {
      GuardedWrite(Backend::kRemoteDirectory, "upsert_hardware_id",
                   [&] { ctx.directory->UpsertHardwareId(outcome.id, *hardware_id); });
    }
    MirrorDeviceLocal(ctx, outcome.id);
    return outcome;
  }

 private:
  static void MirrorDeviceLocal(ResolutionContext& ctx, const std::string& id) {
    MirrorSecureId(ctx.local_secure, Backend::kLocalSecureStore, platform::kDeviceLocalNamespace, id);
  }

  static ResolutionOutcome ConfirmLocal(ResolutionContext& ctx, const std::string& local_id,
                                        const remote::UserRecord& record,
                                        const std::optional<std::string>& hardware_id) {
    ResolutionOutcome confirmed{local_id, core::IdentitySource::kRemoteDirectoryLookup, true, std::nullopt};
    if (!hardware_id || record.hardware_id == hardware_id) {
      return confirmed;
    }
    if (record.hardware_id && !record.hardware_id->empty()) {
      // The association is append-only; never rewrite another device's value.
      PublishIdentityEvent(EventCategory::kSecurity, EventSeverity::kWarning, "identity_hardware_mismatch",
                           errors::msg::kHardwareIdMismatch,
                           {EventField("device_id", local_id, FieldPrivacy::kHash),
                            EventField("hardware_id", *hardware_id, FieldPrivacy::kHash)});
      return confirmed;
    }

    auto claimant = GuardedLookup<remote::UserRecord>(
        Backend::kRemoteDirectory, "find_by_hardware_id",
        [&] { return ctx.directory->FindByHardwareId(*hardware_id); });
    if (claimant.status == LookupStatus::kUnavailable) {
      // Back-filling blind could create a second claimant; retry next launch.
      return confirmed;
    }
    if (claimant.found() && !claimant.value->id.empty() && claimant.value->id != local_id) {
      const auto policy = ctx.config.conflict_policy;
      PublishIdentityEvent(EventCategory::kSecurity, EventSeverity::kWarning, "identity_hardware_conflict",
                           errors::msg::kHardwareIdConflict,
                           {EventField("device_id", local_id, FieldPrivacy::kHash),
                            EventField("record_id", claimant.value->id, FieldPrivacy::kHash),
                            EventField("policy", std::string(ToString(policy)))});
      if (policy == HardwareConflictPolicy::kPreferHardwareRecord) {
        ResolutionOutcome adopted{claimant.value->id, core::IdentitySource::kHardwareIdLookup, true, local_id};
        adopted.persisted_locally = PersistLocalId(ctx, adopted.id);
        MirrorDeviceLocal(ctx, adopted.id);
        return adopted;
      }
      return confirmed;
    }

    GuardedWrite(Backend::kRemoteDirectory, "upsert_hardware_id",
                 [&] { ctx.directory->UpsertHardwareId(local_id, *hardware_id); });
    return confirmed;
  }
};

}  // namespace

std::unique_ptr<ResolutionStrategy> MakeHardwareIdStrategy() {
  return std::make_unique<HardwareIdStrategy>();
}

}  // namespace devid::orchestrator
