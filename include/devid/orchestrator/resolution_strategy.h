#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "devid/core/device_identity.h"
#include "devid/orchestrator/config.h"
#include "devid/orchestrator/diagnostics.h"
#include "devid/platform/capabilities.h"
#include "devid/platform/hardware_id.h"
#include "devid/platform/secure_store.h"
#include "devid/remote/identity_directory.h"
#include "devid/storage/device_id_store.h"

namespace devid::orchestrator {

// Everything a strategy may touch. Optional backends are null when the
// composition root did not supply them.
struct ResolutionContext {
  storage::DeviceIdStore& local;
  platform::SecureStore* local_secure{nullptr};
  platform::SecureStore* cloud_secure{nullptr};
  platform::HardwareIdProvider* hardware{nullptr};
  remote::RemoteIdentityDirectory* directory{nullptr};
  const ResolverConfig& config;
  // Returns the id already handed out by this process, or reserves a new one.
  std::function<std::string()> claim_id;
};

struct ResolutionOutcome {
  std::string id;
  core::IdentitySource source{core::IdentitySource::kGenerated};
  bool persisted_locally{true};
  // Local candidate that lost to a recovered identity.
  std::optional<std::string> replaced_id;
};

// One resolution algorithm per platform family. Resolve must always return
// a usable id; backend failures are handled inside and read as "absent".
// TSK301_Device_Identity_Resolution
class ResolutionStrategy {
 public:
  virtual ~ResolutionStrategy() = default;
  virtual std::string_view Name() const noexcept = 0;
  virtual ResolutionOutcome Resolve(ResolutionContext& ctx) = 0;
};

std::unique_ptr<ResolutionStrategy> MakeHardwareIdStrategy();
std::unique_ptr<ResolutionStrategy> MakeCloudSecureStoreStrategy();
std::unique_ptr<ResolutionStrategy> MakeLocalOnlyStrategy();

// Cloud store first, then hardware id, else local only.
std::unique_ptr<ResolutionStrategy> SelectStrategy(const platform::PlatformCapabilities& caps);

// Steps shared by the strategies.
Lookup<std::string> ReadLocalId(ResolutionContext& ctx);
Lookup<std::string> PeekLocalId(ResolutionContext& ctx);
bool PersistLocalId(ResolutionContext& ctx, const std::string& id);
Lookup<std::string> ReadSecureId(platform::SecureStore* store, Backend backend, std::string_view ns);
bool MirrorSecureId(platform::SecureStore* store, Backend backend, std::string_view ns,
                    const std::string& id);
// Claims a new id, writes it under the canonical key and raises the
// first-launch flag.
ResolutionOutcome GenerateIdentity(ResolutionContext& ctx);
// Recovery path after a strategy failed midway: keeps an id the local store
// already holds and only falls back to GenerateIdentity when there is none.
ResolutionOutcome AdoptLocalOrGenerate(ResolutionContext& ctx);

}  // namespace devid::orchestrator
