#include "devid/orchestrator/resolution_strategy.h"

namespace devid::orchestrator {
namespace {

class LocalOnlyStrategy final : public ResolutionStrategy {
 public:
  std::string_view Name() const noexcept override { return "local_only"; }

  ResolutionOutcome Resolve(ResolutionContext& ctx) override {
    auto local = ReadLocalId(ctx);
    if (local.found()) {
      return ResolutionOutcome{*local.value, core::IdentitySource::kLocalStore, true, std::nullopt};
    }
    return GenerateIdentity(ctx);
  }
};

}  // namespace

std::unique_ptr<ResolutionStrategy> MakeLocalOnlyStrategy() {
  return std::make_unique<LocalOnlyStrategy>();
}

}  // namespace devid::orchestrator
