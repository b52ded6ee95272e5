#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace devid::platform {

// Best-effort identifier that survives reinstall. GetId never throws and
// returns std::nullopt when the platform has nothing to offer.
class HardwareIdProvider {
 public:
  virtual ~HardwareIdProvider() = default;
  virtual std::optional<std::string> GetId() noexcept = 0;
};

using HardwareIdProviderPtr = std::shared_ptr<HardwareIdProvider>;

// Reads the first readable, non-empty candidate file (by default
// /etc/machine-id, /var/lib/dbus/machine-id, /sys/class/dmi/id/product_uuid)
// and returns SHA-256(app_label || value) in hex, so the raw machine id never
// leaves the host.
class MachineIdProvider final : public HardwareIdProvider {
 public:
  static constexpr const char* kDefaultAppLabel = "devid.hardware.v1";

  MachineIdProvider();
  explicit MachineIdProvider(std::vector<std::filesystem::path> candidates,
                             std::string app_label = kDefaultAppLabel);

  std::optional<std::string> GetId() noexcept override;

 private:
  std::vector<std::filesystem::path> candidates_;
  std::string app_label_;
};

// Value handed in by the host application, e.g. from a platform bridge.
class StaticHardwareIdProvider final : public HardwareIdProvider {
 public:
  explicit StaticHardwareIdProvider(std::optional<std::string> value) : value_(std::move(value)) {}
  std::optional<std::string> GetId() noexcept override;

 private:
  std::optional<std::string> value_;
};

class NullHardwareIdProvider final : public HardwareIdProvider {
 public:
  std::optional<std::string> GetId() noexcept override { return std::nullopt; }
};

}  // namespace devid::platform
