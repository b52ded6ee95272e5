#pragma once

#include <optional>
#include <string_view>

namespace devid::platform {

struct PlatformCapabilities {
  bool has_hardware_id{false};
  bool has_cloud_secure_store{false};
};

// Compile-time platform family: Apple targets get the cloud-synchronized
// keychain, Android gets the hardware identifier, everything else neither.
PlatformCapabilities DetectPlatformCapabilities() noexcept;

// Parses "local", "hardware", "cloud" or "auto" (detected).
std::optional<PlatformCapabilities> ParsePlatformCapabilities(std::string_view name) noexcept;

std::string_view DescribeCapabilities(const PlatformCapabilities& caps) noexcept;

}  // namespace devid::platform
