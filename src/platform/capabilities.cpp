#include "devid/platform/capabilities.h"

namespace devid::platform {

PlatformCapabilities DetectPlatformCapabilities() noexcept {
  PlatformCapabilities caps;
#if defined(__APPLE__)
  caps.has_cloud_secure_store = true;
#elif defined(__ANDROID__)
  caps.has_hardware_id = true;
#endif
  return caps;
}

std::optional<PlatformCapabilities> ParsePlatformCapabilities(std::string_view name) noexcept {
  if (name == "auto") {
    return DetectPlatformCapabilities();
  }
  if (name == "local") {
    return PlatformCapabilities{};
  }
  if (name == "hardware") {
    return PlatformCapabilities{true, false};
  }
  if (name == "cloud") {
    return PlatformCapabilities{false, true};
  }
  return std::nullopt;
}

std::string_view DescribeCapabilities(const PlatformCapabilities& caps) noexcept {
  if (caps.has_cloud_secure_store) {
    return "cloud";
  }
  if (caps.has_hardware_id) {
    return "hardware";
  }
  return "local";
}

}  // namespace devid::platform
