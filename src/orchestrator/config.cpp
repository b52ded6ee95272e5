#include "devid/orchestrator/config.h"

#include <charconv>
#include <cstdlib>
#include <cstring>
#include <optional>

namespace devid::orchestrator {
namespace {

std::optional<std::string_view> ReadEnv(const char* name) {
  const char* value = std::getenv(name);
  if (!value || *value == '\0') {
    return std::nullopt;
  }
  return std::string_view(value, std::strlen(value));
}

std::optional<unsigned long long> ParseUnsigned(std::string_view text) {
  unsigned long long value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size() || value == 0) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

std::filesystem::path DefaultStateDirectory() {
  if (auto xdg = ReadEnv("XDG_DATA_HOME")) {
    return std::filesystem::path(std::string(*xdg)) / "devid";
  }
  if (auto home = ReadEnv("HOME")) {
    return std::filesystem::path(std::string(*home)) / ".local" / "share" / "devid";
  }
  return std::filesystem::path("devid-state");
}

ResolverConfig ResolverConfig::FromEnvironment() {
  ResolverConfig config;
  config.state_dir = DefaultStateDirectory();
  if (auto dir = ReadEnv("DEVID_STATE_DIR")) {
    config.state_dir = std::filesystem::path(std::string(*dir));
  }
  if (auto dir = ReadEnv("DEVID_LOG_DIR")) {
    config.log_dir = std::filesystem::path(std::string(*dir));
  }
  if (auto size = ReadEnv("DEVID_LOG_MAX_SIZE")) {
    if (auto parsed = ParseUnsigned(*size)) {
      config.log_max_bytes = static_cast<std::size_t>(*parsed);
    }
  }
  if (auto timeout = ReadEnv("DEVID_REMOTE_TIMEOUT_MS")) {
    if (auto parsed = ParseUnsigned(*timeout)) {
      config.remote_timeout = std::chrono::milliseconds(static_cast<long long>(*parsed));
    }
  }
  if (auto policy = ReadEnv("DEVID_CONFLICT_POLICY")) {
    if (*policy == "prefer_hardware_record") {
      config.conflict_policy = HardwareConflictPolicy::kPreferHardwareRecord;
    } else if (*policy == "prefer_confirmed_local") {
      config.conflict_policy = HardwareConflictPolicy::kPreferConfirmedLocal;
    }
  }
  return config;
}

std::string_view ToString(HardwareConflictPolicy policy) noexcept {
  switch (policy) {
  case HardwareConflictPolicy::kPreferConfirmedLocal:
    return "prefer_confirmed_local";
  case HardwareConflictPolicy::kPreferHardwareRecord:
    return "prefer_hardware_record";
  }
  return "unknown";
}

}  // namespace devid::orchestrator
