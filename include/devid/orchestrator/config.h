#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

#include "devid/storage/device_id_store.h"

namespace devid::orchestrator {

// Decides what happens when a confirmed local id's directory record lacks a
// hardware identifier that a different record already claims.
enum class HardwareConflictPolicy {
  kPreferConfirmedLocal, // keep the local id, leave both records untouched
  kPreferHardwareRecord, // adopt the record that claims the hardware id
};

struct ResolverConfig {
  storage::LocalStoreKeys keys{};
  HardwareConflictPolicy conflict_policy{HardwareConflictPolicy::kPreferConfirmedLocal};
  std::chrono::milliseconds remote_timeout{std::chrono::seconds(5)};
  std::size_t background_queue_depth{64};
  std::filesystem::path state_dir{};
  std::filesystem::path log_dir{};
  std::size_t log_max_bytes{0}; // 0 keeps the logger default

  // Reads DEVID_STATE_DIR, DEVID_LOG_DIR, DEVID_LOG_MAX_SIZE,
  // DEVID_REMOTE_TIMEOUT_MS and DEVID_CONFLICT_POLICY. Malformed values keep
  // the defaults.
  static ResolverConfig FromEnvironment();
};

// Defaults to <XDG_DATA_HOME or ~/.local/share>/devid, or ./devid-state when
// neither is set.
std::filesystem::path DefaultStateDirectory();

std::string_view ToString(HardwareConflictPolicy policy) noexcept;

}  // namespace devid::orchestrator
