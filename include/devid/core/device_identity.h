#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace devid::core {

// Where the current identifier came from.
enum class IdentitySource : std::uint8_t {
  kLocalStore,
  kLocalSecureStore,
  kCloudSecureStore,
  kHardwareIdLookup,
  kRemoteDirectoryLookup,
  kGenerated,
};

enum class ResolverState : std::uint8_t {
  kUninitialized,
  kResolving,
  kResolved,
};

struct DeviceIdentity {
  std::string id;
  IdentitySource source{IdentitySource::kGenerated};
  bool is_first_launch{false};
  // False when no durable backend accepted the id; it will not survive a restart.
  bool persisted{true};
};

constexpr std::string_view ToString(IdentitySource source) noexcept {
  switch (source) {
  case IdentitySource::kLocalStore:
    return "local_store";
  case IdentitySource::kLocalSecureStore:
    return "local_secure_store";
  case IdentitySource::kCloudSecureStore:
    return "cloud_secure_store";
  case IdentitySource::kHardwareIdLookup:
    return "hardware_id_lookup";
  case IdentitySource::kRemoteDirectoryLookup:
    return "remote_directory_lookup";
  case IdentitySource::kGenerated:
    return "generated";
  }
  return "unknown";
}

constexpr std::string_view ToString(ResolverState state) noexcept {
  switch (state) {
  case ResolverState::kUninitialized:
    return "uninitialized";
  case ResolverState::kResolving:
    return "resolving";
  case ResolverState::kResolved:
    return "resolved";
  }
  return "unknown";
}

}  // namespace devid::core
