#pragma once

#include <string_view>

namespace devid::errors::msg {
// Centralized message catalog
inline constexpr std::string_view kLocalStoreCorrupt{"Local key-value store is corrupt; starting empty"};
inline constexpr std::string_view kLocalStoreValueTooLarge{"Value exceeds local key-value record limit"};
inline constexpr std::string_view kSecureStoreKeyUnavailable{"Secure store key could not be loaded"};
inline constexpr std::string_view kSecureStoreItemCorrupt{"Secure store item failed authentication"};
inline constexpr std::string_view kSecureStoreWriteFailed{"Secure store write failed"};
inline constexpr std::string_view kSecureStoreDeleteFailed{"Secure store delete failed"};
inline constexpr std::string_view kSecureStoreInvalidName{"Secure store namespace or key contains unsupported characters"};
inline constexpr std::string_view kSecureStoreUnavailable{"Secure store unavailable; continuing without it"};
inline constexpr std::string_view kKeychainUnavailable{"Keychain operation failed"};
inline constexpr std::string_view kRemoteCallTimedOut{"Remote identity directory call exceeded deadline"};
inline constexpr std::string_view kRemoteDirectoryMissing{"Remote identity directory not configured"};
inline constexpr std::string_view kIdentityResolved{"Device identity resolved"};
inline constexpr std::string_view kIdentityRecovered{"Device identity replaced by recovered identity"};
inline constexpr std::string_view kIdentityInMemoryOnly{"Device identity could not be persisted; it will not survive restart"};
inline constexpr std::string_view kIdentityResolutionFailed{"Identity resolution failed; keeping the local identity or generating one"};
inline constexpr std::string_view kInvalidDeviceId{"Device identifier must not be empty"};
inline constexpr std::string_view kRandomUnavailable{"Random source unavailable"};
inline constexpr std::string_view kRemoteCallsSaturated{"Too many abandoned remote identity directory calls still running"};
inline constexpr std::string_view kIdentityReset{"Device identity reset"};
inline constexpr std::string_view kHardwareIdConflict{"Hardware identifier already claimed by a different record"};
inline constexpr std::string_view kHardwareIdMismatch{"Confirmed record carries a different hardware identifier"};
inline constexpr std::string_view kBackendUnavailable{"Identity backend unavailable; treating value as absent"};
inline constexpr std::string_view kPersistFailed{"Best-effort identity write failed"};
inline constexpr std::string_view kPersistDropped{"Best-effort identity write dropped; queue full"};
}  // namespace devid::errors::msg
