#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace devid::platform {

// Fixed for the lifetime of the product. Changing either string orphans
// every identity stored by earlier releases.
inline constexpr std::string_view kDeviceLocalNamespace = "app.devid.identity.v1";
inline constexpr std::string_view kCloudSyncNamespace = "app.devid.identity.cloud.v1";
inline constexpr std::string_view kDeviceIdItemKey = "device_id";

enum class SecureStoreScope {
  kDeviceLocal,       // encrypted at rest, removed on uninstall
  kCloudSynchronized, // replicated by the OS to the user's cloud account
};

// Encrypted key/value storage provided by the platform. Read returns
// std::nullopt for a missing item. Failures throw devid::Error in the
// SecureStore domain: kBackendUnavailable for reads, kPersistenceFailure for
// writes and deletes, kCorruptRecord for items that fail authentication.
class SecureStore {
 public:
  virtual ~SecureStore() = default;
  virtual std::string_view Id() const noexcept = 0;
  virtual bool IsAvailable() const noexcept = 0;
  virtual std::optional<std::string> Read(std::string_view ns, std::string_view key) = 0;
  virtual void Write(std::string_view ns, std::string_view key, std::string_view value) = 0;
  virtual void Delete(std::string_view ns, std::string_view key) = 0;
};

using SecureStorePtr = std::shared_ptr<SecureStore>;

// Keychain-backed store on Apple platforms, nullptr elsewhere.
SecureStorePtr MakeKeychainSecureStore(SecureStoreScope scope);

// First of |preferred| and |fallback| that exists and reports IsAvailable().
// Each present but unavailable store is reported; nullptr when neither works.
SecureStorePtr SelectSecureStore(SecureStorePtr preferred, SecureStorePtr fallback);

}  // namespace devid::platform
