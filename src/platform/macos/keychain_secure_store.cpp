#include "devid/platform/secure_store.h"

#if defined(__APPLE__)
#include <CoreFoundation/CoreFoundation.h>
#include <Security/Security.h>

#include <memory>
#include <string>
#include <type_traits>

#include "devid/error.h"
#include "devid/errors.h"

// TSK303_Secure_Store_Mirroring Keychain-backed secure store (device-local and iCloud Keychain)

namespace {

struct CFReleaser {
  void operator()(CFTypeRef ref) const noexcept {
    if (ref) {
      CFRelease(ref);
    }
  }
};

template <typename T>
using CFHolder = std::unique_ptr<std::remove_pointer_t<T>, CFReleaser>;

CFHolder<CFStringRef> MakeCFString(std::string_view text) {
  return CFHolder<CFStringRef>(CFStringCreateWithBytes(
      nullptr, reinterpret_cast<const UInt8*>(text.data()), static_cast<CFIndex>(text.size()),
      kCFStringEncodingUTF8, false));
}

class KeychainSecureStore final : public devid::platform::SecureStore {
 public:
  explicit KeychainSecureStore(devid::platform::SecureStoreScope scope) : scope_(scope) {}

  std::string_view Id() const noexcept override {
    return scope_ == devid::platform::SecureStoreScope::kCloudSynchronized ? "icloud-keychain"
                                                                            : "keychain";
  }
  bool IsAvailable() const noexcept override { return true; }

  std::optional<std::string> Read(std::string_view ns, std::string_view key) override {
    auto query = BaseQuery(ns, key);
    CFDictionarySetValue(query.get(), kSecReturnData, kCFBooleanTrue);
    CFDictionarySetValue(query.get(), kSecMatchLimit, kSecMatchLimitOne);
    CFTypeRef result = nullptr;
    const OSStatus status = SecItemCopyMatching(query.get(), &result);
    CFHolder<CFTypeRef> holder(result);
    if (status == errSecItemNotFound) {
      return std::nullopt;
    }
    if (status != errSecSuccess || !result || CFGetTypeID(result) != CFDataGetTypeID()) {
      throw devid::Error{devid::ErrorDomain::SecureStore, devid::errors::secure_store::kBackendUnavailable,
                         std::string(devid::errors::msg::kKeychainUnavailable) + ": SecItemCopyMatching",
                         static_cast<int>(status), devid::Retryability::kTransient};
    }
    auto data = reinterpret_cast<CFDataRef>(result);
    const auto* bytes = reinterpret_cast<const char*>(CFDataGetBytePtr(data));
    return std::string(bytes, bytes + CFDataGetLength(data));
  }

  void Write(std::string_view ns, std::string_view key, std::string_view value) override {
    CFHolder<CFDataRef> data(CFDataCreate(nullptr, reinterpret_cast<const UInt8*>(value.data()),
                                          static_cast<CFIndex>(value.size())));
    if (!data) {
      ThrowWriteError("CFDataCreate", 0);
    }
    auto query = BaseQuery(ns, key);
    CFHolder<CFMutableDictionaryRef> update(CFDictionaryCreateMutable(
        nullptr, 0, &kCFTypeDictionaryKeyCallBacks, &kCFTypeDictionaryValueCallBacks));
    CFDictionarySetValue(update.get(), kSecValueData, data.get());
    OSStatus status = SecItemUpdate(query.get(), update.get());
    if (status == errSecItemNotFound) {
      CFDictionarySetValue(query.get(), kSecValueData, data.get());
      CFDictionarySetValue(query.get(), kSecAttrAccessible, Accessibility());
      status = SecItemAdd(query.get(), nullptr);
    }
    if (status != errSecSuccess) {
      ThrowWriteError("SecItemAdd", status);
    }
  }

  void Delete(std::string_view ns, std::string_view key) override {
    auto query = BaseQuery(ns, key);
    const OSStatus status = SecItemDelete(query.get());
    if (status != errSecSuccess && status != errSecItemNotFound) {
      ThrowWriteError("SecItemDelete", status);
    }
  }

 private:
  CFHolder<CFMutableDictionaryRef> BaseQuery(std::string_view ns, std::string_view key) const {
    CFHolder<CFMutableDictionaryRef> query(CFDictionaryCreateMutable(
        nullptr, 0, &kCFTypeDictionaryKeyCallBacks, &kCFTypeDictionaryValueCallBacks));
    auto service = MakeCFString(ns);
    auto account = MakeCFString(key);
    if (!query || !service || !account) {
      throw devid::Error{devid::ErrorDomain::SecureStore, devid::errors::secure_store::kBackendUnavailable,
                         std::string(devid::errors::msg::kKeychainUnavailable) + ": query allocation"};
    }
    CFDictionarySetValue(query.get(), kSecClass, kSecClassGenericPassword);
    CFDictionarySetValue(query.get(), kSecAttrService, service.get());
    CFDictionarySetValue(query.get(), kSecAttrAccount, account.get());
    CFDictionarySetValue(query.get(), kSecAttrSynchronizable,
                         scope_ == devid::platform::SecureStoreScope::kCloudSynchronized ? kCFBooleanTrue
                                                                                          : kCFBooleanFalse);
    return query;
  }

  CFStringRef Accessibility() const noexcept {
    // Synchronizable items cannot be bound to this device.
    return scope_ == devid::platform::SecureStoreScope::kCloudSynchronized
               ? kSecAttrAccessibleAfterFirstUnlock
               : kSecAttrAccessibleAfterFirstUnlockThisDeviceOnly;
  }

  [[noreturn]] static void ThrowWriteError(const char* call, OSStatus status) {
    throw devid::Error{devid::ErrorDomain::SecureStore, devid::errors::secure_store::kPersistenceFailure,
                       std::string(devid::errors::msg::kKeychainUnavailable) + ": " + call,
                       static_cast<int>(status), devid::Retryability::kTransient};
  }

  devid::platform::SecureStoreScope scope_;
};

}  // namespace

namespace devid::platform {

SecureStorePtr MakeKeychainSecureStore(SecureStoreScope scope) {
  return std::make_shared<KeychainSecureStore>(scope);
}

}  // namespace devid::platform

#else

namespace devid::platform {

SecureStorePtr MakeKeychainSecureStore(SecureStoreScope) { return nullptr; }

}  // namespace devid::platform

#endif
