#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

#include "devid/crypto/sealed_box.h"
#include "devid/platform/secure_store.h"

namespace devid::platform {

// Device-local secure store for hosts without a keychain. Each item is an
// AES-256-GCM sealed file under <root>/<namespace>/<key>.item; the key is a
// random per-installation secret in <root>/store.key (mode 0600). Namespace
// and key are bound as associated data so items cannot be swapped between
// slots.
class FileSecureStore final : public SecureStore {
 public:
  explicit FileSecureStore(std::filesystem::path root, std::string id = "file");

  std::string_view Id() const noexcept override { return id_; }
  bool IsAvailable() const noexcept override { return !root_.empty(); }
  std::optional<std::string> Read(std::string_view ns, std::string_view key) override;
  void Write(std::string_view ns, std::string_view key, std::string_view value) override;
  void Delete(std::string_view ns, std::string_view key) override;

  const std::filesystem::path& root() const noexcept { return root_; }

 private:
  const devid::crypto::SealingKey& LoadOrCreateKeyLocked();
  std::filesystem::path ItemPath(std::string_view ns, std::string_view key) const;

  std::filesystem::path root_;
  std::string id_;
  std::mutex mutex_;
  std::optional<devid::crypto::SealingKey> key_;
};

}  // namespace devid::platform
