#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

namespace devid::crypto {

inline constexpr size_t kSealingKeySize = 32;
inline constexpr size_t kSealNonceSize = 12;
inline constexpr size_t kSealTagSize = 16;

using SealingKey = std::array<uint8_t, kSealingKeySize>;

// AES-256-GCM output for one stored secret. The nonce is drawn fresh for
// every Seal call and travels with the ciphertext.
struct SealedBox {
  std::array<uint8_t, kSealNonceSize> nonce{};
  std::array<uint8_t, kSealTagSize> tag{};
  std::vector<uint8_t> ciphertext;
};

class SealingBackend {
public:
  virtual ~SealingBackend() = default;

  virtual SealedBox Seal(std::span<const uint8_t> plaintext, std::span<const uint8_t> aad,
                         const SealingKey& key) = 0;

  // Throws AuthenticationFailureError when the tag, aad or key do not match.
  virtual std::vector<uint8_t> Open(const SealedBox& box, std::span<const uint8_t> aad,
                                    const SealingKey& key) = 0;
};

// EVP_aes_256_gcm with nonces from SystemRandomBytes.
class OpenSSLSealingBackend : public SealingBackend {
public:
  SealedBox Seal(std::span<const uint8_t> plaintext, std::span<const uint8_t> aad,
                 const SealingKey& key) override;
  std::vector<uint8_t> Open(const SealedBox& box, std::span<const uint8_t> aad,
                            const SealingKey& key) override;
};

// Process-wide backend, OpenSSL unless replaced.
std::shared_ptr<SealingBackend> ActiveSealingBackend();
void SetSealingBackendForTesting(std::shared_ptr<SealingBackend> backend); // nullptr restores OpenSSL

// Convenience wrappers over ActiveSealingBackend(). Provider failures throw
// devid::Error in the Crypto domain.
SealedBox Seal(std::span<const uint8_t> plaintext, std::span<const uint8_t> aad,
               const SealingKey& key);
std::vector<uint8_t> Open(const SealedBox& box, std::span<const uint8_t> aad,
                          const SealingKey& key);

}  // namespace devid::crypto
