#include "devid/crypto/sealed_box.h"

#include <openssl/err.h>
#include <openssl/evp.h>

#include <limits>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "devid/crypto/random.h"
#include "devid/error.h"

namespace devid::crypto {

namespace {

struct CipherCtxFree {
  void operator()(EVP_CIPHER_CTX* ctx) const noexcept { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxFree>;

// Pops the OpenSSL error queue into the message so failures are diagnosable
// from the identity log alone.
[[noreturn]] void Fail(const char* step) {
  std::string message = "AES-256-GCM ";
  message += step;
  std::optional<int> native;
  if (const unsigned long err = ERR_get_error(); err != 0) {
    char buf[256] = {0};
    ERR_error_string_n(err, buf, sizeof(buf));
    message += ": ";
    message += buf;
    native = static_cast<int>(err);
  }
  throw devid::Error(devid::ErrorDomain::Crypto, devid::errors::crypto::kCipherFailure, std::move(message),
                     native);
}

void Check(int rc, const char* step) {
  if (rc != 1) {
    Fail(step);
  }
}

int CheckedLength(size_t size) {
  if (size > static_cast<size_t>(std::numeric_limits<int>::max())) {
    Fail("input too large");
  }
  return static_cast<int>(size);
}

CipherCtx StartGcm(bool sealing, const std::array<uint8_t, kSealNonceSize>& nonce,
                   const SealingKey& key, std::span<const uint8_t> aad) {
  CipherCtx ctx(EVP_CIPHER_CTX_new());
  if (!ctx) {
    Fail("context allocation");
  }
  const int mode = sealing ? 1 : 0;
  Check(EVP_CipherInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr, mode),
        "cipher init");
  Check(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(nonce.size()),
                            nullptr),
        "nonce length");
  Check(EVP_CipherInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data(), mode),
        "key setup");
  if (!aad.empty()) {
    int ignored = 0;
    Check(EVP_CipherUpdate(ctx.get(), nullptr, &ignored, aad.data(), CheckedLength(aad.size())),
          "aad");
  }
  return ctx;
}

std::mutex& BackendMutex() {
  static std::mutex mutex;
  return mutex;
}

std::shared_ptr<SealingBackend>& BackendSlot() {
  static std::shared_ptr<SealingBackend> backend;
  return backend;
}

}  // namespace

SealedBox OpenSSLSealingBackend::Seal(std::span<const uint8_t> plaintext,
                                      std::span<const uint8_t> aad, const SealingKey& key) {
  SealedBox box;
  SystemRandomBytes(box.nonce);
  auto ctx = StartGcm(true, box.nonce, key, aad);

  // GCM is a stream mode: ciphertext length equals plaintext length.
  box.ciphertext.resize(plaintext.size());
  int produced = 0;
  if (!plaintext.empty()) {
    Check(EVP_CipherUpdate(ctx.get(), box.ciphertext.data(), &produced, plaintext.data(),
                           CheckedLength(plaintext.size())),
          "encrypt");
  }
  int tail = 0;
  Check(EVP_CipherFinal_ex(ctx.get(), box.ciphertext.data() + produced, &tail), "encrypt final");
  box.ciphertext.resize(static_cast<size_t>(produced + tail));
  Check(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(box.tag.size()),
                            box.tag.data()),
        "read tag");
  return box;
}

std::vector<uint8_t> OpenSSLSealingBackend::Open(const SealedBox& box,
                                                 std::span<const uint8_t> aad,
                                                 const SealingKey& key) {
  auto ctx = StartGcm(false, box.nonce, key, aad);

  std::vector<uint8_t> plaintext(box.ciphertext.size());
  int produced = 0;
  if (!box.ciphertext.empty()) {
    Check(EVP_CipherUpdate(ctx.get(), plaintext.data(), &produced, box.ciphertext.data(),
                           CheckedLength(box.ciphertext.size())),
          "decrypt");
  }
  auto expected_tag = box.tag;
  Check(EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                            static_cast<int>(expected_tag.size()), expected_tag.data()),
        "set tag");
  int tail = 0;
  if (EVP_CipherFinal_ex(ctx.get(), plaintext.data() + produced, &tail) <= 0) {
    ERR_clear_error();
    throw devid::AuthenticationFailureError("sealed item failed authentication");
  }
  plaintext.resize(static_cast<size_t>(produced + tail));
  return plaintext;
}

std::shared_ptr<SealingBackend> ActiveSealingBackend() {
  std::lock_guard<std::mutex> lock(BackendMutex());
  auto& backend = BackendSlot();
  if (!backend) {
    backend = std::make_shared<OpenSSLSealingBackend>();
  }
  return backend;
}

void SetSealingBackendForTesting(std::shared_ptr<SealingBackend> backend) {
  std::lock_guard<std::mutex> lock(BackendMutex());
  BackendSlot() = std::move(backend);
}

SealedBox Seal(std::span<const uint8_t> plaintext, std::span<const uint8_t> aad,
               const SealingKey& key) {
  return ActiveSealingBackend()->Seal(plaintext, aad, key);
}

std::vector<uint8_t> Open(const SealedBox& box, std::span<const uint8_t> aad,
                          const SealingKey& key) {
  return ActiveSealingBackend()->Open(box, aad, key);
}

}  // namespace devid::crypto
