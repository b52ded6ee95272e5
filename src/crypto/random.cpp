#include "devid/crypto/random.h"

#include <limits>
#include <mutex>
#include <string>
#include <utility>

#include <openssl/err.h>
#include <openssl/rand.h>

#include "devid/error.h"
#include "devid/errors.h"

namespace devid::crypto {
namespace {

std::mutex& SourceMutex() {
  static std::mutex mutex;
  return mutex;
}

RandomSource& SourceSlot() {
  static RandomSource source;
  return source;
}

}  // namespace

void SystemRandomBytes(std::span<uint8_t> out) {
  RandomSource source;
  {
    std::lock_guard<std::mutex> guard(SourceMutex());
    source = SourceSlot();
  }
  if (source) {
    if (!source(out)) {
      throw devid::Error(devid::ErrorDomain::Crypto, devid::errors::crypto::kRandomUnavailable,
                         std::string(devid::errors::msg::kRandomUnavailable));
    }
    return;
  }
  // RAND_bytes takes an int length; identity material is far below that, but
  // large requests are split rather than truncated.
  constexpr size_t kMaxChunk = static_cast<size_t>(std::numeric_limits<int>::max());
  while (!out.empty()) {
    const size_t chunk = out.size() < kMaxChunk ? out.size() : kMaxChunk;
    if (RAND_bytes(out.data(), static_cast<int>(chunk)) != 1) {
      const unsigned long err = ERR_get_error();
      char reason[256] = {0};
      ERR_error_string_n(err, reason, sizeof(reason));
      throw devid::Error(devid::ErrorDomain::Crypto, devid::errors::crypto::kRandomUnavailable,
                         std::string(devid::errors::msg::kRandomUnavailable) + ": " + reason,
                         static_cast<int>(err));
    }
    out = out.subspan(chunk);
  }
}

void SetRandomSourceForTesting(RandomSource source) {
  std::lock_guard<std::mutex> guard(SourceMutex());
  SourceSlot() = std::move(source);
}

}  // namespace devid::crypto
