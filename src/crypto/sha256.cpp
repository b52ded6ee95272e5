#include "devid/crypto/sha256.h"

#include <openssl/err.h>
#include <openssl/evp.h>

#include "devid/common.h"
#include "devid/error.h"

namespace devid::crypto {

Sha256Digest Sha256(std::span<const uint8_t> data) {
  Sha256Digest digest{};
  unsigned int written = 0;
  if (EVP_Digest(data.data(), data.size(), digest.data(), &written, EVP_sha256(), nullptr) != 1 ||
      written != digest.size()) {
    throw devid::Error(devid::ErrorDomain::Crypto, devid::errors::crypto::kDigestFailure, "SHA-256 digest failed",
                       static_cast<int>(ERR_get_error()));
  }
  return digest;
}

Sha256Digest Sha256(std::string_view text) {
  return Sha256(devid::AsBytes(text));
}

}  // namespace devid::crypto
