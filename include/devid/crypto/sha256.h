#pragma once
#include <array>
#include <cstdint>
#include <span>
#include <string_view>

namespace devid::crypto {

using Sha256Digest = std::array<uint8_t, 32>;

// Throws devid::Error(Crypto) if the digest cannot be computed.
Sha256Digest Sha256(std::span<const uint8_t> data);
Sha256Digest Sha256(std::string_view text);

} // namespace devid::crypto
