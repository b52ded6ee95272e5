#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <span>

namespace devid::crypto {

// Fills |out| from OpenSSL's DRBG, which seeds itself from the OS entropy
// source. Throws devid::Error(Crypto) if the DRBG cannot be seeded.
void SystemRandomBytes(std::span<uint8_t> out);

// Fills the span and returns true, or returns false when no entropy is
// available. SystemRandomBytes raises the error on false.
using RandomSource = std::function<bool(std::span<uint8_t>)>;
void SetRandomSourceForTesting(RandomSource source); // empty restores OpenSSL

template <size_t N>
std::array<uint8_t, N> RandomArray() {
  std::array<uint8_t, N> out{};
  SystemRandomBytes(out);
  return out;
}

}  // namespace devid::crypto
