#include "devid/core/uuid.h"

#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <exception>
#include <random>

#include "devid/common.h"
#include "devid/crypto/random.h"

namespace devid::core {
namespace {

constexpr std::array<size_t, 4> kDashPositions{8, 13, 18, 23};
constexpr size_t kUuidLength = 36;

bool IsDashPosition(size_t index) noexcept {
  for (auto pos : kDashPositions) {
    if (pos == index) {
      return true;
    }
  }
  return false;
}

std::uint64_t SplitMix64(std::uint64_t& state) noexcept {
  std::uint64_t z = (state += 0x9E3779B97F4A7C15ULL);
  z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
  z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
  return z ^ (z >> 31);
}

// std::random_device may throw or be unavailable on some targets.
std::uint64_t DeviceEntropy() noexcept {
  try {
    std::random_device device;
    return (static_cast<std::uint64_t>(device()) << 32) ^ device();
  } catch (const std::exception&) {
    return 0;
  }
}

std::string FormatUuidV4(std::array<uint8_t, 16> bytes) {
  bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40);
  bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80);
  const auto hex = devid::HexEncode(bytes);
  std::string out;
  out.reserve(kUuidLength);
  out.append(hex, 0, 8).push_back('-');
  out.append(hex, 8, 4).push_back('-');
  out.append(hex, 12, 4).push_back('-');
  out.append(hex, 16, 4).push_back('-');
  out.append(hex, 20, 12);
  return out;
}

}  // namespace

std::string GenerateUuidV4() { // TSK301_Device_Identity_Resolution
  return FormatUuidV4(devid::crypto::RandomArray<16>());
}

std::string GenerateFallbackUuidV4() {
  static std::atomic<std::uint64_t> counter{0};
  std::uint64_t state = DeviceEntropy();
  state ^= static_cast<std::uint64_t>(std::chrono::high_resolution_clock::now().time_since_epoch().count());
  state ^= static_cast<std::uint64_t>(std::chrono::system_clock::now().time_since_epoch().count()) << 1;
  state ^= reinterpret_cast<std::uintptr_t>(&state);
  state ^= counter.fetch_add(1) * 0xD1B54A32D192ED03ULL;
  std::array<uint8_t, 16> bytes{};
  for (size_t i = 0; i < bytes.size(); i += 8) {
    const auto word = SplitMix64(state);
    for (size_t j = 0; j < 8; ++j) {
      bytes[i + j] = static_cast<uint8_t>(word >> (8 * j));
    }
  }
  return FormatUuidV4(bytes);
}

bool IsWellFormedUuid(std::string_view text) noexcept {
  if (text.size() != kUuidLength) {
    return false;
  }
  for (size_t i = 0; i < text.size(); ++i) {
    const auto ch = static_cast<unsigned char>(text[i]);
    if (IsDashPosition(i)) {
      if (ch != '-') {
        return false;
      }
    } else if (!std::isxdigit(ch)) {
      return false;
    }
  }
  return true;
}

bool IsUuidV4(std::string_view text) noexcept {
  if (!IsWellFormedUuid(text) || text[14] != '4') {
    return false;
  }
  const char variant = static_cast<char>(std::tolower(static_cast<unsigned char>(text[19])));
  return variant == '8' || variant == '9' || variant == 'a' || variant == 'b';
}

}  // namespace devid::core
