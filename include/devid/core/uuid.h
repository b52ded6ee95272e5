#pragma once

#include <string>
#include <string_view>

namespace devid::core {

// Random (version 4, RFC 4122 variant) UUID in lowercase canonical form.
std::string GenerateUuidV4();

// Same format as GenerateUuidV4, drawn from std::random_device mixed with the
// clocks and a process counter. Unique but not unpredictable; only for use
// when the system random source has failed.
std::string GenerateFallbackUuidV4();

// True for any 8-4-4-4-12 hexadecimal string, any version, either case.
bool IsWellFormedUuid(std::string_view text) noexcept;

bool IsUuidV4(std::string_view text) noexcept;

}  // namespace devid::core
