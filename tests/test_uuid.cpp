#include "devid/core/uuid.h"

#include <iostream>
#include <set>
#include <string>

#include "devid/crypto/random.h"
#include "devid/error.h"
#include "identity_test_fakes.h"

using devid::testing::Expect;

int main() {
  std::set<std::string> seen;
  for (int i = 0; i < 256; ++i) {
    auto id = devid::core::GenerateUuidV4();
    Expect(id.size() == 36, "uuid length");
    Expect(devid::core::IsUuidV4(id), "generated value is a v4 uuid");
    for (char ch : id) {
      Expect(ch == '-' || (ch >= '0' && ch <= '9') || (ch >= 'a' && ch <= 'f'), "lowercase hex");
    }
    seen.insert(id);
  }
  Expect(seen.size() == 256, "no repeats across 256 draws");

  devid::crypto::SetRandomSourceForTesting([](std::span<uint8_t>) { return false; });
  bool threw = false;
  try {
    (void)devid::core::GenerateUuidV4();
  } catch (const devid::Error& err) {
    threw = err.code == devid::errors::crypto::kRandomUnavailable;
  }
  Expect(threw, "uuid generation reports a failed random source");
  std::set<std::string> fallback;
  for (int i = 0; i < 64; ++i) {
    auto id = devid::core::GenerateFallbackUuidV4();
    Expect(devid::core::IsUuidV4(id), "fallback value is a v4 uuid");
    fallback.insert(id);
  }
  Expect(fallback.size() == 64, "fallback ids distinct within one process");
  devid::crypto::SetRandomSourceForTesting(nullptr);

  Expect(devid::core::IsWellFormedUuid("123E4567-E89B-12D3-A456-426614174000"), "uppercase v1 is well formed");
  Expect(!devid::core::IsUuidV4("123e4567-e89b-12d3-a456-426614174000"), "v1 is not v4");
  Expect(devid::core::IsUuidV4("f47ac10b-58cc-4372-a567-0e02b2c3d479"), "known v4 accepted");
  Expect(!devid::core::IsUuidV4("f47ac10b-58cc-4372-c567-0e02b2c3d479"), "wrong variant rejected");
  Expect(!devid::core::IsWellFormedUuid(""), "empty rejected");
  Expect(!devid::core::IsWellFormedUuid("abc-123"), "short id rejected");
  Expect(!devid::core::IsWellFormedUuid("f47ac10b58cc-4372-a567-0e02b2c3d4790"), "misplaced dash rejected");
  Expect(!devid::core::IsWellFormedUuid("g47ac10b-58cc-4372-a567-0e02b2c3d479"), "non-hex rejected");

  std::cout << "uuid tests ok\n";
  return 0;
}
