#include "devid/storage/io_util.h"

#include <array>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include "identity_test_fakes.h"

namespace {

std::vector<uint8_t> ReadFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

bool HasTempLeftovers(const std::filesystem::path& dir) {
  for (const auto& entry : std::filesystem::directory_iterator(dir)) {
    if (entry.path().filename().string().find(".tmp.") != std::string::npos) {
      return true;
    }
  }
  return false;
}

}  // namespace

int main() {
  using devid::storage::AtomicReplace;
  using devid::storage::AtomicReplaceHooks;

  devid::testing::TempDir temp("devid_io_util_");
  auto target = temp.path() / "nested" / "prefs.tlv";

  const std::array<uint8_t, 4> baseline{0xDE, 0xAD, 0xBE, 0xEF};
  AtomicReplace(target, std::span<const uint8_t>(baseline.data(), baseline.size()));
  auto bytes = ReadFile(target);
  devid::testing::Expect(bytes == std::vector<uint8_t>(baseline.begin(), baseline.end()), "first replace writes payload");

  AtomicReplaceHooks hooks;
  hooks.before_rename = [](const std::filesystem::path&, const std::filesystem::path&) {
    throw std::runtime_error("simulated crash");
  };

  std::array<uint8_t, 4> update{0xBA, 0xAD, 0xF0, 0x0D};
  bool threw = false;
  try {
    AtomicReplace(target, std::span<const uint8_t>(update.data(), update.size()), hooks);
  } catch (const devid::Error& err) {
    threw = err.domain == devid::ErrorDomain::Storage &&
            err.code == devid::errors::storage::kPersistenceFailure;
    devid::testing::Expect(err.context.size() == 2 && err.context[1] == "running before_rename hook",
                           "failure names the step");
  }
  devid::testing::Expect(threw, "interrupted replace surfaces kPersistenceFailure");

  bytes = ReadFile(target);
  devid::testing::Expect(bytes == std::vector<uint8_t>(baseline.begin(), baseline.end()),
                         "interrupted replace keeps old contents");
  devid::testing::Expect(!HasTempLeftovers(target.parent_path()), "temporary file removed after failure");

  AtomicReplace(target, std::span<const uint8_t>(update.data(), update.size()));
  bytes = ReadFile(target);
  devid::testing::Expect(bytes == std::vector<uint8_t>(update.begin(), update.end()), "second replace lands");

  auto loaded = devid::storage::ReadFileBytes(target);
  devid::testing::Expect(loaded.has_value() && *loaded == bytes, "ReadFileBytes returns file contents");
  devid::testing::Expect(!devid::storage::ReadFileBytes(temp.path() / "missing").has_value(),
                         "missing file reads as nullopt");

  auto private_dir = temp.path() / "state" / "secure";
  devid::storage::EnsurePrivateDirectory(private_dir);
  devid::testing::Expect(std::filesystem::is_directory(private_dir), "private directory created");
#if !defined(_WIN32)
  auto perms = std::filesystem::status(private_dir).permissions();
  devid::testing::Expect((perms & (std::filesystem::perms::group_all | std::filesystem::perms::others_all)) ==
                             std::filesystem::perms::none,
                         "private directory closed to group and others");
#endif

  std::cout << "atomic replace tests ok\n";
  return 0;
}
