#include "devid/storage/file_key_value_store.h"
#include "devid/tlv/parser.h"

#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "identity_test_fakes.h"

using devid::testing::Expect;

namespace {

void TestPersistsAcrossInstances(const std::filesystem::path& dir) {
  auto path = dir / "prefs.tlv";
  {
    devid::storage::FileKeyValueStore store(path);
    Expect(!store.GetString("devid.device_id").has_value(), "fresh store is empty");
    store.SetString("devid.device_id", "f47ac10b-58cc-4372-a567-0e02b2c3d479");
    store.SetBool("mystic_first_launch", true);
    store.SetString("empty", "");
  }
  devid::storage::FileKeyValueStore reopened(path);
  Expect(reopened.GetString("devid.device_id") == std::optional<std::string>("f47ac10b-58cc-4372-a567-0e02b2c3d479"),
         "string survives reopen");
  Expect(reopened.GetBool("mystic_first_launch") == std::optional<bool>(true), "bool survives reopen");
  Expect(reopened.GetString("empty") == std::optional<std::string>(""), "empty string kept distinct from absent");
  Expect(!reopened.GetBool("devid.device_id").has_value(), "type mismatch reads as absent");

  reopened.Remove("devid.device_id");
  devid::storage::FileKeyValueStore after_remove(path);
  Expect(!after_remove.GetString("devid.device_id").has_value(), "remove is durable");
  Expect(after_remove.GetBool("mystic_first_launch") == std::optional<bool>(true), "other keys untouched");
}

void TestCorruptFileStartsEmpty(const std::filesystem::path& dir) {
  auto path = dir / "corrupt.tlv";
  {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << "not a tlv file at all";
  }
  devid::testing::EventRecorder recorder;
  devid::storage::FileKeyValueStore store(path);
  Expect(!store.GetString("devid.device_id").has_value(), "corrupt file reads as empty");
  Expect(recorder.Count("local_store_corrupt") == 1, "corruption reported once");

  store.SetString("devid.device_id", "replacement");
  devid::storage::FileKeyValueStore reopened(path);
  Expect(reopened.GetString("devid.device_id") == std::optional<std::string>("replacement"),
         "next write replaces the corrupt file");
}

void TestFailedCommitKeepsPreviousState(const std::filesystem::path& dir) {
  auto path = dir / "crash.tlv";
  {
    devid::storage::FileKeyValueStore seed(path);
    seed.SetString("devid.device_id", "original");
  }
  devid::storage::AtomicReplaceHooks hooks;
  hooks.before_rename = [](const std::filesystem::path&, const std::filesystem::path&) {
    throw std::runtime_error("power loss");
  };
  devid::storage::FileKeyValueStore store(path, hooks);
  bool threw = false;
  try {
    store.SetString("devid.device_id", "updated");
  } catch (const devid::Error& err) {
    threw = err.code == devid::errors::storage::kPersistenceFailure;
  }
  Expect(threw, "failed commit throws kPersistenceFailure");
  Expect(store.GetString("devid.device_id") == std::optional<std::string>("original"),
         "memory not updated when the file was not");
  devid::storage::FileKeyValueStore reopened(path);
  Expect(reopened.GetString("devid.device_id") == std::optional<std::string>("original"), "file unchanged");
}

void TestRejectsOversizedValues(const std::filesystem::path& dir) {
  devid::storage::FileKeyValueStore store(dir / "limits.tlv");
  bool threw = false;
  try {
    store.SetString("big", std::string(devid::tlv::kMaxPayload + 1, 'x'));
  } catch (const devid::Error& err) {
    threw = err.domain == devid::ErrorDomain::Validation &&
            err.code == devid::errors::validation::kValueTooLarge;
  }
  Expect(threw, "oversized value rejected");
  threw = false;
  try {
    store.SetBool("", true);
  } catch (const devid::Error& err) {
    threw = err.code == devid::errors::validation::kValueTooLarge;
  }
  Expect(threw, "empty key rejected");
}

}  // namespace

int main() {
  devid::testing::TempDir temp("devid_kv_");
  devid::testing::RouteLogsTo(temp.path() / "logs");
  TestPersistsAcrossInstances(temp.path());
  TestCorruptFileStartsEmpty(temp.path());
  TestFailedCommitKeepsPreviousState(temp.path());
  TestRejectsOversizedValues(temp.path());
  std::cout << "file key-value store tests ok\n";
  return 0;
}
