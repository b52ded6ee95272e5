#include "devid/remote/deadline_directory.h"

#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

#include "identity_test_fakes.h"

using devid::testing::Expect;
using namespace std::chrono_literals;

int main() {
  auto fake = std::make_shared<devid::testing::FakeDirectory>();
  fake->AddRecord("user-1", std::string("HW42"));

  auto directory = devid::remote::WithDeadline(fake, 500ms);
  Expect(directory != fake, "positive timeout wraps the directory");
  Expect(devid::remote::WithDeadline(fake, 0ms) == fake, "zero timeout leaves the directory unwrapped");
  Expect(devid::remote::WithDeadline(nullptr, 500ms) == nullptr, "null stays null");

  auto record = directory->GetUser("user-1");
  Expect(record.has_value() && record->hardware_id == std::optional<std::string>("HW42"), "fast call passes through");
  Expect(directory->UserExists("user-1") && !directory->UserExists("user-2"), "UserExists derived from GetUser");
  auto match = directory->FindByHardwareId("HW42");
  Expect(match.has_value() && match->id == "user-1", "hardware lookup passes through");
  directory->UpsertHardwareId("user-2", "HW43");
  Expect(fake->Record("user-2").has_value(), "upsert reaches the inner directory");

  fake->unavailable = true;
  int code = 0;
  try {
    (void)directory->GetUser("user-1");
  } catch (const devid::Error& err) {
    code = err.code;
  }
  Expect(code == devid::errors::remote::kBackendUnavailable, "inner failure rethrown to the caller");
  fake->unavailable = false;

  fake->delay_ms = 1000;
  auto slow = devid::remote::WithDeadline(fake, 50ms);
  const auto started = std::chrono::steady_clock::now();
  bool timed_out = false;
  try {
    (void)slow->FindByHardwareId("HW42");
  } catch (const devid::Error& err) {
    timed_out = err.domain == devid::ErrorDomain::Remote && err.code == devid::errors::remote::kTimeout &&
                err.retryability == devid::Retryability::kTransient;
  }
  const auto elapsed = std::chrono::steady_clock::now() - started;
  Expect(timed_out, "slow call surfaces kTimeout");
  Expect(elapsed < 900ms, "caller released before the inner call returns");

  // Abandoned calls count against the cap until they return.
  {
    devid::remote::DeadlineIdentityDirectory capped(fake, 20ms, 2);
    int timeouts = 0;
    for (int i = 0; i < 2; ++i) {
      try {
        (void)capped.FindByHardwareId("HW42");
      } catch (const devid::Error& err) {
        timeouts += err.code == devid::errors::remote::kTimeout ? 1 : 0;
      }
    }
    Expect(timeouts == 2, "both slow calls abandoned");
    Expect(capped.InFlight() == 2, "abandoned calls still counted");
    const int finds_before = fake->find_calls.load();
    bool saturated = false;
    try {
      (void)capped.FindByHardwareId("HW42");
    } catch (const devid::Error& err) {
      saturated = err.code == devid::errors::remote::kBackendUnavailable &&
                  err.retryability == devid::Retryability::kTransient;
    }
    Expect(saturated, "call past the cap refused as transient");
    Expect(fake->find_calls.load() == finds_before, "refused call never reaches the directory");

    fake->delay_ms = 0;
    const auto drain_deadline = std::chrono::steady_clock::now() + 3s;
    while (capped.InFlight() != 0 && std::chrono::steady_clock::now() < drain_deadline) {
      std::this_thread::sleep_for(10ms);
    }
    Expect(capped.InFlight() == 0, "slow calls drain");
    Expect(capped.FindByHardwareId("HW42").has_value(), "calls accepted again once drained");
  }

  bool rejected = false;
  try {
    devid::remote::DeadlineIdentityDirectory invalid(nullptr, 50ms);
  } catch (const devid::Error& err) {
    rejected = err.code == devid::errors::config::kMissingCollaborator;
  }
  Expect(rejected, "null inner directory rejected");

  // Let the abandoned call finish before the process exits.
  std::this_thread::sleep_for(1100ms);
  std::cout << "deadline directory tests ok\n";
  return 0;
}
