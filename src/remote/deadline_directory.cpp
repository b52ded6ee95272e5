#include "devid/remote/deadline_directory.h"

#include <atomic>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <type_traits>
#include <utility>

#include "devid/error.h"
#include "devid/errors.h"

namespace devid::remote {
namespace {

// Shared between the waiting caller and the helper thread so either side
// may finish last.
template <typename T>
struct CallState {
  std::mutex mutex;
  std::condition_variable done_cv;
  bool done{false};
  std::optional<T> value;
  std::exception_ptr error;
};

struct Unit {};

// |in_flight| counts helper threads that have not returned yet, including
// ones whose caller already gave up. Past |max_in_flight| the call fails
// fast instead of piling up threads behind a hung backend.
template <typename T, typename Fn>
T RunWithDeadline(std::chrono::milliseconds timeout, const char* operation,
                  const std::shared_ptr<std::atomic<std::size_t>>& in_flight, std::size_t max_in_flight, Fn fn) {
  using Stored = std::conditional_t<std::is_void_v<T>, Unit, T>;
  if (in_flight->fetch_add(1) >= max_in_flight) {
    in_flight->fetch_sub(1);
    throw Error{ErrorDomain::Remote, errors::remote::kBackendUnavailable,
                std::string(errors::msg::kRemoteCallsSaturated) + ": " + operation, std::nullopt,
                Retryability::kTransient};
  }
  auto state = std::make_shared<CallState<Stored>>();
  try {
    std::thread([state, in_flight, fn = std::move(fn)]() mutable {
      std::optional<Stored> value;
      std::exception_ptr error;
      try {
        if constexpr (std::is_void_v<T>) {
          fn();
          value.emplace();
        } else {
          value.emplace(fn());
        }
      } catch (...) {
        error = std::current_exception(); // handed to the caller below
      }
      {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->value = std::move(value);
        state->error = error;
        state->done = true;
      }
      state->done_cv.notify_all();
      in_flight->fetch_sub(1);
    }).detach();
  } catch (const std::system_error& err) {
    in_flight->fetch_sub(1);
    throw Error{ErrorDomain::Remote, errors::remote::kBackendUnavailable,
                std::string("Failed to start remote call: ") + err.what(), err.code().value(),
                Retryability::kTransient};
  }

  std::unique_lock<std::mutex> lock(state->mutex);
  if (!state->done_cv.wait_for(lock, timeout, [&state] { return state->done; })) {
    throw Error{ErrorDomain::Remote, errors::remote::kTimeout,
                std::string(errors::msg::kRemoteCallTimedOut) + ": " + operation, std::nullopt,
                Retryability::kTransient};
  }
  if (state->error) {
    std::rethrow_exception(state->error);
  }
  if constexpr (!std::is_void_v<T>) {
    return std::move(*state->value);
  }
}

}  // namespace

DeadlineIdentityDirectory::DeadlineIdentityDirectory(RemoteIdentityDirectoryPtr inner,
                                                     std::chrono::milliseconds timeout, std::size_t max_in_flight)
    : inner_(std::move(inner)),
      timeout_(timeout),
      max_in_flight_(max_in_flight == 0 ? kDefaultMaxInFlight : max_in_flight),
      in_flight_(std::make_shared<std::atomic<std::size_t>>(0)) {
  if (!inner_) {
    throw Error{ErrorDomain::Config, errors::config::kMissingCollaborator,
                std::string(errors::msg::kRemoteDirectoryMissing)};
  }
}

std::optional<UserRecord> DeadlineIdentityDirectory::GetUser(const std::string& id) {
  auto inner = inner_;
  return RunWithDeadline<std::optional<UserRecord>>(timeout_, "GetUser", in_flight_, max_in_flight_,
                                                    [inner, id] { return inner->GetUser(id); });
}

std::optional<UserRecord> DeadlineIdentityDirectory::FindByHardwareId(const std::string& hardware_id) {
  auto inner = inner_;
  return RunWithDeadline<std::optional<UserRecord>>(
      timeout_, "FindByHardwareId", in_flight_, max_in_flight_,
      [inner, hardware_id] { return inner->FindByHardwareId(hardware_id); });
}

void DeadlineIdentityDirectory::UpsertHardwareId(const std::string& id, const std::string& hardware_id) {
  auto inner = inner_;
  RunWithDeadline<void>(timeout_, "UpsertHardwareId", in_flight_, max_in_flight_,
                        [inner, id, hardware_id] { inner->UpsertHardwareId(id, hardware_id); });
}

RemoteIdentityDirectoryPtr WithDeadline(RemoteIdentityDirectoryPtr inner,
                                        std::chrono::milliseconds timeout) {
  if (!inner || timeout.count() <= 0) {
    return inner;
  }
  return std::make_shared<DeadlineIdentityDirectory>(std::move(inner), timeout);
}

}  // namespace devid::remote
