#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>

#include "devid/remote/identity_directory.h"

namespace devid::remote {

// Runs each call of |inner| on a detached helper thread and gives up after
// |timeout|, throwing devid::Error(Remote, kTimeout). The abandoned call keeps
// |inner| alive until it returns; its result is discarded.
//
// At most |max_in_flight| helper threads run at once, abandoned ones
// included. Further calls throw devid::Error(Remote, kBackendUnavailable,
// kTransient) without starting a thread until a slow call returns.
// A helper thread touches only its own call state and |inner|, never the
// EventBus or other process-wide objects, so it may safely outlive static
// destruction as long as |inner| does the same.
// TSK306_Remote_Deadlines
class DeadlineIdentityDirectory final : public RemoteIdentityDirectory {
 public:
  static constexpr std::size_t kDefaultMaxInFlight = 4;

  DeadlineIdentityDirectory(RemoteIdentityDirectoryPtr inner, std::chrono::milliseconds timeout,
                            std::size_t max_in_flight = kDefaultMaxInFlight);

  std::optional<UserRecord> GetUser(const std::string& id) override;
  std::optional<UserRecord> FindByHardwareId(const std::string& hardware_id) override;
  void UpsertHardwareId(const std::string& id, const std::string& hardware_id) override;

  std::chrono::milliseconds timeout() const noexcept { return timeout_; }
  // Helper threads still running, abandoned ones included.
  std::size_t InFlight() const noexcept { return in_flight_->load(); }

 private:
  RemoteIdentityDirectoryPtr inner_;
  std::chrono::milliseconds timeout_;
  std::size_t max_in_flight_;
  // Shared with helper threads, which may outlive this wrapper.
  std::shared_ptr<std::atomic<std::size_t>> in_flight_;
};

// Wraps |inner| unless it is null or |timeout| is not positive.
RemoteIdentityDirectoryPtr WithDeadline(RemoteIdentityDirectoryPtr inner,
                                        std::chrono::milliseconds timeout);

}  // namespace devid::remote
