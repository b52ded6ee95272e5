#pragma once

#include <memory>
#include <optional>
#include <string>

namespace devid::remote {

struct UserRecord {
  std::string id;
  std::optional<std::string> hardware_id;
};

// Client for the remote collection of user records keyed by id. Lookups
// return std::nullopt when no record matches; transport failures throw
// devid::Error in the Remote domain (kBackendUnavailable or kTimeout).
class RemoteIdentityDirectory {
 public:
  virtual ~RemoteIdentityDirectory() = default;

  virtual std::optional<UserRecord> GetUser(const std::string& id) = 0;
  // First record whose hardware identifier equals |hardware_id| (limit 1).
  virtual std::optional<UserRecord> FindByHardwareId(const std::string& hardware_id) = 0;
  // Merges the hardware identifier into the record, creating it when absent.
  // Other fields of an existing record are left untouched.
  virtual void UpsertHardwareId(const std::string& id, const std::string& hardware_id) = 0;

  bool UserExists(const std::string& id) { return GetUser(id).has_value(); }
};

using RemoteIdentityDirectoryPtr = std::shared_ptr<RemoteIdentityDirectory>;

}  // namespace devid::remote
