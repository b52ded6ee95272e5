#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace devid::storage {

// Small persistent string/bool map. Reads report absence with std::nullopt
// and throw devid::Error(Storage, kBackendUnavailable) only when the backing
// medium cannot be read. Writes throw devid::Error(Storage,
// kPersistenceFailure) and leave the previous value in place.
class KeyValueStore {
 public:
  virtual ~KeyValueStore() = default;

  virtual std::optional<std::string> GetString(std::string_view key) const = 0;
  virtual void SetString(std::string_view key, std::string_view value) = 0;
  virtual std::optional<bool> GetBool(std::string_view key) const = 0;
  virtual void SetBool(std::string_view key, bool value) = 0;
  virtual void Remove(std::string_view key) = 0;
};

}  // namespace devid::storage
