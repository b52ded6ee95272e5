#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <variant>
#include <vector>

#include "devid/storage/io_util.h"
#include "devid/storage/key_value_store.h"

namespace devid::storage {

// KeyValueStore persisted as a single TLV file that is rewritten with
// AtomicReplace on every mutation. A file that fails to parse is treated as
// empty and the next successful write replaces it.
class FileKeyValueStore final : public KeyValueStore {
 public:
  static constexpr std::size_t kMaxEntries = 1024;

  explicit FileKeyValueStore(std::filesystem::path path, AtomicReplaceHooks hooks = {});

  std::optional<std::string> GetString(std::string_view key) const override;
  void SetString(std::string_view key, std::string_view value) override;
  std::optional<bool> GetBool(std::string_view key) const override;
  void SetBool(std::string_view key, bool value) override;
  void Remove(std::string_view key) override;

  const std::filesystem::path& path() const noexcept { return path_; }

 private:
  using Value = std::variant<std::string, bool>;
  using Entries = std::map<std::string, Value, std::less<>>;

  void EnsureLoadedLocked() const;
  void CommitLocked(Entries updated);
  static std::vector<uint8_t> Serialize(const Entries& entries);

  std::filesystem::path path_;
  AtomicReplaceHooks hooks_;
  mutable std::mutex mutex_;
  mutable Entries entries_;
  mutable bool loaded_{false};
};

}  // namespace devid::storage
