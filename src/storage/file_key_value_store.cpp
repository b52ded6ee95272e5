#include "devid/storage/file_key_value_store.h"

#include <array>
#include <cstring>
#include <optional>
#include <utility>

#include "devid/common.h"
#include "devid/error.h"
#include "devid/errors.h"
#include "devid/orchestrator/diagnostics.h"
#include "devid/tlv/parser.h"

namespace devid::storage {
namespace {

// File layout: one header record, then (key, value) record pairs.
constexpr uint16_t kHeaderRecord = 0x0001;
constexpr uint16_t kKeyRecord = 0x0010;
constexpr uint16_t kStringValueRecord = 0x0011;
constexpr uint16_t kBoolValueRecord = 0x0012;
constexpr std::array<uint8_t, 4> kMagic{'D', 'V', 'K', 'V'};
constexpr uint8_t kFormatVersion = 1;

std::string ToString(std::span<const uint8_t> bytes) {
  return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

std::optional<std::map<std::string, std::variant<std::string, bool>, std::less<>>> ParseEntries(
    std::span<const uint8_t> bytes) {
  std::map<std::string, std::variant<std::string, bool>, std::less<>> entries;
  if (bytes.empty()) {
    return entries;
  }
  devid::tlv::Parser parser(bytes, FileKeyValueStore::kMaxEntries * 2 + 1);
  if (!parser.valid() || parser.size() == 0) {
    return std::nullopt;
  }
  auto it = parser.begin();
  if (it->type != kHeaderRecord || it->value.size() != kMagic.size() + 1 ||
      std::memcmp(it->value.data(), kMagic.data(), kMagic.size()) != 0 ||
      it->value[kMagic.size()] != kFormatVersion) {
    return std::nullopt;
  }
  ++it;
  while (it != parser.end()) {
    if (it->type != kKeyRecord) {
      return std::nullopt;
    }
    std::string key = ToString(it->value);
    ++it;
    if (it == parser.end()) {
      return std::nullopt;
    }
    if (it->type == kStringValueRecord) {
      entries.insert_or_assign(std::move(key), ToString(it->value));
    } else if (it->type == kBoolValueRecord && it->value.size() == 1) {
      entries.insert_or_assign(std::move(key), it->value[0] != 0);
    } else {
      return std::nullopt;
    }
    ++it;
  }
  return entries;
}

void PublishCorruption(const std::filesystem::path& path) {
  namespace orch = devid::orchestrator;
  orch::PublishIdentityEvent(orch::EventCategory::kDiagnostics, orch::EventSeverity::kWarning,
                             "local_store_corrupt", errors::msg::kLocalStoreCorrupt,
                             {orch::EventField("path", devid::PathToUtf8String(path), orch::FieldPrivacy::kHash)});
}

[[noreturn]] void ThrowTooLarge(std::string_view what) {
  throw Error{ErrorDomain::Validation, errors::validation::kValueTooLarge,
              std::string(errors::msg::kLocalStoreValueTooLarge) + ": " + std::string(what)};
}

void CheckSizes(std::string_view key, std::string_view value) {
  if (key.empty() || key.size() > devid::tlv::kMaxPayload) {
    ThrowTooLarge("key");
  }
  if (value.size() > devid::tlv::kMaxPayload) {
    ThrowTooLarge("value");
  }
}

}  // namespace

FileKeyValueStore::FileKeyValueStore(std::filesystem::path path, AtomicReplaceHooks hooks)
    : path_(std::move(path)), hooks_(std::move(hooks)) {}

void FileKeyValueStore::EnsureLoadedLocked() const {
  if (loaded_) {
    return;
  }
  auto bytes = ReadFileBytes(path_); // throws kBackendUnavailable on read errors
  if (!bytes) {
    entries_.clear();
    loaded_ = true;
    return;
  }
  auto parsed = ParseEntries(*bytes);
  if (!parsed) {
    PublishCorruption(path_);
    entries_.clear();
  } else {
    entries_ = std::move(*parsed);
  }
  loaded_ = true;
}

std::vector<uint8_t> FileKeyValueStore::Serialize(const Entries& entries) {
  devid::tlv::Builder builder;
  std::array<uint8_t, kMagic.size() + 1> header{};
  std::memcpy(header.data(), kMagic.data(), kMagic.size());
  header[kMagic.size()] = kFormatVersion;
  builder.Append(kHeaderRecord, header);
  for (const auto& [key, value] : entries) {
    builder.Append(kKeyRecord, devid::AsBytes(key));
    if (const auto* text = std::get_if<std::string>(&value)) {
      builder.Append(kStringValueRecord, devid::AsBytes(*text));
    } else {
      builder.AppendByte(kBoolValueRecord, std::get<bool>(value) ? 1 : 0);
    }
  }
  return builder.Take();
}

void FileKeyValueStore::CommitLocked(Entries updated) {
  if (updated.size() > kMaxEntries) {
    ThrowTooLarge("entry count");
  }
  auto payload = Serialize(updated);
  AtomicReplace(path_, payload, hooks_); // in-memory state changes only after the file does
  entries_ = std::move(updated);
}

std::optional<std::string> FileKeyValueStore::GetString(std::string_view key) const {
  devid::orchestrator::DeferredEvents deferred; // corruption report runs after unlock
  std::lock_guard<std::mutex> lock(mutex_);
  EnsureLoadedLocked();
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  if (const auto* text = std::get_if<std::string>(&it->second)) {
    return *text;
  }
  return std::nullopt;
}

void FileKeyValueStore::SetString(std::string_view key, std::string_view value) {
  CheckSizes(key, value);
  devid::orchestrator::DeferredEvents deferred;
  std::lock_guard<std::mutex> lock(mutex_);
  EnsureLoadedLocked();
  Entries updated = entries_;
  updated.insert_or_assign(std::string(key), std::string(value));
  CommitLocked(std::move(updated));
}

std::optional<bool> FileKeyValueStore::GetBool(std::string_view key) const {
  devid::orchestrator::DeferredEvents deferred;
  std::lock_guard<std::mutex> lock(mutex_);
  EnsureLoadedLocked();
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  if (const auto* flag = std::get_if<bool>(&it->second)) {
    return *flag;
  }
  return std::nullopt;
}

void FileKeyValueStore::SetBool(std::string_view key, bool value) {
  CheckSizes(key, {});
  devid::orchestrator::DeferredEvents deferred;
  std::lock_guard<std::mutex> lock(mutex_);
  EnsureLoadedLocked();
  Entries updated = entries_;
  updated.insert_or_assign(std::string(key), value);
  CommitLocked(std::move(updated));
}

void FileKeyValueStore::Remove(std::string_view key) {
  devid::orchestrator::DeferredEvents deferred;
  std::lock_guard<std::mutex> lock(mutex_);
  EnsureLoadedLocked();
  if (entries_.find(key) == entries_.end()) {
    return;
  }
  Entries updated = entries_;
  updated.erase(updated.find(key));
  CommitLocked(std::move(updated));
}

}  // namespace devid::storage
