#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <span>
#include <vector>

#include "devid/error.h"

namespace devid::storage {

struct AtomicReplaceHooks { // lets tests fail between sync and rename
  std::function<void(const std::filesystem::path&, const std::filesystem::path&)> before_rename;
};

// Writes |payload| to a sibling staging file (mode 0600), fsyncs it and renames
// it over |target|. Readers see either the old or the new contents. Failures
// throw devid::Error(Storage, kPersistenceFailure) with context
// {target, step} and remove the staging file.
void AtomicReplace(const std::filesystem::path& target, std::span<const uint8_t> payload,
                   const AtomicReplaceHooks& hooks = {});

// Returns std::nullopt when |path| does not exist. Throws
// devid::Error(Storage, kBackendUnavailable) when it exists but cannot be read.
std::optional<std::vector<uint8_t>> ReadFileBytes(const std::filesystem::path& path);

// Creates |dir| and any missing parents, restricting the leaf to its owner.
void EnsurePrivateDirectory(const std::filesystem::path& dir);

}  // namespace devid::storage
