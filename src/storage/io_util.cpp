#include "devid/storage/io_util.h"

#include "devid/common.h"
#include "devid/crypto/random.h"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#ifndef _WIN32
#include <fcntl.h>
#include <unistd.h>
#endif

namespace devid::storage {
namespace {

devid::Retryability RetryabilityFor(int native) {
  switch (native) {
  case EINTR:
  case EAGAIN:
    return devid::Retryability::kRetryable;
  case EBUSY:
  case ETIMEDOUT:
    return devid::Retryability::kTransient;
  default:
    return devid::Retryability::kFatal;
  }
}

// One failed step of a replace. |context| carries the target path first and
// the step second so log consumers can group failures per file.
[[noreturn]] void ThrowReplaceFailure(const std::filesystem::path& target, std::string_view step,
                                      std::string detail, std::optional<int> native) {
  std::string message = "Atomic file replace failed while ";
  message += step;
  if (!detail.empty()) {
    message += ": ";
    message += detail;
  }
  throw Error{ErrorDomain::Storage, errors::storage::kPersistenceFailure, std::move(message), native,
              native ? RetryabilityFor(*native) : devid::Retryability::kFatal,
              {devid::PathToUtf8String(target), std::string(step)}};
}

[[noreturn]] void ThrowErrno(const std::filesystem::path& target, std::string_view step, int err) {
  ThrowReplaceFailure(target, step, std::strerror(err), err);
}

// Removes the staging file unless Commit() ran.
class StagingFile {
 public:
  explicit StagingFile(std::filesystem::path path) : path_(std::move(path)) {}
  StagingFile(const StagingFile&) = delete;
  StagingFile& operator=(const StagingFile&) = delete;
  ~StagingFile() {
    if (!path_.empty()) {
      std::error_code ignored;
      std::filesystem::remove(path_, ignored);
    }
  }
  const std::filesystem::path& path() const noexcept { return path_; }
  void Commit() noexcept { path_.clear(); }

 private:
  std::filesystem::path path_;
};

std::filesystem::path StagingPathFor(const std::filesystem::path& target) {
  std::filesystem::path name = target.filename();
  name += ".tmp.";
  name += devid::HexEncode(devid::crypto::RandomArray<8>());
  return target.parent_path() / name;
}

#ifndef _WIN32
void WriteDurably(const std::filesystem::path& target, const std::filesystem::path& staging,
                  std::span<const uint8_t> payload) {
  const int fd = ::open(staging.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, 0600);
  if (fd < 0) {
    ThrowErrno(target, "creating staging file", errno);
  }
  size_t offset = 0;
  while (offset < payload.size()) {
    const ssize_t n = ::write(fd, payload.data() + offset, payload.size() - offset);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      const int err = n < 0 ? errno : EIO;
      ::close(fd);
      ThrowErrno(target, "writing payload", err);
    }
    offset += static_cast<size_t>(n);
  }
  int rc = 0;
  do {
    rc = ::fsync(fd);
  } while (rc != 0 && errno == EINTR);
  const int sync_err = rc != 0 ? errno : 0;
  if (::close(fd) != 0 && sync_err == 0) {
    ThrowErrno(target, "closing staging file", errno);
  }
  if (sync_err != 0) {
    ThrowErrno(target, "syncing payload", sync_err);
  }
}

void SyncParent(const std::filesystem::path& target) {
  const auto dir = target.parent_path().empty() ? std::filesystem::path(".") : target.parent_path();
  const int fd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (fd < 0) {
    ThrowErrno(target, "opening parent directory", errno);
  }
  const int rc = ::fsync(fd);
  const int err = errno;
  ::close(fd);
  if (rc != 0) {
    ThrowErrno(target, "syncing parent directory", err);
  }
}
#else
void WriteDurably(const std::filesystem::path& target, const std::filesystem::path& staging,
                  std::span<const uint8_t> payload) {
  std::ofstream out(staging, std::ios::binary | std::ios::trunc);
  out.write(reinterpret_cast<const char*>(payload.data()), static_cast<std::streamsize>(payload.size()));
  out.flush();
  if (!out) {
    ThrowReplaceFailure(target, "writing payload", "stream error", std::nullopt);
  }
}

void SyncParent(const std::filesystem::path&) {}
#endif

}  // namespace

void AtomicReplace(const std::filesystem::path& target, std::span<const uint8_t> payload,
                   const AtomicReplaceHooks& hooks) {
  if (const auto dir = target.parent_path(); !dir.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
      ThrowReplaceFailure(target, "creating parent directory", ec.message(), ec.value());
    }
  }

  StagingFile staging(StagingPathFor(target));
  WriteDurably(target, staging.path(), payload);

  if (hooks.before_rename) {
    try {
      hooks.before_rename(staging.path(), target);
    } catch (const std::exception& ex) {
      ThrowReplaceFailure(target, "running before_rename hook", ex.what(), std::nullopt);
    }
  }

  std::error_code ec;
  std::filesystem::rename(staging.path(), target, ec);
  if (ec) {
    ThrowReplaceFailure(target, "renaming into place", ec.message(), ec.value());
  }
  staging.Commit();
  SyncParent(target);
}

std::optional<std::vector<uint8_t>> ReadFileBytes(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    if (!ec) {
      return std::nullopt;
    }
    throw Error{ErrorDomain::Storage, errors::storage::kBackendUnavailable,
                "Failed to stat " + devid::PathToUtf8String(path) + ": " + ec.message(), ec.value(),
                devid::Retryability::kTransient};
  }
  std::ifstream in(path, std::ios::binary);
  std::vector<uint8_t> bytes;
  if (in) {
    bytes.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  }
  if (!in.is_open() || in.bad()) {
    throw Error{ErrorDomain::Storage, errors::storage::kBackendUnavailable,
                "Failed to read " + devid::PathToUtf8String(path), errno,
                devid::Retryability::kTransient};
  }
  return bytes;
}

void EnsurePrivateDirectory(const std::filesystem::path& dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (!ec) {
    std::filesystem::permissions(dir, std::filesystem::perms::owner_all,
                                 std::filesystem::perm_options::replace, ec);
  }
  if (ec) {
    throw Error{ErrorDomain::Storage, errors::storage::kPersistenceFailure,
                "Failed to prepare private directory " + devid::PathToUtf8String(dir) + ": " +
                    ec.message(),
                ec.value(), RetryabilityFor(ec.value())};
  }
}

}  // namespace devid::storage
