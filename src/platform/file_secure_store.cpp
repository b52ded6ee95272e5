#include "devid/platform/file_secure_store.h"

#include <algorithm>
#include <cctype>
#include <system_error>
#include <utility>
#include <vector>

#include "devid/common.h"
#include "devid/crypto/random.h"
#include "devid/crypto/sealed_box.h"
#include "devid/error.h"
#include "devid/errors.h"
#include "devid/storage/io_util.h"
#include "devid/tlv/parser.h"

namespace devid::platform {
namespace {

constexpr uint16_t kVersionRecord = 0x0101;
constexpr uint16_t kNonceRecord = 0x0102;
constexpr uint16_t kTagRecord = 0x0103;
constexpr uint16_t kCiphertextRecord = 0x0104;
constexpr uint8_t kItemVersion = 1;
constexpr const char* kKeyFileName = "store.key";
constexpr const char* kItemSuffix = ".item";

using devid::crypto::SealedBox;
using devid::crypto::SealingKey;

void ValidateName(std::string_view name) {
  const bool allowed = !name.empty() && name != "." && name != ".." &&
                       std::all_of(name.begin(), name.end(), [](char ch) {
                         const auto c = static_cast<unsigned char>(ch);
                         return std::isalnum(c) || c == '.' || c == '_' || c == '-';
                       });
  if (!allowed) {
    throw Error{ErrorDomain::Validation, errors::validation::kInvalidStoreName,
                std::string(errors::msg::kSecureStoreInvalidName)};
  }
}

std::vector<uint8_t> BuildAad(std::string_view ns, std::string_view key) {
  std::vector<uint8_t> aad(ns.begin(), ns.end());
  aad.push_back(0);
  aad.insert(aad.end(), key.begin(), key.end());
  return aad;
}

[[noreturn]] void ThrowCorrupt(const std::string& detail) {
  throw Error{ErrorDomain::SecureStore, errors::secure_store::kCorruptRecord,
              std::string(errors::msg::kSecureStoreItemCorrupt) + ": " + detail};
}

// Storage-domain failures from the file layer are re-reported in this
// store's domain so callers see a single taxonomy.
[[noreturn]] void Rethrow(const Error& err, int code, std::string_view message) {
  throw Error{ErrorDomain::SecureStore, code, std::string(message) + ": " + err.what(),
              err.native_code, err.retryability, err.context};
}

}  // namespace

FileSecureStore::FileSecureStore(std::filesystem::path root, std::string id)
    : root_(std::move(root)), id_(std::move(id)) {}

std::filesystem::path FileSecureStore::ItemPath(std::string_view ns, std::string_view key) const {
  ValidateName(ns);
  ValidateName(key);
  std::string file(key);
  file += kItemSuffix;
  return root_ / std::string(ns) / file;
}

const SealingKey& FileSecureStore::LoadOrCreateKeyLocked() {
  if (key_) {
    return *key_;
  }
  const auto key_path = root_ / kKeyFileName;
  std::optional<std::vector<uint8_t>> existing;
  try {
    existing = devid::storage::ReadFileBytes(key_path);
  } catch (const Error& err) {
    Rethrow(err, errors::secure_store::kBackendUnavailable, errors::msg::kSecureStoreKeyUnavailable);
  }
  SealingKey key{};
  if (existing) {
    if (existing->size() != key.size()) {
      throw Error{ErrorDomain::SecureStore, errors::secure_store::kCorruptRecord,
                  std::string(errors::msg::kSecureStoreKeyUnavailable) + ": unexpected key length"};
    }
    std::copy(existing->begin(), existing->end(), key.begin());
  } else {
    devid::crypto::SystemRandomBytes(key);
    try {
      devid::storage::EnsurePrivateDirectory(root_);
      devid::storage::AtomicReplace(key_path, key);
    } catch (const Error& err) {
      Rethrow(err, errors::secure_store::kPersistenceFailure, errors::msg::kSecureStoreKeyUnavailable);
    }
  }
  key_ = key;
  return *key_;
}

std::optional<std::string> FileSecureStore::Read(std::string_view ns, std::string_view key) {
  const auto path = ItemPath(ns, key);
  std::lock_guard<std::mutex> lock(mutex_);
  std::optional<std::vector<uint8_t>> bytes;
  try {
    bytes = devid::storage::ReadFileBytes(path);
  } catch (const Error& err) {
    Rethrow(err, errors::secure_store::kBackendUnavailable, "Secure store read failed");
  }
  if (!bytes) {
    return std::nullopt;
  }

  devid::tlv::Parser parser(*bytes, 8);
  if (!parser.valid()) {
    ThrowCorrupt("malformed item");
  }
  SealedBox box;
  bool version_ok = false;
  bool has_nonce = false;
  bool has_tag = false;
  for (const auto& record : parser) {
    switch (record.type) {
    case kVersionRecord:
      version_ok = record.value.size() == 1 && record.value[0] == kItemVersion;
      break;
    case kNonceRecord:
      if (record.value.size() == box.nonce.size()) {
        std::copy(record.value.begin(), record.value.end(), box.nonce.begin());
        has_nonce = true;
      }
      break;
    case kTagRecord:
      if (record.value.size() == box.tag.size()) {
        std::copy(record.value.begin(), record.value.end(), box.tag.begin());
        has_tag = true;
      }
      break;
    case kCiphertextRecord:
      box.ciphertext.assign(record.value.begin(), record.value.end());
      break;
    default:
      break; // unknown records are ignored for forward compatibility
    }
  }
  if (!version_ok || !has_nonce || !has_tag) {
    ThrowCorrupt("missing item fields");
  }

  const auto& secret = LoadOrCreateKeyLocked();
  const auto aad = BuildAad(ns, key);
  try {
    auto plaintext = devid::crypto::Open(box, aad, secret);
    return std::string(plaintext.begin(), plaintext.end());
  } catch (const AuthenticationFailureError& err) {
    ThrowCorrupt(err.what());
  }
}

void FileSecureStore::Write(std::string_view ns, std::string_view key, std::string_view value) {
  const auto path = ItemPath(ns, key);
  std::lock_guard<std::mutex> lock(mutex_);
  const auto& secret = LoadOrCreateKeyLocked();
  const auto aad = BuildAad(ns, key);
  const auto sealed = devid::crypto::Seal(devid::AsBytes(value), aad, secret);

  devid::tlv::Builder builder;
  builder.AppendByte(kVersionRecord, kItemVersion);
  builder.Append(kNonceRecord, sealed.nonce);
  builder.Append(kTagRecord, sealed.tag);
  if (!builder.Append(kCiphertextRecord, sealed.ciphertext)) {
    throw Error{ErrorDomain::Validation, errors::validation::kValueTooLarge,
                std::string(errors::msg::kSecureStoreWriteFailed) + ": value too large"};
  }
  try {
    devid::storage::EnsurePrivateDirectory(path.parent_path());
    devid::storage::AtomicReplace(path, builder.bytes());
  } catch (const Error& err) {
    Rethrow(err, errors::secure_store::kPersistenceFailure, errors::msg::kSecureStoreWriteFailed);
  }
}

void FileSecureStore::Delete(std::string_view ns, std::string_view key) {
  const auto path = ItemPath(ns, key);
  std::lock_guard<std::mutex> lock(mutex_);
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (ec) {
    throw Error{ErrorDomain::SecureStore, errors::secure_store::kPersistenceFailure,
                std::string(errors::msg::kSecureStoreDeleteFailed) + ": " + ec.message(), ec.value()};
  }
}

}  // namespace devid::platform
