#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace devid {
  enum class ErrorDomain : std::uint16_t {
    Storage = 0x01,
    SecureStore = 0x02,
    Remote = 0x03,
    Crypto = 0x04,
    Validation = 0x05,
    Config = 0x06,
    State = 0x07,
    Internal = 0x7F
  };

  // Each domain reserves 0x100 codes starting at its base so framework codes
  // never collide with propagated platform error numbers. Codes are stable
  // across releases.
  inline constexpr int ErrorDomainBase(ErrorDomain domain) {
    switch (domain) {
    case ErrorDomain::Storage:
      return 0x0100;
    case ErrorDomain::SecureStore:
      return 0x0200;
    case ErrorDomain::Remote:
      return 0x0300;
    case ErrorDomain::Crypto:
      return 0x0400;
    case ErrorDomain::Validation:
      return 0x0500;
    case ErrorDomain::Config:
      return 0x0600;
    case ErrorDomain::State:
      return 0x0700;
    case ErrorDomain::Internal:
      return 0x7F00;
    }
    return 0; // unreachable but placates compilers without warnings enabled
  }

  enum class Retryability : std::uint8_t {
    kFatal = 0,
    kTransient,
    kRetryable
  };

  namespace errors {
    inline constexpr int Make(ErrorDomain domain, int offset) {
      return ErrorDomainBase(domain) + offset;
    }

    // Identity backends share one failure taxonomy: unavailable backends and
    // missing values degrade to "absent", failed writes are reported only.
    // TSK301_Device_Identity_Resolution
    inline constexpr int kBackendUnavailableOffset = 0x01;
    inline constexpr int kNotFoundOffset = 0x02;
    inline constexpr int kPersistenceFailureOffset = 0x03;
    inline constexpr int kTimeoutOffset = 0x04;
    inline constexpr int kCorruptRecordOffset = 0x05;

    namespace storage {
      inline constexpr int kBackendUnavailable = Make(ErrorDomain::Storage, kBackendUnavailableOffset);
      inline constexpr int kNotFound = Make(ErrorDomain::Storage, kNotFoundOffset);
      inline constexpr int kPersistenceFailure = Make(ErrorDomain::Storage, kPersistenceFailureOffset);
      inline constexpr int kCorruptRecord = Make(ErrorDomain::Storage, kCorruptRecordOffset);
    } // namespace storage

    namespace secure_store {
      inline constexpr int kBackendUnavailable = Make(ErrorDomain::SecureStore, kBackendUnavailableOffset);
      inline constexpr int kNotFound = Make(ErrorDomain::SecureStore, kNotFoundOffset);
      inline constexpr int kPersistenceFailure = Make(ErrorDomain::SecureStore, kPersistenceFailureOffset);
      inline constexpr int kCorruptRecord = Make(ErrorDomain::SecureStore, kCorruptRecordOffset);
    } // namespace secure_store

    namespace remote {
      inline constexpr int kBackendUnavailable = Make(ErrorDomain::Remote, kBackendUnavailableOffset);
      inline constexpr int kNotFound = Make(ErrorDomain::Remote, kNotFoundOffset);
      inline constexpr int kPersistenceFailure = Make(ErrorDomain::Remote, kPersistenceFailureOffset);
      inline constexpr int kTimeout = Make(ErrorDomain::Remote, kTimeoutOffset);
    } // namespace remote

    namespace config {
      inline constexpr int kMissingCollaborator = Make(ErrorDomain::Config, 0x01);
    } // namespace config

    namespace crypto {
      inline constexpr int kRandomUnavailable = Make(ErrorDomain::Crypto, 0x01);
      inline constexpr int kCipherFailure = Make(ErrorDomain::Crypto, 0x02);
      inline constexpr int kDigestFailure = Make(ErrorDomain::Crypto, 0x03);
    } // namespace crypto

    namespace validation {
      inline constexpr int kInvalidIdentifier = Make(ErrorDomain::Validation, 0x01);
      inline constexpr int kInvalidStoreName = Make(ErrorDomain::Validation, 0x02);
      inline constexpr int kValueTooLarge = Make(ErrorDomain::Validation, 0x03);
    } // namespace validation

    // True for the codes that mean "no such value" in any backend domain.
    inline constexpr bool IsNotFound(ErrorDomain domain, int code) {
      return code == Make(domain, kNotFoundOffset);
    }
  } // namespace errors

  struct Error : public std::runtime_error {
    ErrorDomain domain;
    int code;
    std::optional<int> native_code;
    Retryability retryability{Retryability::kFatal};
    std::vector<std::string> context;
    explicit Error(ErrorDomain d, int c, std::string msg,
                   std::optional<int> native = std::nullopt,
                   Retryability retry = Retryability::kFatal,
                   std::vector<std::string> ctx = {})
        : std::runtime_error(std::move(msg)),
          domain(d),
          code(c),
          native_code(native),
          retryability(retry),
          context(std::move(ctx)) {}
  };
  struct AuthenticationFailureError : public std::runtime_error {
    explicit AuthenticationFailureError(const std::string& msg) : std::runtime_error(msg) {}
  };
} // namespace devid
