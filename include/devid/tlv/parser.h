#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

namespace devid::tlv {

inline constexpr std::size_t kMaxPayload = 64 * 1024 - 1;

struct Record {
  uint16_t type{0};
  std::span<const uint8_t> value{};
};

// Splits |buffer| into (uint16 LE type, uint16 LE length, payload) records.
// valid() is false when a record is truncated or a limit is exceeded; an
// invalid parse yields no records.
class Parser {
 public:
  Parser(std::span<const uint8_t> buffer, std::size_t max_records = 64,
         std::size_t max_payload = kMaxPayload);

  [[nodiscard]] bool valid() const noexcept { return valid_; }
  [[nodiscard]] std::size_t size() const noexcept { return records_.size(); }

  [[nodiscard]] auto begin() const noexcept { return records_.begin(); }
  [[nodiscard]] auto end() const noexcept { return records_.end(); }

 private:
  bool valid_{false};
  std::vector<Record> records_{};
};

// Appends records in the layout Parser reads back.
class Builder {
 public:
  // Returns false without modifying the buffer when |value| exceeds kMaxPayload.
  bool Append(uint16_t type, std::span<const uint8_t> value);
  bool AppendByte(uint16_t type, uint8_t value);

  [[nodiscard]] const std::vector<uint8_t>& bytes() const noexcept { return buffer_; }
  [[nodiscard]] std::vector<uint8_t> Take() noexcept { return std::move(buffer_); }

 private:
  std::vector<uint8_t> buffer_{};
};

}  // namespace devid::tlv
