#include "devid/tlv/parser.h"

namespace devid::tlv {
namespace {

constexpr std::size_t kHeaderSize = 4;

uint16_t ReadLe16(std::span<const uint8_t> bytes, std::size_t at) {
  return static_cast<uint16_t>(bytes[at] | (bytes[at + 1] << 8));
}

void WriteLe16(std::vector<uint8_t>& out, uint16_t value) {
  out.push_back(static_cast<uint8_t>(value & 0xFF));
  out.push_back(static_cast<uint8_t>(value >> 8));
}

}  // namespace

Parser::Parser(std::span<const uint8_t> buffer, std::size_t max_records, std::size_t max_payload) {
  std::size_t cursor = 0;
  while (buffer.size() - cursor >= kHeaderSize) {
    const uint16_t type = ReadLe16(buffer, cursor);
    const std::size_t length = ReadLe16(buffer, cursor + 2);
    const std::size_t body = cursor + kHeaderSize;
    if (records_.size() == max_records || length > max_payload || buffer.size() - body < length) {
      records_.clear();
      return;
    }
    records_.push_back(Record{type, buffer.subspan(body, length)});
    cursor = body + length;
  }
  // Trailing bytes shorter than a header mean a torn write.
  valid_ = cursor == buffer.size();
}

bool Builder::Append(uint16_t type, std::span<const uint8_t> value) {
  if (value.size() > kMaxPayload) {
    return false;
  }
  buffer_.reserve(buffer_.size() + kHeaderSize + value.size());
  WriteLe16(buffer_, type);
  WriteLe16(buffer_, static_cast<uint16_t>(value.size()));
  buffer_.insert(buffer_.end(), value.begin(), value.end());
  return true;
}

bool Builder::AppendByte(uint16_t type, uint8_t value) {
  const uint8_t single[1] = {value};
  return Append(type, single);
}

}  // namespace devid::tlv
