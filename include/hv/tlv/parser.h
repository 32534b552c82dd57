#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace hv::tlv {

// Records are laid out as: type (u16 LE) | length (u32 LE) | value.
inline constexpr std::size_t kRecordHeaderSize = sizeof(uint16_t) + sizeof(uint32_t);

struct Record {
  uint16_t type{0};
  std::span<const uint8_t> value{};
};

class Parser {
 public:
  Parser(std::span<const uint8_t> buffer, std::size_t max_records = 64,
         std::size_t max_payload = 256u * 1024u * 1024u);

  [[nodiscard]] bool valid() const noexcept { return valid_; }
  [[nodiscard]] std::size_t consumed() const noexcept { return consumed_; }
  [[nodiscard]] std::size_t size() const noexcept { return records_.size(); }

  [[nodiscard]] auto begin() const noexcept { return records_.begin(); }
  [[nodiscard]] auto end() const noexcept { return records_.end(); }

 private:
  bool valid_{false};
  std::size_t consumed_{0};
  std::vector<Record> records_{};
};

// Appends one record to |out|. Throws std::length_error if |value| does not
// fit the 32-bit length field.
void AppendRecord(std::vector<uint8_t>& out, uint16_t type, std::span<const uint8_t> value);

}  // namespace hv::tlv
