#include "hv/tlv/parser.h"

#include <limits>
#include <stdexcept>

#include "hv/common.h"

namespace hv::tlv {

Parser::Parser(std::span<const uint8_t> buffer, std::size_t max_records, std::size_t max_payload) {
  std::size_t offset = 0;
  while ((buffer.size() - offset) >= kRecordHeaderSize) {
    if (records_.size() >= max_records) {
      valid_ = false;
      return;
    }

    const auto header = buffer.subspan(offset, kRecordHeaderSize);
    const uint16_t type = ReadLittleEndian<uint16_t>(header.first(sizeof(uint16_t)));
    const std::size_t length =
        static_cast<std::size_t>(ReadLittleEndian<uint32_t>(header.subspan(sizeof(uint16_t))));

    if (length > max_payload) {
      valid_ = false;
      return;
    }

    offset += kRecordHeaderSize;
    if ((buffer.size() - offset) < length) {
      valid_ = false;
      return;
    }

    records_.push_back(Record{type, buffer.subspan(offset, length)});
    offset += length;
  }

  valid_ = offset == buffer.size();
  consumed_ = offset;
}

void AppendRecord(std::vector<uint8_t>& out, uint16_t type, std::span<const uint8_t> value) {
  if (value.size() > std::numeric_limits<uint32_t>::max()) {
    throw std::length_error("TLV record value too large");
  }
  out.reserve(out.size() + kRecordHeaderSize + value.size());
  AppendLittleEndian<uint16_t>(out, type);
  AppendLittleEndian<uint32_t>(out, static_cast<uint32_t>(value.size()));
  out.insert(out.end(), value.begin(), value.end());
}

}  // namespace hv::tlv
