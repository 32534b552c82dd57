#include "hv/core/bundle.h"

#include <algorithm>
#include <new>
#include <string_view>

#include "hv/common.h"
#include "hv/error.h"
#include "hv/errors.h"
#include "hv/tlv/parser.h"

namespace hv::core {

namespace {

constexpr size_t kPrefixSize = kBundleMagic.size() + sizeof(uint16_t);
constexpr size_t kMaxIdentifierLength = 64;
constexpr size_t kMaxKemCiphertextLength = 4096;
constexpr size_t kMaxNonceLength = 32;
constexpr size_t kMaxCiphertextLength = 256u * 1024u * 1024u;
constexpr size_t kMaxTagLength = 32;
constexpr size_t kMaxSaltLength = 64;
constexpr size_t kMaxRecords = 9;

[[noreturn]] void ThrowMalformed(std::string_view message) {
  throw FormatMismatchError(std::string(message), errors::validation::kBundleMalformed);
}

std::optional<size_t> FieldLimit(uint16_t type) noexcept {
  switch (static_cast<BundleField>(type)) {
  case BundleField::kFormatId:
  case BundleField::kSuiteId:
    return kMaxIdentifierLength;
  case BundleField::kClassicalCiphertext:
  case BundleField::kPqcCiphertext:
    return kMaxKemCiphertextLength;
  case BundleField::kNonce:
    return kMaxNonceLength;
  case BundleField::kCiphertext:
    return kMaxCiphertextLength;
  case BundleField::kTag:
    return kMaxTagLength;
  case BundleField::kPbkdfSalt:
  case BundleField::kHybridSalt:
    return kMaxSaltLength;
  }
  return std::nullopt;
}

bool HasValidPrefix(std::span<const uint8_t> bytes) noexcept {
  if (bytes.size() < kPrefixSize) {
    return false;
  }
  return std::equal(kBundleMagic.begin(), kBundleMagic.end(), bytes.begin());
}

void AppendField(std::vector<uint8_t>& out, BundleField field, std::span<const uint8_t> value) {
  const auto type = static_cast<uint16_t>(field);
  if (value.size() > *FieldLimit(type)) {
    ThrowMalformed(errors::msg::kBundleRecordTooLarge);
  }
  tlv::AppendRecord(out, type, value);
}

void AppendBundleRecords(std::vector<uint8_t>& out, const Bundle& bundle, bool with_payload) {
  out.insert(out.end(), kBundleMagic.begin(), kBundleMagic.end());
  AppendLittleEndian<uint16_t>(out, kBundleVersion);
  AppendField(out, BundleField::kFormatId, AsBytes(bundle.format_id));
  AppendField(out, BundleField::kSuiteId, AsBytes(bundle.suite_id));
  if (!bundle.classical_ciphertext.empty()) {
    AppendField(out, BundleField::kClassicalCiphertext, bundle.classical_ciphertext);
  }
  if (!bundle.pqc_ciphertext.empty()) {
    AppendField(out, BundleField::kPqcCiphertext, bundle.pqc_ciphertext);
  }
  AppendField(out, BundleField::kNonce, bundle.nonce);
  if (with_payload) {
    AppendField(out, BundleField::kCiphertext, bundle.ciphertext);
    AppendField(out, BundleField::kTag, bundle.tag);
  }
  if (bundle.pbkdf_salt) {
    AppendField(out, BundleField::kPbkdfSalt, *bundle.pbkdf_salt);
  }
  if (bundle.hybrid_salt) {
    AppendField(out, BundleField::kHybridSalt, *bundle.hybrid_salt);
  }
}

std::string ToString(std::span<const uint8_t> value) {
  return std::string(value.begin(), value.end());
}

std::vector<uint8_t> ToVector(std::span<const uint8_t> value) {
  return std::vector<uint8_t>(value.begin(), value.end());
}

}  // namespace

std::vector<uint8_t> SerializeBundle(const Bundle& bundle) {
  std::vector<uint8_t> out;
  out.reserve(kPrefixSize + bundle.ciphertext.size() + 256);
  AppendBundleRecords(out, bundle, true);
  return out;
}

Bundle ParseBundle(std::span<const uint8_t> bytes) {
  if (bytes.size() < kPrefixSize) {
    ThrowMalformed(errors::msg::kBundleTruncated);
  }
  if (!HasValidPrefix(bytes)) {
    ThrowMalformed(errors::msg::kBundleMagicMismatch);
  }
  const auto version = ReadLittleEndian<uint16_t>(bytes.subspan(kBundleMagic.size()));
  if (version != kBundleVersion) {
    ThrowMalformed(errors::msg::kBundleVersionUnsupported);
  }

  const auto body = bytes.subspan(kPrefixSize);
  tlv::Parser parser(body, kMaxRecords, kMaxCiphertextLength);
  if (!parser.valid()) {
    // More records than fields can only mean duplicates.
    ThrowMalformed(parser.size() >= kMaxRecords ? errors::msg::kBundleRecordOrder
                                                : errors::msg::kBundleTruncated);
  }

  Bundle bundle;
  bool have_format = false;
  bool have_suite = false;
  bool have_nonce = false;
  bool have_ciphertext = false;
  bool have_tag = false;
  int previous_type = -1;
  for (const auto& record : parser) {
    if (static_cast<int>(record.type) <= previous_type) {
      ThrowMalformed(errors::msg::kBundleRecordOrder);
    }
    previous_type = record.type;
    const auto limit = FieldLimit(record.type);
    if (!limit) {
      ThrowMalformed(errors::msg::kBundleRecordUnknown);
    }
    if (record.value.size() > *limit) {
      ThrowMalformed(errors::msg::kBundleRecordTooLarge);
    }
    switch (static_cast<BundleField>(record.type)) {
    case BundleField::kFormatId:
      bundle.format_id = ToString(record.value);
      have_format = true;
      break;
    case BundleField::kSuiteId:
      bundle.suite_id = ToString(record.value);
      have_suite = true;
      break;
    case BundleField::kClassicalCiphertext:
      bundle.classical_ciphertext = ToVector(record.value);
      break;
    case BundleField::kPqcCiphertext:
      bundle.pqc_ciphertext = ToVector(record.value);
      break;
    case BundleField::kNonce:
      bundle.nonce = ToVector(record.value);
      have_nonce = true;
      break;
    case BundleField::kCiphertext:
      bundle.ciphertext = ToVector(record.value);
      have_ciphertext = true;
      break;
    case BundleField::kTag:
      bundle.tag = ToVector(record.value);
      have_tag = true;
      break;
    case BundleField::kPbkdfSalt:
      bundle.pbkdf_salt = ToVector(record.value);
      break;
    case BundleField::kHybridSalt:
      bundle.hybrid_salt = ToVector(record.value);
      break;
    }
  }

  if (!have_format || !have_suite || !have_nonce || !have_ciphertext || !have_tag) {
    ThrowMalformed(errors::msg::kBundleRequiredMissing);
  }
  return bundle;
}

std::optional<BundleHeader> PeekBundleHeader(std::span<const uint8_t> bytes) noexcept {
  if (!HasValidPrefix(bytes)) {
    return std::nullopt;
  }
  if (ReadLittleEndian<uint16_t>(bytes.subspan(kBundleMagic.size())) != kBundleVersion) {
    return std::nullopt;
  }

  size_t offset = kPrefixSize;
  auto read_identifier = [&](BundleField expected) -> std::optional<std::string> {
    if (bytes.size() - offset < tlv::kRecordHeaderSize) {
      return std::nullopt;
    }
    const auto header = bytes.subspan(offset, tlv::kRecordHeaderSize);
    const auto type = ReadLittleEndian<uint16_t>(header);
    const auto length = static_cast<size_t>(ReadLittleEndian<uint32_t>(header.subspan(sizeof(uint16_t))));
    if (type != static_cast<uint16_t>(expected) || length > kMaxIdentifierLength) {
      return std::nullopt;
    }
    offset += tlv::kRecordHeaderSize;
    if (bytes.size() - offset < length) {
      return std::nullopt;
    }
    auto value = bytes.subspan(offset, length);
    offset += length;
    return std::string(value.begin(), value.end());
  };

  try {
    auto format_id = read_identifier(BundleField::kFormatId);
    if (!format_id) {
      return std::nullopt;
    }
    auto suite_id = read_identifier(BundleField::kSuiteId);
    if (!suite_id) {
      return std::nullopt;
    }
    return BundleHeader{std::move(*format_id), std::move(*suite_id)};
  } catch (const std::bad_alloc&) {
    return std::nullopt;
  }
}

std::vector<uint8_t> BundleAssociatedData(const Bundle& bundle) {
  std::vector<uint8_t> aad;
  aad.reserve(kPrefixSize + 256 + bundle.classical_ciphertext.size() + bundle.pqc_ciphertext.size());
  AppendBundleRecords(aad, bundle, false);
  return aad;
}

}  // namespace hv::core
