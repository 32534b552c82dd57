#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace hv::core {

inline constexpr std::array<uint8_t, 4> kBundleMagic{'H', 'V', 'B', 'N'};
inline constexpr uint16_t kBundleVersion = 1;

// Record types in the order they must appear on the wire.
enum class BundleField : uint16_t {
  kFormatId = 0x0001,
  kSuiteId = 0x0002,
  kClassicalCiphertext = 0x0010,
  kPqcCiphertext = 0x0011,
  kNonce = 0x0020,
  kCiphertext = 0x0021,
  kTag = 0x0022,
  kPbkdfSalt = 0x0030,
  kHybridSalt = 0x0031,
};

struct Bundle {
  std::string format_id;
  std::string suite_id;
  std::vector<uint8_t> classical_ciphertext;
  std::vector<uint8_t> pqc_ciphertext;
  std::vector<uint8_t> nonce;
  std::vector<uint8_t> ciphertext;
  std::vector<uint8_t> tag;
  std::optional<std::vector<uint8_t>> pbkdf_salt;
  std::optional<std::vector<uint8_t>> hybrid_salt;
};

struct BundleHeader {
  std::string format_id;
  std::string suite_id;
};

// Throws FormatMismatchError(kBundleMalformed) when a field exceeds its limit.
std::vector<uint8_t> SerializeBundle(const Bundle& bundle);

// Strict parse: unknown, duplicate or out-of-order records, truncation and
// trailing bytes all raise FormatMismatchError(kBundleMalformed).
Bundle ParseBundle(std::span<const uint8_t> bytes);

// Reads only the magic, version and the two identifier records.
std::optional<BundleHeader> PeekBundleHeader(std::span<const uint8_t> bytes) noexcept;

// Authenticated header: the serialized bundle without the ciphertext and tag
// records. Covers both identifiers, both KEM ciphertexts, the nonce and the
// salts.
std::vector<uint8_t> BundleAssociatedData(const Bundle& bundle);

}  // namespace hv::core
