#include "hv/core/bundle.h"
#include "hv/common.h"
#include "hv/error.h"

#include <array>
#include <cassert>
#include <cstdint>
#include <functional>
#include <iostream>
#include <vector>

namespace {

hv::core::Bundle SampleBundle() {
  hv::core::Bundle bundle;
  bundle.format_id = "HV_HYBRID_V1";
  bundle.suite_id = "HYBRID-A";
  bundle.classical_ciphertext = std::vector<uint8_t>(32, 0xC1);
  bundle.pqc_ciphertext = std::vector<uint8_t>(1088, 0xD2);
  bundle.nonce = std::vector<uint8_t>(12, 0x0A);
  bundle.ciphertext = {0x10, 0x20, 0x30};
  bundle.tag = std::vector<uint8_t>(16, 0x7F);
  bundle.pbkdf_salt = std::vector<uint8_t>(16, 0x01);
  bundle.hybrid_salt = std::vector<uint8_t>(16, 0x02);
  return bundle;
}

bool RejectsAsMalformed(const std::vector<uint8_t>& bytes) {
  try {
    (void)hv::core::ParseBundle(bytes);
  } catch (const hv::FormatMismatchError& e) {
    return e.code == hv::errors::validation::kBundleMalformed;
  }
  return false;
}

void AppendRecord(std::vector<uint8_t>& out, uint16_t type, const std::vector<uint8_t>& value) {
  hv::AppendLittleEndian<uint16_t>(out, type);
  hv::AppendLittleEndian<uint32_t>(out, static_cast<uint32_t>(value.size()));
  out.insert(out.end(), value.begin(), value.end());
}

std::vector<uint8_t> Prefix() {
  return {'H', 'V', 'B', 'N', 0x01, 0x00};
}

void TestLayout() {
  hv::core::Bundle bundle;
  bundle.format_id = "F";
  bundle.suite_id = "S";
  bundle.nonce = {0xAA};
  bundle.ciphertext = {};
  bundle.tag = {0xBB};
  const auto bytes = hv::core::SerializeBundle(bundle);
  const std::vector<uint8_t> expected = {
      'H', 'V', 'B', 'N', 0x01, 0x00,                   // magic, version
      0x01, 0x00, 0x01, 0x00, 0x00, 0x00, 'F',          // format id
      0x02, 0x00, 0x01, 0x00, 0x00, 0x00, 'S',          // suite id
      0x20, 0x00, 0x01, 0x00, 0x00, 0x00, 0xAA,         // nonce
      0x21, 0x00, 0x00, 0x00, 0x00, 0x00,               // empty ciphertext
      0x22, 0x00, 0x01, 0x00, 0x00, 0x00, 0xBB,         // tag
  };
  assert(bytes == expected && "bundle encoding must match golden layout");
}

void TestRoundTrip() {
  const auto original = SampleBundle();
  const auto bytes = hv::core::SerializeBundle(original);
  const auto parsed = hv::core::ParseBundle(bytes);
  assert(parsed.format_id == original.format_id);
  assert(parsed.suite_id == original.suite_id);
  assert(parsed.classical_ciphertext == original.classical_ciphertext);
  assert(parsed.pqc_ciphertext == original.pqc_ciphertext);
  assert(parsed.nonce == original.nonce);
  assert(parsed.ciphertext == original.ciphertext);
  assert(parsed.tag == original.tag);
  assert(parsed.pbkdf_salt == original.pbkdf_salt);
  assert(parsed.hybrid_salt == original.hybrid_salt);

  auto without_optional = original;
  without_optional.pqc_ciphertext.clear();
  without_optional.pbkdf_salt.reset();
  const auto reparsed = hv::core::ParseBundle(hv::core::SerializeBundle(without_optional));
  assert(reparsed.pqc_ciphertext.empty());
  assert(!reparsed.pbkdf_salt.has_value());
  assert(reparsed.hybrid_salt.has_value());
}

void TestPeek() {
  const auto bytes = hv::core::SerializeBundle(SampleBundle());
  auto header = hv::core::PeekBundleHeader(bytes);
  assert(header.has_value());
  assert(header->format_id == "HV_HYBRID_V1");
  assert(header->suite_id == "HYBRID-A");

  // Only the identifier records are needed.
  std::vector<uint8_t> head(bytes.begin(), bytes.begin() + 6 + 6 + 12 + 6 + 8);
  header = hv::core::PeekBundleHeader(head);
  assert(header.has_value() && header->suite_id == "HYBRID-A");

  head.pop_back();
  assert(!hv::core::PeekBundleHeader(head).has_value());

  const std::string armored = "-----BEGIN PGP MESSAGE-----\n";
  assert(!hv::core::PeekBundleHeader(hv::AsBytes(armored)).has_value());
  assert(!hv::core::PeekBundleHeader({}).has_value());
}

void TestMalformed() {
  const auto good = hv::core::SerializeBundle(SampleBundle());

  auto bad_magic = good;
  bad_magic[0] = 'X';
  assert(RejectsAsMalformed(bad_magic));

  auto bad_version = good;
  bad_version[4] = 0x02;
  assert(RejectsAsMalformed(bad_version));

  auto truncated = good;
  truncated.pop_back();
  assert(RejectsAsMalformed(truncated));

  auto trailing = good;
  trailing.push_back(0x00);
  assert(RejectsAsMalformed(trailing));

  assert(RejectsAsMalformed({'H', 'V'}));

  const std::vector<uint8_t> id = {'x'};
  const std::vector<uint8_t> nonce(12, 0x00);
  const std::vector<uint8_t> tag(16, 0x00);

  auto out_of_order = Prefix();
  AppendRecord(out_of_order, 0x0002, id);
  AppendRecord(out_of_order, 0x0001, id);
  AppendRecord(out_of_order, 0x0020, nonce);
  AppendRecord(out_of_order, 0x0021, {});
  AppendRecord(out_of_order, 0x0022, tag);
  assert(RejectsAsMalformed(out_of_order));

  auto duplicate = Prefix();
  AppendRecord(duplicate, 0x0001, id);
  AppendRecord(duplicate, 0x0002, id);
  AppendRecord(duplicate, 0x0020, nonce);
  AppendRecord(duplicate, 0x0020, nonce);
  AppendRecord(duplicate, 0x0021, {});
  AppendRecord(duplicate, 0x0022, tag);
  assert(RejectsAsMalformed(duplicate));

  auto unknown = Prefix();
  AppendRecord(unknown, 0x0001, id);
  AppendRecord(unknown, 0x0002, id);
  AppendRecord(unknown, 0x0015, id);
  AppendRecord(unknown, 0x0020, nonce);
  AppendRecord(unknown, 0x0021, {});
  AppendRecord(unknown, 0x0022, tag);
  assert(RejectsAsMalformed(unknown));

  auto missing_tag = Prefix();
  AppendRecord(missing_tag, 0x0001, id);
  AppendRecord(missing_tag, 0x0002, id);
  AppendRecord(missing_tag, 0x0020, nonce);
  AppendRecord(missing_tag, 0x0021, {});
  assert(RejectsAsMalformed(missing_tag));

  auto oversized_nonce = Prefix();
  AppendRecord(oversized_nonce, 0x0001, id);
  AppendRecord(oversized_nonce, 0x0002, id);
  AppendRecord(oversized_nonce, 0x0020, std::vector<uint8_t>(33, 0x00));
  AppendRecord(oversized_nonce, 0x0021, {});
  AppendRecord(oversized_nonce, 0x0022, tag);
  assert(RejectsAsMalformed(oversized_nonce));

  // A length field pointing past the end of the buffer.
  auto lying_length = Prefix();
  hv::AppendLittleEndian<uint16_t>(lying_length, 0x0001);
  hv::AppendLittleEndian<uint32_t>(lying_length, 0xFFFFFFF0u);
  lying_length.push_back('x');
  assert(RejectsAsMalformed(lying_length));

  auto oversized_suite = SampleBundle();
  oversized_suite.suite_id.assign(65, 'S');
  bool refused = false;
  try {
    (void)hv::core::SerializeBundle(oversized_suite);
  } catch (const hv::FormatMismatchError&) {
    refused = true;
  }
  assert(refused && "serializer must enforce field limits");
}

void TestAssociatedData() {
  hv::core::Bundle small;
  small.format_id = "F";
  small.suite_id = "S";
  small.nonce = {0xAA};
  small.ciphertext = {0x01, 0x02};
  small.tag = {0xBB};
  small.hybrid_salt = std::vector<uint8_t>{0xCC};
  const std::vector<uint8_t> expected = {
      'H', 'V', 'B', 'N', 0x01, 0x00,
      0x01, 0x00, 0x01, 0x00, 0x00, 0x00, 'F',
      0x02, 0x00, 0x01, 0x00, 0x00, 0x00, 'S',
      0x20, 0x00, 0x01, 0x00, 0x00, 0x00, 0xAA,
      0x31, 0x00, 0x01, 0x00, 0x00, 0x00, 0xCC,
  };
  assert(hv::core::BundleAssociatedData(small) == expected && "ciphertext and tag stay out of the header");

  const auto base = SampleBundle();
  const auto aad = hv::core::BundleAssociatedData(base);

  auto payload_changed = base;
  payload_changed.ciphertext.push_back(0x99);
  payload_changed.tag[0] ^= 0xFF;
  assert(hv::core::BundleAssociatedData(payload_changed) == aad);

  // Every header field, including bits a KEM would ignore, reaches the AAD.
  const std::vector<std::function<void(hv::core::Bundle&)>> edits = {
      [](hv::core::Bundle& b) { b.format_id += "X"; },
      [](hv::core::Bundle& b) { b.suite_id += "X"; },
      [](hv::core::Bundle& b) { b.classical_ciphertext[31] ^= 0x80; },
      [](hv::core::Bundle& b) { b.pqc_ciphertext.back() ^= 0x01; },
      [](hv::core::Bundle& b) { b.nonce[11] ^= 0x01; },
      [](hv::core::Bundle& b) { (*b.pbkdf_salt)[0] ^= 0x01; },
      [](hv::core::Bundle& b) { b.pbkdf_salt.reset(); },
      [](hv::core::Bundle& b) { (*b.hybrid_salt)[15] ^= 0x01; },
  };
  for (const auto& edit : edits) {
    auto copy = base;
    edit(copy);
    assert(hv::core::BundleAssociatedData(copy) != aad);
  }
}

}  // namespace

int main() {
  TestLayout();
  TestRoundTrip();
  TestPeek();
  TestMalformed();
  TestAssociatedData();
  std::cout << "bundle codec test ok\n";
  return 0;
}
