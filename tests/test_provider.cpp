#include "hv/crypto/provider.h"
#include "hv/common.h"
#include "hv/error.h"

#include <array>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace {

std::vector<uint8_t> FromHex(const std::string& hex) {
  std::vector<uint8_t> out;
  for (size_t i = 0; i + 1 < hex.size(); i += 2) {
    out.push_back(static_cast<uint8_t>(std::stoul(hex.substr(i, 2), nullptr, 16)));
  }
  return out;
}

template <typename Buffer>
std::vector<uint8_t> Bytes(const Buffer& buffer) {
  return std::vector<uint8_t>(buffer.data(), buffer.data() + buffer.size());
}

void TestAeadRoundTripAndTamper(hv::crypto::AlgorithmProvider& provider) {
  for (auto name : {hv::crypto::alg::kAes256Gcm, hv::crypto::alg::kAes128Gcm,
                    hv::crypto::alg::kChaCha20Poly1305}) {
    std::vector<uint8_t> key(provider.AeadKeyLength(name), 0x42);
    std::vector<uint8_t> nonce(hv::crypto::kAeadNonceSize, 0x07);
    const std::string message = "ledger line";
    const auto aad = hv::AsBytes("header");
    auto sealed = provider.AeadSeal(name, key, nonce, hv::AsBytes(message), aad);
    assert(sealed.tag.size() == hv::crypto::kAeadTagSize);
    assert(sealed.ciphertext.size() == message.size());

    auto opened = provider.AeadOpen(name, key, nonce, sealed.ciphertext, sealed.tag, aad);
    assert(std::string(opened.begin(), opened.end()) == message);

    auto tampered = sealed.ciphertext;
    tampered[0] ^= 0x01;
    bool rejected = false;
    try {
      (void)provider.AeadOpen(name, key, nonce, tampered, sealed.tag, aad);
    } catch (const hv::AuthenticationError&) {
      rejected = true;
    }
    assert(rejected && "modified ciphertext must fail authentication");

    rejected = false;
    try {
      (void)provider.AeadOpen(name, key, nonce, sealed.ciphertext, sealed.tag, hv::AsBytes("other"));
    } catch (const hv::AuthenticationError&) {
      rejected = true;
    }
    assert(rejected && "different associated data must fail authentication");
  }
}

void TestHkdfVector(hv::crypto::AlgorithmProvider& provider) {
  // RFC 5869 test case 1.
  const std::vector<uint8_t> ikm(22, 0x0b);
  const auto salt = FromHex("000102030405060708090a0b0c");
  const auto info = FromHex("f0f1f2f3f4f5f6f7f8f9");
  const auto expected = FromHex(
      "3cb25f25faacd57a90434f64d0362f2a2d2d0a90cf1a5a4c5db02d56ecc4c5bf34007208d5b887185865");
  auto okm = provider.KdfDerive(hv::crypto::alg::kHkdfSha256, ikm, salt, info, expected.size());
  assert(Bytes(okm) == expected);

  auto wide = provider.KdfDerive(hv::crypto::alg::kHkdfSha3_512, ikm, salt, info, 64);
  assert(wide.size() == 64);
}

void TestPbkdf2Vector(hv::crypto::AlgorithmProvider& provider) {
  hv::crypto::PbkdfParams params;
  params.algorithm = std::string(hv::crypto::alg::kPbkdf2Sha256);
  params.iterations = 2;
  params.output_length = 32;
  auto derived = provider.PbkdfStretch(params, hv::AsBytes("password"), hv::AsBytes("salt"));
  assert(Bytes(derived) ==
         FromHex("ae4d0c95af6b46d32d0adff928f06dd02a303f8ef3c251dfd6e2d85a95474c43"));
}

void TestArgon2Sensitivity(hv::crypto::AlgorithmProvider& provider) {
  hv::crypto::PbkdfParams params;
  params.time_cost = 1;
  params.memory_cost_kib = 1024;
  params.parallelism = 1;
  params.output_length = 32;
  const std::vector<uint8_t> salt_a(16, 0x01);
  const std::vector<uint8_t> salt_b(16, 0x02);
  auto a1 = provider.PbkdfStretch(params, hv::AsBytes("pw"), salt_a);
  auto a2 = provider.PbkdfStretch(params, hv::AsBytes("pw"), salt_a);
  auto b = provider.PbkdfStretch(params, hv::AsBytes("pw"), salt_b);
  assert(Bytes(a1) == Bytes(a2));
  assert(Bytes(a1) != Bytes(b));
}

void TestX25519SeedIsPrivateKey(hv::crypto::AlgorithmProvider& provider) {
  // RFC 7748 section 6.1, Alice.
  const auto private_key =
      FromHex("77076d0a7318a57d3c16c17251b26645df4c2f87ebc0992ab177fba51db92c2a");
  const auto expected_public =
      FromHex("8520f0098930a754748b7ddcb43ef75a0dbf3a0d26381af4eba4a98eaa9b4e6a");
  auto pair = provider.GenerateClassicalKeypair(hv::crypto::alg::kX25519, private_key);
  assert(pair.public_key == expected_public);
  assert(Bytes(pair.secret_key) == private_key);
  assert(provider.ClassicalPublicFromPrivate(hv::crypto::alg::kX25519, private_key) == expected_public);
}

void TestKemAgreement(hv::crypto::AlgorithmProvider& provider) {
  for (auto name : {hv::crypto::alg::kX25519, hv::crypto::alg::kX448}) {
    auto pair = provider.GenerateClassicalKeypair(name);
    auto encap = provider.ClassicalEncapsulate(name, pair.public_key);
    auto secret = provider.ClassicalDecapsulate(name, pair.secret_key.AsSpan(), encap.ciphertext);
    assert(Bytes(secret) == Bytes(encap.shared_secret));
    assert(encap.ciphertext.size() == provider.DescribeClassicalKem(name).ciphertext);
  }
  for (auto name : {hv::crypto::alg::kMlKem512, hv::crypto::alg::kMlKem768, hv::crypto::alg::kMlKem1024}) {
    const auto sizes = provider.DescribePqcKem(name);
    auto pair = provider.GeneratePqcKeypair(name);
    assert(pair.public_key.size() == sizes.public_key);
    auto encap = provider.PqcEncapsulate(name, pair.public_key);
    assert(encap.ciphertext.size() == sizes.ciphertext);
    auto secret = provider.PqcDecapsulate(name, pair.secret_key.AsSpan(), encap.ciphertext);
    assert(Bytes(secret) == Bytes(encap.shared_secret));
  }
}

void TestSeededPqcKeygen(hv::crypto::AlgorithmProvider& provider) {
  const std::vector<uint8_t> seed(provider.DescribePqcKem(hv::crypto::alg::kMlKem768).seed, 0x5a);
  std::vector<uint8_t> other_seed = seed;
  other_seed.back() ^= 0x01;

  auto first = provider.GeneratePqcKeypair(hv::crypto::alg::kMlKem768, seed);
  auto second = provider.GeneratePqcKeypair(hv::crypto::alg::kMlKem768, seed);
  auto third = provider.GeneratePqcKeypair(hv::crypto::alg::kMlKem768, other_seed);
  assert(first.public_key == second.public_key);
  assert(Bytes(first.secret_key) == Bytes(second.secret_key));
  assert(first.public_key != third.public_key);

  // Kyber names resolve to the same ML-KEM parameter set.
  auto alias = provider.GeneratePqcKeypair("Kyber768", seed);
  assert(alias.public_key == first.public_key);

  // Seeded generation must not disturb unseeded draws afterwards.
  auto random_a = provider.GeneratePqcKeypair(hv::crypto::alg::kMlKem768);
  auto random_b = provider.GeneratePqcKeypair(hv::crypto::alg::kMlKem768);
  assert(random_a.public_key != random_b.public_key);
}

void TestUnknownAlgorithms(hv::crypto::AlgorithmProvider& provider) {
  assert(!provider.Supports(hv::crypto::AlgorithmKind::kPqcKem, "FrodoKEM-640-AES"));
  assert(!provider.Supports(hv::crypto::AlgorithmKind::kAead, "AES256CBC"));
  assert(provider.Supports(hv::crypto::AlgorithmKind::kPbkdf, hv::crypto::alg::kArgon2id));

  bool unavailable = false;
  try {
    (void)provider.GenerateClassicalKeypair("P-256");
  } catch (const hv::AlgorithmUnavailableError& e) {
    unavailable = e.algorithm == "P-256";
  }
  assert(unavailable && "unknown classical KEM must not be substituted");

  unavailable = false;
  try {
    (void)provider.KdfDerive("HKDF-MD5", hv::AsBytes("ikm"), {}, {}, 32);
  } catch (const hv::AlgorithmUnavailableError&) {
    unavailable = true;
  }
  assert(unavailable);
}

void TestWrongLengthKeys(hv::crypto::AlgorithmProvider& provider) {
  std::vector<uint8_t> short_key(16, 0x01);
  std::vector<uint8_t> nonce(hv::crypto::kAeadNonceSize, 0x00);
  bool invalid = false;
  try {
    (void)provider.AeadSeal(hv::crypto::alg::kAes256Gcm, short_key, nonce, hv::AsBytes("x"));
  } catch (const hv::InvalidKeyError&) {
    invalid = true;
  }
  assert(invalid);

  invalid = false;
  try {
    (void)provider.PqcEncapsulate(hv::crypto::alg::kMlKem768, short_key);
  } catch (const hv::InvalidKeyError&) {
    invalid = true;
  }
  assert(invalid);

  invalid = false;
  try {
    (void)provider.GenerateClassicalKeypair(hv::crypto::alg::kX448, short_key);
  } catch (const hv::InvalidKeyError&) {
    invalid = true;
  }
  assert(invalid);
}

}  // namespace

int main() {
  hv::crypto::ResetAlgorithmProviderForTesting();
  auto& provider = hv::crypto::GetAlgorithmProvider();
  assert(hv::crypto::GetAlgorithmProviderShared().get() == &provider);

  TestAeadRoundTripAndTamper(provider);
  TestHkdfVector(provider);
  TestPbkdf2Vector(provider);
  TestArgon2Sensitivity(provider);
  TestX25519SeedIsPrivateKey(provider);
  TestKemAgreement(provider);
  TestSeededPqcKeygen(provider);
  TestUnknownAlgorithms(provider);
  TestWrongLengthKeys(provider);

  std::cout << "provider test ok\n";
  return 0;
}
