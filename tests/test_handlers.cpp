#include "hv/orchestrator/hybrid_handler.h"
#include "hv/orchestrator/legacy_handler.h"
#include "hv/common.h"
#include "hv/core/bundle.h"
#include "hv/core/key_manager.h"
#include "hv/crypto/random.h"
#include "hv/error.h"

#include <cassert>
#include <cstdint>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

using hv::orchestrator::DecryptAttempt;
using hv::orchestrator::FailureReason;
using hv::orchestrator::KeySource;

hv::core::SuiteDefinition LightSuite(const std::string& id) {
  hv::core::SuiteDefinition suite;
  suite.id = id;
  suite.format_id = hv::core::kHybridFormatId;
  suite.classical_kem = std::string(hv::crypto::alg::kX25519);
  suite.pqc_kem = std::string(hv::crypto::alg::kMlKem768);
  suite.aead = std::string(hv::crypto::alg::kAes256Gcm);
  suite.hybrid_kdf = std::string(hv::crypto::alg::kHkdfSha3_512);
  suite.hybrid_kdf_label = "hv-hybrid-key/v1:" + id;
  suite.passphrase_kdf = std::string(hv::crypto::alg::kHkdfSha3_512);
  suite.pbkdf.time_cost = 1;
  suite.pbkdf.memory_cost_kib = 1024;
  suite.pbkdf.parallelism = 1;
  return suite;
}

std::string AsText(const std::vector<uint8_t>& bytes) {
  return std::string(bytes.begin(), bytes.end());
}

// Produces a bundle in the classical-only format the legacy handler reads.
std::vector<uint8_t> MakeLegacyBundle(hv::crypto::AlgorithmProvider& provider,
                                      const std::vector<uint8_t>& recipient_public,
                                      const std::string& plaintext,
                                      std::optional<std::vector<uint8_t>> pbkdf_salt = std::nullopt) {
  auto encap = provider.ClassicalEncapsulate(hv::crypto::alg::kX25519, recipient_public);
  hv::core::Bundle bundle;
  bundle.format_id = hv::core::kLegacyFormatId;
  bundle.suite_id = hv::orchestrator::kLegacySuiteId;
  bundle.hybrid_salt = hv::crypto::RandomVector(16);
  auto key = provider.KdfDerive(hv::crypto::alg::kHkdfSha256, encap.shared_secret.AsSpan(), *bundle.hybrid_salt,
                                hv::AsBytes(hv::orchestrator::kLegacyKdfLabel), 32);
  bundle.nonce = hv::crypto::RandomVector(hv::crypto::kAeadNonceSize);
  auto sealed = provider.AeadSeal(hv::crypto::alg::kAes256Gcm, key.AsSpan(), bundle.nonce, hv::AsBytes(plaintext));
  bundle.classical_ciphertext = encap.ciphertext;
  bundle.ciphertext = sealed.ciphertext;
  bundle.tag = sealed.tag;
  bundle.pbkdf_salt = std::move(pbkdf_salt);
  return hv::core::SerializeBundle(bundle);
}

void ExpectFailure(hv::orchestrator::CryptoHandler& handler, const std::vector<uint8_t>& raw,
                   const KeySource& source, FailureReason reason) {
  auto attempt = handler.Decrypt(raw, source);
  assert(!attempt.succeeded());
  assert(attempt.reason() == reason);
  assert(attempt.plaintext().empty());
}

// Flips each bit of one field in turn; no variant may decrypt.
void ExpectEveryBitFlipRejected(hv::orchestrator::CryptoHandler& handler, const hv::core::Bundle& original,
                                const KeySource& source,
                                const std::function<std::vector<uint8_t>&(hv::core::Bundle&)>& field) {
  auto copy = original;
  auto& bytes = field(copy);
  assert(!bytes.empty());
  for (size_t i = 0; i < bytes.size(); ++i) {
    for (int bit = 0; bit < 8; ++bit) {
      bytes[i] ^= static_cast<uint8_t>(1u << bit);
      auto result = handler.Decrypt(hv::core::SerializeBundle(copy), source);
      assert(!result.succeeded() && "tampered bundle must not decrypt");
      assert(result.reason() == FailureReason::kAuthentication);
      bytes[i] ^= static_cast<uint8_t>(1u << bit);
    }
  }
}

void TestHybridRoundTripAndTamper(std::shared_ptr<hv::crypto::AlgorithmProvider> provider) {
  hv::orchestrator::HybridCryptoHandler handler(LightSuite("HYBRID-A"), provider);
  hv::core::KeyManager manager(provider);
  auto keys = manager.GenerateRandomKeys(handler.Suite());
  const auto source = KeySource::FromKeys(keys);

  const std::string message = "assets:cash 10 USD\n";
  auto bundle = handler.Encrypt(hv::AsBytes(message), keys);
  assert(bundle.format_id == hv::core::kHybridFormatId);
  assert(bundle.suite_id == "HYBRID-A");
  assert(bundle.nonce.size() == hv::crypto::kAeadNonceSize);
  assert(bundle.tag.size() == hv::crypto::kAeadTagSize);
  assert(bundle.hybrid_salt.has_value() && bundle.hybrid_salt->size() == hv::orchestrator::kHybridSaltSize);
  assert(!bundle.pbkdf_salt.has_value());

  const auto raw = hv::core::SerializeBundle(bundle);
  assert(handler.CanHandle(raw));
  auto attempt = handler.Decrypt(raw, source);
  assert(attempt.succeeded());
  assert(AsText(attempt.plaintext()) == message);

  auto second = hv::core::SerializeBundle(handler.Encrypt(hv::AsBytes(message), keys));
  assert(second != raw && "every encryption uses fresh randomness");

  using FieldOf = std::function<std::vector<uint8_t>&(hv::core::Bundle&)>;
  const std::vector<FieldOf> fields = {
      [](hv::core::Bundle& b) -> std::vector<uint8_t>& { return b.ciphertext; },
      [](hv::core::Bundle& b) -> std::vector<uint8_t>& { return b.tag; },
      [](hv::core::Bundle& b) -> std::vector<uint8_t>& { return b.nonce; },
      [](hv::core::Bundle& b) -> std::vector<uint8_t>& { return b.classical_ciphertext; },
      [](hv::core::Bundle& b) -> std::vector<uint8_t>& { return b.pqc_ciphertext; },
      [](hv::core::Bundle& b) -> std::vector<uint8_t>& { return *b.hybrid_salt; },
  };
  const auto parsed = hv::core::ParseBundle(raw);
  for (const auto& field : fields) {
    ExpectEveryBitFlipRejected(handler, parsed, source, field);
  }

  auto other_keys = manager.GenerateRandomKeys(handler.Suite());
  ExpectFailure(handler, raw, KeySource::FromKeys(other_keys), FailureReason::kAuthentication);

  auto no_salt = hv::core::ParseBundle(raw);
  no_salt.hybrid_salt.reset();
  ExpectFailure(handler, hv::core::SerializeBundle(no_salt), source, FailureReason::kFormatMismatch);

  hv::core::KeyMaterial public_only;
  public_only.classical.public_key = keys.classical.public_key;
  public_only.pqc.public_key = keys.pqc.public_key;
  ExpectFailure(handler, raw, KeySource::FromKeys(public_only), FailureReason::kInvalidKey);

  const std::string garbage = "not a bundle at all";
  ExpectFailure(handler, std::vector<uint8_t>(garbage.begin(), garbage.end()), source,
                FailureReason::kFormatMismatch);
  assert(!handler.CanHandle(hv::AsBytes(garbage)));

  bool missing_public = false;
  try {
    (void)handler.Encrypt(hv::AsBytes(message), hv::core::KeyMaterial{});
  } catch (const hv::InvalidKeyError&) {
    missing_public = true;
  }
  assert(missing_public);
}

void TestHybridSuiteMismatch(std::shared_ptr<hv::crypto::AlgorithmProvider> provider) {
  hv::orchestrator::HybridCryptoHandler a(LightSuite("HYBRID-A"), provider);
  hv::orchestrator::HybridCryptoHandler b(LightSuite("HYBRID-B"), provider);
  hv::core::KeyManager manager(provider);
  auto keys = manager.GenerateRandomKeys(a.Suite());
  const auto raw = hv::core::SerializeBundle(a.Encrypt(hv::AsBytes("x"), keys));
  assert(!b.CanHandle(raw));
  ExpectFailure(b, raw, KeySource::FromKeys(keys), FailureReason::kFormatMismatch);
}

void TestHybridPassphrase(std::shared_ptr<hv::crypto::AlgorithmProvider> provider) {
  hv::orchestrator::HybridCryptoHandler handler(LightSuite("HYBRID-A"), provider);
  hv::core::KeyManager manager(provider);
  auto keys = manager.DeriveForEncryption("ledger secret", handler.Suite());
  const auto raw = hv::core::SerializeBundle(handler.Encrypt(hv::AsBytes("balance 42"), keys));

  auto attempt = handler.Decrypt(raw, KeySource::FromPassphrase("ledger secret"));
  assert(attempt.succeeded());
  assert(AsText(attempt.plaintext()) == "balance 42");

  ExpectFailure(handler, raw, KeySource::FromPassphrase("ledger secreT"), FailureReason::kAuthentication);

  auto without_pbkdf_salt = hv::core::ParseBundle(raw);
  without_pbkdf_salt.pbkdf_salt.reset();
  ExpectFailure(handler, hv::core::SerializeBundle(without_pbkdf_salt),
                KeySource::FromPassphrase("ledger secret"), FailureReason::kFormatMismatch);

  // With fixed keys the salt is not needed for derivation but is still authenticated.
  const auto key_source = KeySource::FromKeys(keys);
  assert(handler.Decrypt(raw, key_source).succeeded());
  ExpectEveryBitFlipRejected(handler, hv::core::ParseBundle(raw), key_source,
                             [](hv::core::Bundle& b) -> std::vector<uint8_t>& { return *b.pbkdf_salt; });
  ExpectFailure(handler, hv::core::SerializeBundle(without_pbkdf_salt), key_source,
                FailureReason::kAuthentication);
}

void TestUnavailableSuite(std::shared_ptr<hv::crypto::AlgorithmProvider> provider) {
  auto suite = LightSuite("HYBRID-X");
  suite.pqc_kem = "NTRU-HPS-2048-509";
  bool unavailable = false;
  try {
    hv::orchestrator::HybridCryptoHandler handler(suite, provider);
  } catch (const hv::AlgorithmUnavailableError& e) {
    unavailable = e.algorithm == "NTRU-HPS-2048-509";
  }
  assert(unavailable);
}

void TestLegacy(std::shared_ptr<hv::crypto::AlgorithmProvider> provider) {
  hv::orchestrator::LegacyClassicalHandler handler(provider);
  assert(handler.SuiteId() == hv::orchestrator::kLegacySuiteId);

  auto recipient = provider->GenerateClassicalKeypair(hv::crypto::alg::kX25519);
  hv::core::KeyMaterial keys;
  keys.classical.public_key = recipient.public_key;
  keys.classical.secret_key = recipient.secret_key.Clone();

  const auto raw = MakeLegacyBundle(*provider, recipient.public_key, "legacy ledger");
  assert(handler.CanHandle(raw));
  auto attempt = handler.Decrypt(raw, KeySource::FromKeys(keys));
  assert(attempt.succeeded());
  assert(AsText(attempt.plaintext()) == "legacy ledger");

  auto tampered = hv::core::ParseBundle(raw);
  tampered.tag[3] ^= 0x10;
  ExpectFailure(handler, hv::core::SerializeBundle(tampered), KeySource::FromKeys(keys),
                FailureReason::kAuthentication);

  bool refused = false;
  try {
    (void)handler.Encrypt(hv::AsBytes("new data"), keys);
  } catch (const hv::UnsupportedOperationError&) {
    refused = true;
  }
  assert(refused && "legacy handler must never encrypt");

  // Passphrase mode derives the classical key from the embedded salt.
  const std::vector<uint8_t> salt(16, 0x44);
  hv::core::KeyManager manager(provider);
  auto derived = manager.DeriveClassicalPassphraseKeys("old pass", salt, hv::orchestrator::LegacySuiteDefinition());
  const auto pass_raw = MakeLegacyBundle(*provider, derived.public_key, "from passphrase", salt);
  auto pass_attempt = handler.Decrypt(pass_raw, KeySource::FromPassphrase("old pass"));
  assert(pass_attempt.succeeded());
  assert(AsText(pass_attempt.plaintext()) == "from passphrase");

  hv::orchestrator::HybridCryptoHandler hybrid(LightSuite("HYBRID-A"), provider);
  assert(!hybrid.CanHandle(raw));
  ExpectFailure(hybrid, raw, KeySource::FromKeys(keys), FailureReason::kFormatMismatch);
}

void TestOpenPgpDelegation(std::shared_ptr<hv::crypto::AlgorithmProvider> provider) {
  const std::string armored = "-----BEGIN PGP MESSAGE-----\n\nhQEMA...\n-----END PGP MESSAGE-----\n";
  const std::vector<uint8_t> raw(armored.begin(), armored.end());
  const std::vector<uint8_t> binary = {0x85, 0x02, 0x0c, 0x03};
  assert(hv::orchestrator::LooksLikeOpenPgp(raw));
  assert(hv::orchestrator::LooksLikeOpenPgp(binary));
  assert(hv::orchestrator::LooksLikeOpenPgp(std::vector<uint8_t>{0x99, 0x01}));
  assert(!hv::orchestrator::LooksLikeOpenPgp(hv::AsBytes("HVBN")));

  hv::orchestrator::LegacyClassicalHandler without_bridge(provider);
  assert(without_bridge.CanHandle(raw));
  ExpectFailure(without_bridge, raw, KeySource::FromPassphrase("pw"), FailureReason::kUnsupported);

  int calls = 0;
  hv::orchestrator::LegacyClassicalHandler with_bridge(
      provider, [&calls](std::span<const uint8_t> data, const KeySource& source) {
        ++calls;
        if (source.passphrase() != "gpg pass") {
          throw hv::AuthenticationError("bad passphrase");
        }
        assert(data.size() > 0);
        const std::string out = "decrypted by gpg";
        return std::vector<uint8_t>(out.begin(), out.end());
      });
  auto ok = with_bridge.Decrypt(raw, KeySource::FromPassphrase("gpg pass"));
  assert(ok.succeeded());
  assert(AsText(ok.plaintext()) == "decrypted by gpg");
  ExpectFailure(with_bridge, binary, KeySource::FromPassphrase("nope"), FailureReason::kAuthentication);
  assert(calls == 2);
}

}  // namespace

int main() {
  auto provider = hv::crypto::GetAlgorithmProviderShared();
  TestHybridRoundTripAndTamper(provider);
  TestHybridSuiteMismatch(provider);
  TestHybridPassphrase(provider);
  TestUnavailableSuite(provider);
  TestLegacy(provider);
  TestOpenPgpDelegation(provider);
  std::cout << "handlers test ok\n";
  return 0;
}
