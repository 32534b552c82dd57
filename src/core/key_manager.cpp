#include "hv/core/key_manager.h"

#include <algorithm>
#include <array>
#include <cerrno>
#include <fstream>
#include <limits>
#include <string>
#include <utility>

#include "hv/common.h"
#include "hv/crypto/random.h"
#include "hv/error.h"
#include "hv/errors.h"
#include "hv/orchestrator/event_bus.h"
#include "hv/security/zeroizer.h"
#include "hv/tlv/parser.h"

namespace hv::core {

namespace {

constexpr std::string_view kClassicalSeedInfo{"classical-kem-seed"};
constexpr std::string_view kPqcSeedInfo{"pqc-kem-seed"};

constexpr std::array<uint8_t, 4> kExportMagic{'H', 'V', 'K', 'X'};
constexpr uint16_t kExportVersion = 1;
constexpr size_t kExportPrefixSize = kExportMagic.size() + sizeof(uint16_t);
constexpr size_t kExportSaltSize = 16;
constexpr size_t kExportKeySize = 32;
constexpr uint32_t kMaxExportMemoryKib = 1024u * 1024u;
constexpr uint32_t kMaxExportTimeCost = 16;
constexpr uint32_t kMaxExportParallelism = 16;

enum class ExportField : uint16_t {
  kFormatSpec = 0x0001,
  kSuiteId = 0x0002,
  kSalt = 0x0010,
  kArgonParams = 0x0011,
  kNonce = 0x0020,
  kCiphertext = 0x0021,
  kTag = 0x0022,
};

constexpr std::array<ExportField, 7> kExportLayout{
    ExportField::kFormatSpec, ExportField::kSuiteId, ExportField::kSalt,
    ExportField::kArgonParams, ExportField::kNonce, ExportField::kCiphertext,
    ExportField::kTag};

enum class ExportedKey : uint16_t {
  kClassicalPrivate = 0x0001,
  kClassicalPublic = 0x0002,
  kPqcPrivate = 0x0003,
  kPqcPublic = 0x0004,
};

[[noreturn]] void ThrowMalformedExport() {
  throw FormatMismatchError(std::string(errors::msg::kExportContainerMalformed),
                            errors::validation::kExportMalformed);
}

void AppendExportRecord(std::vector<uint8_t>& out, ExportField field, std::span<const uint8_t> value) {
  tlv::AppendRecord(out, static_cast<uint16_t>(field), value);
}

security::SecureBuffer<uint8_t> ReadKeyFile(const std::filesystem::path& path, size_t expected_size) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw Error{ErrorDomain::IO, errors::io::kKeyFileOpenFailed,
                "Failed to open key file: " + PathToUtf8String(path), errno};
  }

  in.seekg(0, std::ios::end);
  auto size = in.tellg();
  if (size < 0) {
    throw Error{ErrorDomain::IO, errors::io::kKeyFileReadFailed,
                "Failed to determine key file size: " + PathToUtf8String(path), errno};
  }
  if (static_cast<uint64_t>(size) > kMaxKeyFileSize) {
    throw InvalidKeyError(std::string(errors::msg::kKeyFileTooLarge));
  }
  if (static_cast<size_t>(size) != expected_size) {
    throw InvalidKeyError("Key file has unexpected length: " + PathToUtf8String(path));
  }
  in.seekg(0, std::ios::beg);

  security::SecureBuffer<uint8_t> buffer(expected_size);
  if (expected_size > 0) {
    in.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(expected_size));
    if (in.gcount() != static_cast<std::streamsize>(expected_size)) {
      throw Error{ErrorDomain::IO, errors::io::kKeyFileReadFailed,
                  "Failed to read key file contents", errno};
    }
  }
  return buffer;
}

std::vector<uint8_t> ToVector(std::span<const uint8_t> value) {
  return std::vector<uint8_t>(value.begin(), value.end());
}

// Import stretches with these before the tag is checked.
bool ExportCostWithinBounds(const crypto::PbkdfParams& params) noexcept {
  return params.time_cost >= 1 && params.time_cost <= kMaxExportTimeCost && params.parallelism >= 1 &&
         params.parallelism <= kMaxExportParallelism && params.memory_cost_kib <= kMaxExportMemoryKib;
}

crypto::PbkdfParams ExportPbkdf(const crypto::PbkdfParams& configured) {
  crypto::PbkdfParams params = configured;
  params.algorithm = std::string(crypto::alg::kArgon2id);
  params.output_length = kExportKeySize;
  return params;
}

}  // namespace

void KeyManager::SetExportPbkdfParams(const crypto::PbkdfParams& params) {
  if (!ExportCostWithinBounds(params)) {
    throw Error(ErrorDomain::Validation, errors::validation::kExportMalformed,
                std::string(errors::msg::kUnsupportedArgon2Parameters));
  }
  export_pbkdf_ = params;
}

KeyManager::KeyManager(std::shared_ptr<crypto::AlgorithmProvider> provider)
    : provider_(std::move(provider)) {
  if (!provider_) {
    throw Error(ErrorDomain::Internal, 0, "KeyManager requires an algorithm provider");
  }
}

KeyMaterial KeyManager::DerivePassphraseKeys(std::string_view passphrase,
                                             std::span<const uint8_t> salt,
                                             const SuiteDefinition& suite) const {
  const auto classical_sizes = provider_->DescribeClassicalKem(suite.classical_kem);
  const auto pqc_sizes = provider_->DescribePqcKem(suite.pqc_kem);

  auto stretched = provider_->PbkdfStretch(suite.pbkdf, AsBytes(passphrase), salt);
  auto classical_seed = provider_->KdfDerive(suite.passphrase_kdf, stretched.AsSpan(), {},
                                             AsBytes(kClassicalSeedInfo), classical_sizes.seed);
  auto pqc_seed = provider_->KdfDerive(suite.passphrase_kdf, stretched.AsSpan(), {},
                                       AsBytes(kPqcSeedInfo), pqc_sizes.seed);

  KeyMaterial keys;
  keys.suite_id = suite.id;
  keys.classical = provider_->GenerateClassicalKeypair(suite.classical_kem, classical_seed.AsSpan());
  keys.pqc = provider_->GeneratePqcKeypair(suite.pqc_kem, pqc_seed.AsSpan());
  keys.pbkdf_salt = ToVector(salt);
  return keys;
}

crypto::KemKeyPair KeyManager::DeriveClassicalPassphraseKeys(std::string_view passphrase,
                                                             std::span<const uint8_t> salt,
                                                             const SuiteDefinition& suite) const {
  const auto classical_sizes = provider_->DescribeClassicalKem(suite.classical_kem);
  auto stretched = provider_->PbkdfStretch(suite.pbkdf, AsBytes(passphrase), salt);
  auto classical_seed = provider_->KdfDerive(suite.passphrase_kdf, stretched.AsSpan(), {},
                                             AsBytes(kClassicalSeedInfo), classical_sizes.seed);
  return provider_->GenerateClassicalKeypair(suite.classical_kem, classical_seed.AsSpan());
}

KeyMaterial KeyManager::DeriveForEncryption(std::string_view passphrase,
                                            const SuiteDefinition& suite) const {
  const auto salt = crypto::RandomVector(kPassphraseSaltSize);
  return DerivePassphraseKeys(passphrase, salt, suite);
}

KeyMaterial KeyManager::GenerateRandomKeys(const SuiteDefinition& suite) const {
  KeyMaterial keys;
  keys.suite_id = suite.id;
  keys.classical = provider_->GenerateClassicalKeypair(suite.classical_kem);
  keys.pqc = provider_->GeneratePqcKeypair(suite.pqc_kem);
  return keys;
}

KeyMaterial KeyManager::LoadExternalKeys(const ExternalKeyPaths& paths,
                                         const SuiteDefinition& suite) const {
  if (paths.classical_private.empty() || paths.pqc_private.empty()) {
    throw InvalidKeyError(std::string(errors::msg::kPrivateKeyMissing));
  }
  if (paths.pqc_public.empty()) {
    throw InvalidKeyError(std::string(errors::msg::kPublicKeyMissing));
  }
  const auto classical_sizes = provider_->DescribeClassicalKem(suite.classical_kem);
  const auto pqc_sizes = provider_->DescribePqcKem(suite.pqc_kem);

  KeyMaterial keys;
  keys.suite_id = suite.id;
  keys.classical.secret_key = ReadKeyFile(paths.classical_private, classical_sizes.secret_key);
  if (paths.classical_public.empty()) {
    keys.classical.public_key =
        provider_->ClassicalPublicFromPrivate(suite.classical_kem, keys.classical.secret_key.AsSpan());
  } else {
    auto public_key = ReadKeyFile(paths.classical_public, classical_sizes.public_key);
    keys.classical.public_key = ToVector(public_key.AsSpan());
  }
  keys.pqc.secret_key = ReadKeyFile(paths.pqc_private, pqc_sizes.secret_key);
  auto pqc_public = ReadKeyFile(paths.pqc_public, pqc_sizes.public_key);
  keys.pqc.public_key = ToVector(pqc_public.AsSpan());
  return keys;
}

std::vector<uint8_t> KeyManager::ExportPrivateKeys(const KeyMaterial& keys,
                                                   std::string_view export_passphrase,
                                                   const ExportConfirmation& confirmation) const {
  if (!confirmation.confirmed()) {
    throw ExportConfirmationError(std::string(errors::msg::kExportNotConfirmed));
  }
  if (export_passphrase.empty()) {
    throw InvalidKeyError(std::string(errors::msg::kExportPassphraseEmpty));
  }
  if (keys.classical.secret_key.empty() || keys.pqc.secret_key.empty()) {
    throw InvalidKeyError(std::string(errors::msg::kPrivateKeyMissing));
  }

  const auto params = ExportPbkdf(export_pbkdf_);
  const auto salt = crypto::RandomVector(kExportSaltSize);
  auto wrap_key = provider_->PbkdfStretch(params, AsBytes(export_passphrase), salt);

  std::vector<uint8_t> container;
  container.insert(container.end(), kExportMagic.begin(), kExportMagic.end());
  AppendLittleEndian<uint16_t>(container, kExportVersion);
  AppendExportRecord(container, ExportField::kFormatSpec, AsBytes(kExportFormatSpec));
  AppendExportRecord(container, ExportField::kSuiteId, AsBytes(keys.suite_id));
  AppendExportRecord(container, ExportField::kSalt, salt);
  std::vector<uint8_t> encoded_params;
  AppendLittleEndian<uint32_t>(encoded_params, params.time_cost);
  AppendLittleEndian<uint32_t>(encoded_params, params.memory_cost_kib);
  AppendLittleEndian<uint32_t>(encoded_params, params.parallelism);
  AppendExportRecord(container, ExportField::kArgonParams, encoded_params);
  const std::vector<uint8_t> aad = container;

  // Reserved up front so the plaintext is never reallocated and left behind.
  std::vector<uint8_t> plaintext;
  plaintext.reserve(4 * tlv::kRecordHeaderSize + keys.classical.secret_key.size() +
                    keys.classical.public_key.size() + keys.pqc.secret_key.size() +
                    keys.pqc.public_key.size());
  security::Zeroizer::ScopeWiper<uint8_t> plaintext_wiper(plaintext.data(), plaintext.capacity());
  tlv::AppendRecord(plaintext, static_cast<uint16_t>(ExportedKey::kClassicalPrivate),
                    keys.classical.secret_key.AsSpan());
  tlv::AppendRecord(plaintext, static_cast<uint16_t>(ExportedKey::kClassicalPublic),
                    keys.classical.public_key);
  tlv::AppendRecord(plaintext, static_cast<uint16_t>(ExportedKey::kPqcPrivate),
                    keys.pqc.secret_key.AsSpan());
  tlv::AppendRecord(plaintext, static_cast<uint16_t>(ExportedKey::kPqcPublic), keys.pqc.public_key);

  const auto nonce = crypto::RandomVector(crypto::kAeadNonceSize);
  auto sealed = provider_->AeadSeal(crypto::alg::kAes256Gcm, wrap_key.AsSpan(), nonce, plaintext, aad);
  AppendExportRecord(container, ExportField::kNonce, nonce);
  AppendExportRecord(container, ExportField::kCiphertext, sealed.ciphertext);
  AppendExportRecord(container, ExportField::kTag, sealed.tag);

  orchestrator::Event event;
  event.category = orchestrator::EventCategory::kSecurity;
  event.severity = orchestrator::EventSeverity::kWarning;
  event.event_id = "keys_exported";
  event.message = "Private keys exported in encrypted container";
  event.fields.emplace_back("suite_id", keys.suite_id);
  event.fields.emplace_back("format", std::string(kExportFormatSpec));
  orchestrator::EventBus::Instance().Publish(event);
  return container;
}

KeyMaterial KeyManager::ImportPrivateKeys(std::span<const uint8_t> container,
                                          std::string_view export_passphrase,
                                          const SuiteDefinition& suite) const {
  if (container.size() < kExportPrefixSize ||
      !std::equal(kExportMagic.begin(), kExportMagic.end(), container.begin()) ||
      ReadLittleEndian<uint16_t>(container.subspan(kExportMagic.size())) != kExportVersion) {
    ThrowMalformedExport();
  }
  tlv::Parser parser(container.subspan(kExportPrefixSize), kExportLayout.size());
  if (!parser.valid() || parser.size() != kExportLayout.size()) {
    ThrowMalformedExport();
  }
  std::array<std::span<const uint8_t>, kExportLayout.size()> fields{};
  size_t index = 0;
  for (const auto& record : parser) {
    if (record.type != static_cast<uint16_t>(kExportLayout[index])) {
      ThrowMalformedExport();
    }
    fields[index++] = record.value;
  }

  const auto& spec = fields[0];
  if (std::string_view(reinterpret_cast<const char*>(spec.data()), spec.size()) != kExportFormatSpec) {
    ThrowMalformedExport();
  }
  const auto& suite_field = fields[1];
  if (std::string(suite_field.begin(), suite_field.end()) != suite.id) {
    throw FormatMismatchError(std::string(errors::msg::kSuiteIdMismatch),
                              errors::validation::kSuiteMismatch);
  }
  const auto& salt = fields[2];
  const auto& encoded_params = fields[3];
  if (salt.size() != kExportSaltSize || encoded_params.size() != 3 * sizeof(uint32_t)) {
    ThrowMalformedExport();
  }
  crypto::PbkdfParams params;
  params.time_cost = ReadLittleEndian<uint32_t>(encoded_params.subspan(0, 4));
  params.memory_cost_kib = ReadLittleEndian<uint32_t>(encoded_params.subspan(4, 4));
  params.parallelism = ReadLittleEndian<uint32_t>(encoded_params.subspan(8, 4));
  if (!ExportCostWithinBounds(params)) {
    throw FormatMismatchError(std::string(errors::msg::kUnsupportedArgon2Parameters),
                              errors::validation::kExportMalformed);
  }
  params = ExportPbkdf(params);

  // Everything up to the nonce record is authenticated.
  const auto aad_length = static_cast<size_t>(fields[4].data() - container.data()) - tlv::kRecordHeaderSize;
  const auto aad = container.first(aad_length);

  auto wrap_key = provider_->PbkdfStretch(params, AsBytes(export_passphrase), salt);
  auto plaintext = provider_->AeadOpen(crypto::alg::kAes256Gcm, wrap_key.AsSpan(), fields[4],
                                       fields[5], fields[6], aad);
  security::Zeroizer::ScopeWiper<uint8_t> plaintext_wiper(plaintext.data(), plaintext.size());

  tlv::Parser inner(plaintext, 4);
  if (!inner.valid() || inner.size() != 4) {
    ThrowMalformedExport();
  }
  const auto classical_sizes = provider_->DescribeClassicalKem(suite.classical_kem);
  const auto pqc_sizes = provider_->DescribePqcKem(suite.pqc_kem);
  const std::array<size_t, 4> expected_sizes{classical_sizes.secret_key, classical_sizes.public_key,
                                             pqc_sizes.secret_key, pqc_sizes.public_key};

  KeyMaterial keys;
  keys.suite_id = suite.id;
  uint16_t expected_type = static_cast<uint16_t>(ExportedKey::kClassicalPrivate);
  for (const auto& record : inner) {
    if (record.type != expected_type ||
        record.value.size() != expected_sizes[expected_type - 1]) {
      throw InvalidKeyError("Exported key record has unexpected type or length");
    }
    switch (static_cast<ExportedKey>(record.type)) {
    case ExportedKey::kClassicalPrivate:
      keys.classical.secret_key = security::SecureBuffer<uint8_t>(record.value);
      break;
    case ExportedKey::kClassicalPublic:
      keys.classical.public_key = ToVector(record.value);
      break;
    case ExportedKey::kPqcPrivate:
      keys.pqc.secret_key = security::SecureBuffer<uint8_t>(record.value);
      break;
    case ExportedKey::kPqcPublic:
      keys.pqc.public_key = ToVector(record.value);
      break;
    }
    ++expected_type;
  }
  return keys;
}

}  // namespace hv::core
