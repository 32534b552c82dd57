#include "hv/orchestrator/crypto_config.h"

#include <algorithm>
#include <cstdlib>
#include <set>
#include <utility>

#include "hv/error.h"
#include "hv/errors.h"
#include "hv/orchestrator/legacy_handler.h"

namespace hv::orchestrator {

namespace {

core::SuiteDefinition MakeHybridSuite(std::string id, std::string description, std::string_view classical,
                                      std::string_view pqc, std::string_view aead, std::string_view kdf) {
  core::SuiteDefinition suite;
  suite.id = std::move(id);
  suite.description = std::move(description);
  suite.format_id = core::kHybridFormatId;
  suite.classical_kem = std::string(classical);
  suite.pqc_kem = std::string(pqc);
  suite.aead = std::string(aead);
  suite.hybrid_kdf = std::string(kdf);
  suite.hybrid_kdf_label = "hv-hybrid-key/v1:" + suite.id;
  suite.passphrase_kdf = std::string(kdf);
  return suite;
}

std::vector<std::string> SplitList(const std::string& value) {
  std::vector<std::string> items;
  std::string::size_type start = 0;
  while (start <= value.size()) {
    auto end = value.find(':', start);
    auto segment = value.substr(start, end == std::string::npos ? std::string::npos : end - start);
    if (!segment.empty() && std::find(items.begin(), items.end(), segment) == items.end()) {
      items.push_back(std::move(segment));
    }
    if (end == std::string::npos)
      break;
    start = end + 1;
  }
  return items;
}

[[noreturn]] void ThrowConfigError(int code, std::string message) {
  throw Error(ErrorDomain::Config, code, std::move(message));
}

}  // namespace

CryptoConfig CryptoConfig::Defaults() {
  CryptoConfig config;
  config.suites.push_back(MakeHybridSuite(kSuiteX25519MlKem768, "X25519 + ML-KEM-768, AES-256-GCM",
                                          crypto::alg::kX25519, crypto::alg::kMlKem768,
                                          crypto::alg::kAes256Gcm, crypto::alg::kHkdfSha3_512));
  config.suites.push_back(MakeHybridSuite(kSuiteX448MlKem1024, "X448 + ML-KEM-1024, AES-256-GCM",
                                          crypto::alg::kX448, crypto::alg::kMlKem1024,
                                          crypto::alg::kAes256Gcm, crypto::alg::kHkdfSha3_512));
  auto chacha = MakeHybridSuite(kSuiteX25519MlKem512ChaCha, "X25519 + ML-KEM-512, ChaCha20-Poly1305",
                                crypto::alg::kX25519, crypto::alg::kMlKem512,
                                crypto::alg::kChaCha20Poly1305, crypto::alg::kHkdfSha256);
  chacha.pbkdf.algorithm = std::string(crypto::alg::kPbkdf2Sha256);
  config.suites.push_back(std::move(chacha));

  config.active_suite_id = kSuiteX25519MlKem768;
  for (const auto& suite : config.suites) {
    config.decryption_attempt_order.push_back(suite.id);
  }
  config.decryption_attempt_order.emplace_back(kLegacySuiteId);
  return config;
}

const core::SuiteDefinition* CryptoConfig::FindSuite(std::string_view id) const noexcept {
  for (const auto& suite : suites) {
    if (suite.id == id) {
      return &suite;
    }
  }
  return nullptr;
}

void ApplyEnvironmentOverrides(CryptoConfig& config) {
  if (const char* env = std::getenv("HV_ACTIVE_SUITE"); env && *env) {
    config.active_suite_id = env;
  }
  if (const char* env = std::getenv("HV_DECRYPTION_ORDER"); env && *env) {
    config.decryption_attempt_order = SplitList(env);
  }
}

void ValidateCryptoConfig(const CryptoConfig& config) {
  if (config.active_suite_id.empty()) {
    ThrowConfigError(errors::config::kActiveSuiteMissing, std::string(errors::msg::kActiveSuiteMissing));
  }
  std::set<std::string> ids;
  for (const auto& suite : config.suites) {
    if (suite.id.empty() || !ids.insert(suite.id).second) {
      ThrowConfigError(errors::config::kDuplicateSuite, "Duplicate or empty suite id: " + suite.id);
    }
  }
  if (ids.count(config.active_suite_id) == 0) {
    ThrowConfigError(errors::config::kUnknownSuite, "Active suite is not defined: " + config.active_suite_id);
  }
  for (const auto& id : config.decryption_attempt_order) {
    const bool is_legacy = config.legacy_fallback_enabled && id == kLegacySuiteId;
    if (!is_legacy && ids.count(id) == 0) {
      ThrowConfigError(errors::config::kUnknownSuite, "Decryption order names unknown suite: " + id);
    }
  }
}

}  // namespace hv::orchestrator
