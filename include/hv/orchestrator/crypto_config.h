#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "hv/core/suite.h"

namespace hv::orchestrator {

inline constexpr const char* kSuiteX25519MlKem768 = "HYBRID_X25519_MLKEM768_AES256GCM";
inline constexpr const char* kSuiteX448MlKem1024 = "HYBRID_X448_MLKEM1024_AES256GCM";
inline constexpr const char* kSuiteX25519MlKem512ChaCha = "HYBRID_X25519_MLKEM512_CHACHA20";

struct CryptoConfig {
  std::string active_suite_id;
  std::vector<core::SuiteDefinition> suites;
  std::vector<std::string> decryption_attempt_order;
  bool legacy_fallback_enabled{true};

  static CryptoConfig Defaults();

  const core::SuiteDefinition* FindSuite(std::string_view id) const noexcept;
};

// HV_ACTIVE_SUITE replaces the active suite; HV_DECRYPTION_ORDER replaces the
// attempt order with a colon-separated list.
void ApplyEnvironmentOverrides(CryptoConfig& config);

// Throws hv::Error in the Config domain.
void ValidateCryptoConfig(const CryptoConfig& config);

}  // namespace hv::orchestrator
