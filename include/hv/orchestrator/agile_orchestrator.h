#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "hv/core/key_material.h"
#include "hv/crypto/provider.h"
#include "hv/orchestrator/crypto_config.h"
#include "hv/orchestrator/crypto_handler.h"
#include "hv/orchestrator/handler_registry.h"

namespace hv::orchestrator {

enum class DecryptState { kParsing, kTrying, kSuccess, kExhausted };

const char* DecryptStateToString(DecryptState state) noexcept;

struct StateTransition {
  DecryptState state{DecryptState::kParsing};
  size_t attempt_index{0};  // meaningful for kTrying
  std::string suite_id;     // empty for kParsing and kExhausted
};

using StateObserver = std::function<void(const StateTransition&)>;

// Encrypts with the active suite and decrypts by trying suites in order until
// one succeeds.
class AgileOrchestrator {
 public:
  AgileOrchestrator(CryptoConfig config,
                    std::shared_ptr<HandlerRegistry> registry,
                    std::shared_ptr<crypto::AlgorithmProvider> provider);

  // Throws hv::Error (Config) without an active suite and HandlerNotFoundError
  // when the active suite has no handler.
  std::vector<uint8_t> EncryptActive(std::span<const uint8_t> plaintext, const core::KeyMaterial& keys);

  // Derives keys under a fresh salt, then encrypts with the active suite.
  std::vector<uint8_t> EncryptActiveWithPassphrase(std::span<const uint8_t> plaintext,
                                                   std::string_view passphrase);

  // Throws AggregateDecryptionError listing the attempted suites when nothing
  // succeeds.
  std::vector<uint8_t> DecryptWithAgility(std::span<const uint8_t> raw, const KeySource& key_source);

  void SetStateObserver(StateObserver observer) { observer_ = std::move(observer); }

  const CryptoConfig& config() const noexcept { return config_; }

 private:
  void Notify(DecryptState state, size_t attempt_index, const std::string& suite_id) const;
  std::vector<std::string> CandidateOrder(std::span<const uint8_t> raw) const;

  CryptoConfig config_;
  std::shared_ptr<HandlerRegistry> registry_;
  std::shared_ptr<crypto::AlgorithmProvider> provider_;
  StateObserver observer_;
};

}  // namespace hv::orchestrator
