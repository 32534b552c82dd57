#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "hv/crypto/provider.h"
#include "hv/orchestrator/crypto_config.h"
#include "hv/orchestrator/crypto_handler.h"
#include "hv/orchestrator/legacy_handler.h"

namespace hv::orchestrator {

// Maps suite ids to handlers. Factories run at most once, under the registry
// lock, and their result replaces the factory.
class HandlerRegistry {
 public:
  using HandlerPtr = std::shared_ptr<CryptoHandler>;
  using Factory = std::function<HandlerPtr()>;

  HandlerRegistry() = default;
  HandlerRegistry(const HandlerRegistry&) = delete;
  HandlerRegistry& operator=(const HandlerRegistry&) = delete;

  void Register(const std::string& suite_id, HandlerPtr handler);
  void Register(const std::string& suite_id, Factory factory);

  // Throws HandlerNotFoundError for unknown ids. Exceptions from a factory
  // propagate and leave the entry untouched.
  HandlerPtr GetHandler(const std::string& suite_id);

  // Peeks at the bundle header only. nullptr when the header is unreadable or
  // names a suite that is not registered.
  HandlerPtr SelectHandlerForBytes(std::span<const uint8_t> raw);

  std::vector<std::string> RegisteredSuites() const;
  bool Contains(const std::string& suite_id) const;

  void ResetForTesting();

 private:
  struct Entry {
    std::string suite_id;
    HandlerPtr instance;
    Factory factory;
  };

  void Store(Entry entry);
  Entry* FindLocked(const std::string& suite_id);
  const Entry* FindLocked(const std::string& suite_id) const;

  mutable std::mutex mutex_;
  std::vector<Entry> entries_;
};

// One lazily built hybrid handler per configured suite, plus the legacy
// handler when fallback is enabled. Throws AlgorithmUnavailableError for a
// suite the provider cannot serve.
void RegisterSuiteCatalog(HandlerRegistry& registry,
                          const CryptoConfig& config,
                          std::shared_ptr<crypto::AlgorithmProvider> provider,
                          ExternalDecryptor external = {});

}  // namespace hv::orchestrator
