#include "hv/orchestrator/handler_registry.h"

#include <algorithm>

#include "hv/core/bundle.h"
#include "hv/error.h"
#include "hv/orchestrator/event_bus.h"
#include "hv/orchestrator/hybrid_handler.h"

namespace hv::orchestrator {

namespace {

void PublishRegistryEvent(EventSeverity severity, const char* event_id, std::string message,
                          const std::string& suite_id) {
  Event event;
  event.category = EventCategory::kLifecycle;
  event.severity = severity;
  event.event_id = event_id;
  event.message = std::move(message);
  event.fields.emplace_back("suite_id", suite_id);
  EventBus::Instance().Publish(event);
}

}  // namespace

void HandlerRegistry::Register(const std::string& suite_id, HandlerPtr handler) {
  if (!handler) {
    throw Error(ErrorDomain::Internal, 0, "Cannot register null handler for suite: " + suite_id);
  }
  Store(Entry{suite_id, std::move(handler), Factory{}});
}

void HandlerRegistry::Register(const std::string& suite_id, Factory factory) {
  if (!factory) {
    throw Error(ErrorDomain::Internal, 0, "Cannot register empty factory for suite: " + suite_id);
  }
  Store(Entry{suite_id, HandlerPtr{}, std::move(factory)});
}

void HandlerRegistry::Store(Entry entry) {
  const std::string suite_id = entry.suite_id;
  bool overwritten = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto* existing = FindLocked(suite_id)) {
      *existing = std::move(entry);
      overwritten = true;
    } else {
      entries_.push_back(std::move(entry));
    }
  }
  if (overwritten) {
    PublishRegistryEvent(EventSeverity::kWarning, "handler_overwritten",
                         "Replacing previously registered handler", suite_id);
  } else {
    PublishRegistryEvent(EventSeverity::kDebug, "handler_registered", "Handler registered", suite_id);
  }
}

HandlerRegistry::Entry* HandlerRegistry::FindLocked(const std::string& suite_id) {
  auto it = std::find_if(entries_.begin(), entries_.end(),
                         [&](const Entry& entry) { return entry.suite_id == suite_id; });
  return it == entries_.end() ? nullptr : &*it;
}

const HandlerRegistry::Entry* HandlerRegistry::FindLocked(const std::string& suite_id) const {
  auto it = std::find_if(entries_.begin(), entries_.end(),
                         [&](const Entry& entry) { return entry.suite_id == suite_id; });
  return it == entries_.end() ? nullptr : &*it;
}

HandlerRegistry::HandlerPtr HandlerRegistry::GetHandler(const std::string& suite_id) {
  HandlerPtr handler;
  bool instantiated = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto* entry = FindLocked(suite_id);
    if (!entry) {
      throw HandlerNotFoundError(suite_id);
    }
    if (!entry->instance) {
      auto created = entry->factory();
      if (!created) {
        throw Error(ErrorDomain::Internal, 0, "Handler factory returned null for suite: " + suite_id);
      }
      entry->instance = std::move(created);
      entry->factory = Factory{};
      instantiated = true;
    }
    handler = entry->instance;
  }
  if (instantiated) {
    PublishRegistryEvent(EventSeverity::kDebug, "handler_instantiated", "Handler instantiated", suite_id);
  }
  return handler;
}

HandlerRegistry::HandlerPtr HandlerRegistry::SelectHandlerForBytes(std::span<const uint8_t> raw) {
  auto header = core::PeekBundleHeader(raw);
  if (!header || !Contains(header->suite_id)) {
    return nullptr;
  }
  return GetHandler(header->suite_id);
}

std::vector<std::string> HandlerRegistry::RegisteredSuites() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(entries_.size());
  for (const auto& entry : entries_) {
    ids.push_back(entry.suite_id);
  }
  return ids;
}

bool HandlerRegistry::Contains(const std::string& suite_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return FindLocked(suite_id) != nullptr;
}

void HandlerRegistry::ResetForTesting() {
  std::lock_guard<std::mutex> lock(mutex_);
  entries_.clear();
}

void RegisterSuiteCatalog(HandlerRegistry& registry,
                          const CryptoConfig& config,
                          std::shared_ptr<crypto::AlgorithmProvider> provider,
                          ExternalDecryptor external) {
  for (const auto& suite : config.suites) {
    RequireSuiteAvailable(*provider, suite);
    registry.Register(suite.id, HandlerRegistry::Factory([suite, provider]() {
                        return std::make_shared<HybridCryptoHandler>(suite, provider);
                      }));
  }
  if (config.legacy_fallback_enabled) {
    registry.Register(kLegacySuiteId, HandlerRegistry::Factory([provider, external]() {
                        return std::make_shared<LegacyClassicalHandler>(provider, external);
                      }));
  }
}

}  // namespace hv::orchestrator
