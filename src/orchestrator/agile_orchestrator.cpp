#include "hv/orchestrator/agile_orchestrator.h"

#include <algorithm>
#include <utility>

#include "hv/core/bundle.h"
#include "hv/core/key_manager.h"
#include "hv/error.h"
#include "hv/errors.h"
#include "hv/orchestrator/event_bus.h"
#include "hv/orchestrator/legacy_handler.h"

namespace hv::orchestrator {

namespace {

void PublishDecryptEvent(EventSeverity severity, const char* event_id, std::string message,
                         std::vector<EventField> fields) {
  Event event;
  event.category = EventCategory::kSecurity;
  event.severity = severity;
  event.event_id = event_id;
  event.message = std::move(message);
  event.fields = std::move(fields);
  EventBus::Instance().Publish(event);
}

bool Contains(const std::vector<std::string>& ids, const std::string& id) {
  return std::find(ids.begin(), ids.end(), id) != ids.end();
}

}  // namespace

const char* DecryptStateToString(DecryptState state) noexcept {
  switch (state) {
  case DecryptState::kParsing:
    return "PARSING";
  case DecryptState::kTrying:
    return "TRYING";
  case DecryptState::kSuccess:
    return "SUCCESS";
  case DecryptState::kExhausted:
    return "EXHAUSTED";
  }
  return "PARSING";
}

AgileOrchestrator::AgileOrchestrator(CryptoConfig config,
                                     std::shared_ptr<HandlerRegistry> registry,
                                     std::shared_ptr<crypto::AlgorithmProvider> provider)
    : config_(std::move(config)), registry_(std::move(registry)), provider_(std::move(provider)) {
  if (!registry_ || !provider_) {
    throw Error(ErrorDomain::Internal, 0, "AgileOrchestrator requires a registry and a provider");
  }
}

std::vector<uint8_t> AgileOrchestrator::EncryptActive(std::span<const uint8_t> plaintext,
                                                      const core::KeyMaterial& keys) {
  if (config_.active_suite_id.empty()) {
    throw Error(ErrorDomain::Config, errors::config::kActiveSuiteMissing,
                std::string(errors::msg::kActiveSuiteMissing));
  }
  auto handler = registry_->GetHandler(config_.active_suite_id);
  auto bundle = handler->Encrypt(plaintext, keys);
  auto serialized = core::SerializeBundle(bundle);

  Event event;
  event.category = EventCategory::kTelemetry;
  event.severity = EventSeverity::kInfo;
  event.event_id = "encrypt_completed";
  event.message = "Payload encrypted with active suite";
  event.fields.emplace_back("suite_id", config_.active_suite_id);
  event.fields.emplace_back("bundle_bytes", std::to_string(serialized.size()), FieldPrivacy::kPublic, true);
  EventBus::Instance().Publish(event);
  return serialized;
}

std::vector<uint8_t> AgileOrchestrator::EncryptActiveWithPassphrase(std::span<const uint8_t> plaintext,
                                                                    std::string_view passphrase) {
  if (config_.active_suite_id.empty()) {
    throw Error(ErrorDomain::Config, errors::config::kActiveSuiteMissing,
                std::string(errors::msg::kActiveSuiteMissing));
  }
  const auto* suite = config_.FindSuite(config_.active_suite_id);
  if (!suite) {
    throw Error(ErrorDomain::Config, errors::config::kUnknownSuite,
                "Active suite is not defined: " + config_.active_suite_id);
  }
  core::KeyManager key_manager(provider_);
  const auto keys = key_manager.DeriveForEncryption(passphrase, *suite);
  return EncryptActive(plaintext, keys);
}

void AgileOrchestrator::Notify(DecryptState state, size_t attempt_index, const std::string& suite_id) const {
  if (observer_) {
    observer_(StateTransition{state, attempt_index, suite_id});
  }
}

std::vector<std::string> AgileOrchestrator::CandidateOrder(std::span<const uint8_t> raw) const {
  std::vector<std::string> order;
  auto header = core::PeekBundleHeader(raw);
  if (header) {
    if (registry_->Contains(header->suite_id)) {
      order.push_back(header->suite_id);
    }
  } else if (config_.legacy_fallback_enabled && registry_->Contains(kLegacySuiteId)) {
    try {
      if (registry_->GetHandler(kLegacySuiteId)->CanHandle(raw)) {
        order.emplace_back(kLegacySuiteId);
      }
    } catch (const AlgorithmUnavailableError& e) {
      PublishDecryptEvent(EventSeverity::kWarning, "suite_unavailable", e.what(),
                          {EventField("suite_id", kLegacySuiteId)});
    }
  }
  for (const auto& id : config_.decryption_attempt_order) {
    if (!Contains(order, id)) {
      order.push_back(id);
    }
  }
  return order;
}

std::vector<uint8_t> AgileOrchestrator::DecryptWithAgility(std::span<const uint8_t> raw,
                                                           const KeySource& key_source) {
  Notify(DecryptState::kParsing, 0, std::string());
  const auto order = CandidateOrder(raw);

  std::vector<std::string> attempted;
  size_t attempt_index = 0;
  for (const auto& suite_id : order) {
    if (!registry_->Contains(suite_id)) {
      attempted.push_back(suite_id);
      PublishDecryptEvent(EventSeverity::kWarning, "decrypt_attempt_failed", "Suite has no registered handler",
                          {EventField("suite_id", suite_id), EventField("reason", "not_registered")});
      continue;
    }
    HandlerRegistry::HandlerPtr handler;
    try {
      handler = registry_->GetHandler(suite_id);
    } catch (const Error& e) {
      // A handler that cannot be built skips its suite.
      PublishDecryptEvent(EventSeverity::kWarning, "suite_unavailable", e.what(),
                          {EventField("suite_id", suite_id),
                           EventField("code", std::to_string(e.code), FieldPrivacy::kPublic, true)});
      continue;
    }

    Notify(DecryptState::kTrying, attempt_index++, suite_id);
    attempted.push_back(suite_id);
    auto attempt = handler->Decrypt(raw, key_source);
    if (attempt.succeeded()) {
      Notify(DecryptState::kSuccess, attempt_index - 1, suite_id);
      PublishDecryptEvent(EventSeverity::kInfo, "decrypt_succeeded", "Payload decrypted",
                          {EventField("suite_id", suite_id),
                           EventField("attempts", std::to_string(attempt_index), FieldPrivacy::kPublic, true)});
      return attempt.TakePlaintext();
    }
    PublishDecryptEvent(EventSeverity::kInfo, "decrypt_attempt_failed", attempt.message(),
                        {EventField("suite_id", suite_id),
                         EventField("reason", FailureReasonToString(attempt.reason()))});
  }

  Notify(DecryptState::kExhausted, attempt_index, std::string());
  std::string tried;
  for (const auto& id : attempted) {
    tried += tried.empty() ? id : ":" + id;
  }
  PublishDecryptEvent(EventSeverity::kError, "decrypt_exhausted", "No configured suite could decrypt payload",
                      {EventField("attempted", tried)});
  throw AggregateDecryptionError(std::move(attempted));
}

}  // namespace hv::orchestrator
