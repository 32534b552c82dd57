#include "hv/orchestrator/event_bus.h"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

namespace {

using hv::orchestrator::Event;
using hv::orchestrator::EventBus;
using hv::orchestrator::EventField;
using hv::orchestrator::FieldPrivacy;

bool Contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

void TestHashing() {
  assert(hv::orchestrator::HashForTelemetry("abc") ==
         "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  assert(hv::orchestrator::HashForTelemetry("").empty());
}

void TestJsonRendering() {
  Event event;
  event.category = hv::orchestrator::EventCategory::kSecurity;
  event.severity = hv::orchestrator::EventSeverity::kWarning;
  event.event_id = "keys_exported";
  event.message = "line\n\"quoted\"";
  event.fields.emplace_back("suite_id", "HYBRID-A");
  event.fields.emplace_back("passphrase", "hunter2", FieldPrivacy::kRedact);
  event.fields.emplace_back("path", "abc", FieldPrivacy::kHash);
  event.fields.emplace_back("bytes", "42", FieldPrivacy::kPublic, true);

  const auto json = hv::orchestrator::FormatEventJson(event);
  assert(json.front() == '{' && json.back() == '}');
  assert(Contains(json, "\"severity\":\"warning\""));
  assert(Contains(json, "\"category\":\"security\""));
  assert(Contains(json, "\"event\":\"keys_exported\""));
  assert(Contains(json, "\"message\":\"line\\n\\\"quoted\\\"\""));
  assert(Contains(json, "\"suite_id\":\"HYBRID-A\""));
  assert(Contains(json, "\"passphrase\":\"[REDACTED]\""));
  assert(!Contains(json, "hunter2"));
  assert(Contains(json, "\"path\":\"hash:ba7816bf"));
  assert(Contains(json, "\"bytes\":42"));
}

void TestSubscribers() {
  hv::orchestrator::ResetEventBusForTesting();
  std::vector<std::string> first;
  std::vector<std::string> second;
  EventBus::Instance().Subscribe([&first](const Event& e) { first.push_back(e.event_id); });
  EventBus::Instance().Subscribe([&second](const Event& e) { second.push_back(e.event_id); });

  Event event;
  event.event_id = "handler_registered";
  EventBus::Instance().Publish(event);
  assert(first.size() == 1 && second.size() == 1);
  assert(first[0] == "handler_registered");

  hv::orchestrator::ResetEventBusForTesting();
  // With no subscribers the event goes to std::clog instead.
  EventBus::Instance().Publish(event);
  assert(first.size() == 1 && second.size() == 1);
}

}  // namespace

int main() {
  TestHashing();
  TestJsonRendering();
  TestSubscribers();
  std::cout << "event bus test ok\n";
  return 0;
}
