#include "da/ingest/notifier.h"

#include <exception>
#include <iostream>

#include "da/orchestrator/event_bus.h"

namespace da::ingest {
namespace {

void PublishNoThrow(const orchestrator::Event& event) noexcept {
  try {
    orchestrator::EventBus::Instance().Publish(event);
  } catch (const std::exception& ex) {
    std::clog << "{\"event\":\"notifier_publish_failed\",\"error\":\"" << ex.what() << "\"}" << std::endl;
  }
}

}  // namespace

void EventBusNotifier::Register(const FileVersionList& files) noexcept {
  for (const auto& [file_id, version] : files) {
    orchestrator::Event event;
    event.category = orchestrator::EventCategory::kLifecycle;
    event.severity = orchestrator::EventSeverity::kInfo;
    event.event_id = "subscription_register";
    event.message = "File registered for subscription delivery";
    event.fields.emplace_back("file_id", file_id);
    event.fields.emplace_back("file_version", std::to_string(version), orchestrator::FieldPrivacy::kPublic, true);
    PublishNoThrow(event);
  }
}

void EventBusNotifier::Trigger() noexcept {
  orchestrator::Event event;
  event.category = orchestrator::EventCategory::kLifecycle;
  event.severity = orchestrator::EventSeverity::kInfo;
  event.event_id = "subscription_trigger";
  event.message = "Subscription delivery triggered";
  PublishNoThrow(event);
}

}  // namespace da::ingest
