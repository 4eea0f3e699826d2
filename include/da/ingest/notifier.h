#pragma once

#include <string>
#include <utility>
#include <vector>

namespace da::ingest {

using FileVersionList = std::vector<std::pair<std::string, int>>;

// Downstream subscription delivery. Fire and forget: implementations report
// their own failures and must not throw.
class SubscriptionNotifier {
public:
  virtual ~SubscriptionNotifier() = default;
  virtual void Register(const FileVersionList& files) noexcept = 0;
  virtual void Trigger() noexcept = 0;
};

// Publishes subscription_register per file and subscription_trigger on the
// process event bus.
class EventBusNotifier final : public SubscriptionNotifier {
public:
  void Register(const FileVersionList& files) noexcept override;
  void Trigger() noexcept override;
};

}  // namespace da::ingest
