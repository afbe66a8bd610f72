#pragma once
#include <stdint.h>

#include <string>
#include <vector>

#include "app/Config.h"
#include "app/Incident.h"
#include "app/Notification.h"
#include "app/RecipientDirectory.h"

// What the router needs to know about earlier deliveries.
class DeliveryLedger {
public:
  virtual ~DeliveryLedger() = default;
  virtual bool hasPendingOrSent(const std::string& recipientId, uint32_t incidentId) const = 0;
};

enum class RouteError {
  none,
  unknown_location
};

static inline const char* toString(RouteError e) {
  switch (e) {
    case RouteError::none:             return "none";
    case RouteError::unknown_location: return "unknown_location";
    default:                           return "unknown";
  }
}

class NotificationRouter {
public:
  NotificationRouter(const Config& cfg, const Directory& dir, const DeliveryLedger& ledger)
  : cfg_(cfg), dir_(dir), ledger_(ledger) {}

  // Builds the delivery tasks for one incident, ordered by recipient id.
  // Escalated incidents use the widened radius and the escalation tier.
  // `house` receives the incident's site when it is known.
  RouteError route(const AlarmIncident& inc,
                   std::vector<NotificationTask>& out,
                   House* house = nullptr) const;

  double radiusFor(Tier tier) const;

  // push > sms > email; none when the recipient has no reachable channel.
  static Channel pickChannel(const Recipient& r);

private:
  const Config& cfg_;
  const Directory& dir_;
  const DeliveryLedger& ledger_;
};
