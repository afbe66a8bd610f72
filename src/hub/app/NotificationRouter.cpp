#include "app/NotificationRouter.h"

#include <map>

double NotificationRouter::radiusFor(Tier tier) const {
  const double base = (double)cfg_.base_radius_m;
  if (tier == Tier::escalation) return base * (double)cfg_.escalation_radius_multiplier;
  return base;
}

Channel NotificationRouter::pickChannel(const Recipient& r) {
  if (r.has_push) return Channel::push;
  if (r.has_sms) return Channel::sms;
  if (r.has_email) return Channel::email;
  return Channel::none;
}

RouteError NotificationRouter::route(const AlarmIncident& inc,
                                     std::vector<NotificationTask>& out,
                                     House* house) const {
  out.clear();

  House site;
  if (!dir_.houseForGateway(inc.gateway_id, site)) return RouteError::unknown_location;
  if (house) *house = site;

  const Tier tier = (inc.state == IncidentState::escalated) ? Tier::escalation : Tier::base;

  // Keyed by id: dedups candidates and fixes the output order.
  std::map<std::string, Recipient> chosen;
  for (const Recipient& r : dir_.occupantsOf(site.id)) {
    chosen[r.id] = r;
  }

  if (tier == Tier::escalation || widensAudience(inc.severity)) {
    for (const Recipient& r : dir_.findWithinRadius(site.location, radiusFor(tier))) {
      // Neighbours' occupants and emergency roles; own occupants are in already.
      chosen[r.id] = r;
    }
  }

  for (const auto& kv : chosen) {
    if (ledger_.hasPendingOrSent(kv.first, inc.id)) continue;

    NotificationTask task;
    task.recipient_id = kv.first;
    task.incident_id = inc.id;
    task.channel = pickChannel(kv.second);
    task.tier = tier;
    task.severity = inc.severity;
    task.attempt = 0;
    out.push_back(task);
  }
  return RouteError::none;
}
