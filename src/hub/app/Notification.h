#pragma once
#include <stdint.h>

#include <string>

#include "app/Incident.h"

enum class Channel : uint8_t { none, push, sms, email };
enum class Tier : uint8_t { base, escalation };

enum class DeliveryStatus : uint8_t {
  pending,
  sent,
  failed,
  cancelled
};

// Result of a single transport attempt (also used for audit entries).
enum class AttemptResult : uint8_t {
  sent,
  transient_error,
  permanent_error,
  no_channel,
  cancelled
};

static inline const char* toString(Channel c) {
  switch (c) {
    case Channel::none:  return "none";
    case Channel::push:  return "push";
    case Channel::sms:   return "sms";
    case Channel::email: return "email";
    default:             return "unknown";
  }
}

static inline const char* toString(Tier t) {
  switch (t) {
    case Tier::base:       return "base";
    case Tier::escalation: return "escalation";
    default:               return "unknown";
  }
}

static inline const char* toString(DeliveryStatus s) {
  switch (s) {
    case DeliveryStatus::pending:   return "pending";
    case DeliveryStatus::sent:      return "sent";
    case DeliveryStatus::failed:    return "failed";
    case DeliveryStatus::cancelled: return "cancelled";
    default:                        return "unknown";
  }
}

static inline const char* toString(AttemptResult r) {
  switch (r) {
    case AttemptResult::sent:            return "sent";
    case AttemptResult::transient_error: return "transient_error";
    case AttemptResult::permanent_error: return "permanent_error";
    case AttemptResult::no_channel:      return "no_channel";
    case AttemptResult::cancelled:       return "cancelled";
    default:                             return "unknown";
  }
}

struct NotificationTask {
  std::string recipient_id;
  uint32_t incident_id = 0;
  Channel channel = Channel::none;
  Tier tier = Tier::base;
  Severity severity = Severity::low;
  uint8_t attempt = 0;
};

// Terminal or latest known outcome for one (recipient, incident) pair.
struct DeliveryOutcome {
  std::string recipient_id;
  uint32_t incident_id = 0;
  DeliveryStatus status = DeliveryStatus::pending;
  uint8_t attempts = 0;
  std::string last_error;
};

struct AuditRecord {
  std::string recipient_id;
  uint32_t incident_id = 0;
  uint8_t attempt = 0;
  uint32_t at_ms = 0;
  AttemptResult result = AttemptResult::sent;
  std::string detail;
};
