#pragma once
#include <stdint.h>

#include <atomic>
#include <string>
#include <vector>

#include "app/Broadcast.h"
#include "app/Config.h"
#include "app/Incident.h"
#include "pipelines/KeyedStore.h"

enum class TransitionStatus {
  ok,
  coalesced,
  invalid_transition,
  not_found
};

enum class FanOut { none, base, escalation };

static inline const char* toString(TransitionStatus s) {
  switch (s) {
    case TransitionStatus::ok:                 return "ok";
    case TransitionStatus::coalesced:          return "coalesced";
    case TransitionStatus::invalid_transition: return "invalid_transition";
    case TransitionStatus::not_found:          return "not_found";
    default:                                   return "unknown";
  }
}

// Outcome of one state-machine call, in the shape the pipeline acts on.
struct AlarmTransition {
  TransitionStatus status = TransitionStatus::not_found;
  AlarmIncident incident;
  bool has_envelope = false;
  BroadcastEnvelope envelope;
  FanOut fanout = FanOut::none;

  bool ok() const {
    return status == TransitionStatus::ok || status == TransitionStatus::coalesced;
  }
};

// Owns every incident from trigger to resolution.
// Transitions on one incident are serialized by that incident's lock;
// trigger/resolve additionally hold the sensor's lock (always taken first)
// so a sensor never has two open incidents.
class AlarmStateMachine {
public:
  explicit AlarmStateMachine(const Config& cfg) : cfg_(cfg) {}

  AlarmTransition trigger(const std::string& sensorId,
                          const std::string& gatewayId,
                          Severity severity,
                          uint32_t nowMs);
  AlarmTransition acknowledge(uint32_t incidentId, const std::string& userId, uint32_t nowMs);
  AlarmTransition escalate(uint32_t incidentId, uint32_t nowMs);
  AlarmTransition resolve(uint32_t incidentId, uint32_t nowMs);

  // Active incidents whose acknowledgement window has run out, by id.
  std::vector<uint32_t> dueForEscalation(uint32_t nowMs) const;

  // Drops incidents resolved more than keepMs ago. Returns their ids.
  std::vector<uint32_t> pruneResolved(uint32_t nowMs, uint32_t keepMs);

  bool find(uint32_t incidentId, AlarmIncident& out) const;
  bool openIncidentFor(const std::string& sensorId, uint32_t& incidentId) const;
  std::vector<AlarmIncident> openIncidents() const;

private:
  const Config& cfg_;
  KeyedStore<uint32_t, AlarmIncident> incidents_;
  KeyedStore<std::string, uint32_t> openBySensor_;
  std::atomic<uint32_t> nextId_{1};

  AlarmTransition resolveLocked(AlarmIncident& inc, uint32_t nowMs) const;
};
