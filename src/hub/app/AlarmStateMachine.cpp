#include "app/AlarmStateMachine.h"

#include <algorithm>

#include "app/StateJson.h"
#include "pipelines/TimeoutScheduler.h"

namespace {
static void emit(AlarmTransition& t, const char* type, uint32_t nowMs) {
  t.has_envelope = true;
  t.envelope.event_type = type;
  t.envelope.payload = toJson(t.incident);
  t.envelope.timestamp_ms = nowMs;
}

static AlarmTransition rejected(TransitionStatus status, const AlarmIncident* inc) {
  AlarmTransition t;
  t.status = status;
  if (inc) t.incident = *inc;
  return t;
}
} // namespace

AlarmTransition AlarmStateMachine::trigger(const std::string& sensorId,
                                           const std::string& gatewayId,
                                           Severity severity,
                                           uint32_t nowMs) {
  AlarmTransition t;

  openBySensor_.upsert(sensorId, [&](uint32_t& openId, bool) {
    if (openId != 0) {
      // Coalesce into the open incident; only a strictly higher severity
      // is worth telling anyone about. Crossing into high pulls in the
      // neighbourhood, so that raise is routed again.
      const bool found = incidents_.update(openId, [&](AlarmIncident& inc) {
        ++inc.trigger_count;
        t.status = TransitionStatus::coalesced;
        if (severity > inc.severity) {
          if (!widensAudience(inc.severity) && widensAudience(severity)) t.fanout = FanOut::base;
          inc.severity = severity;
          t.incident = inc;
          emit(t, "incident_updated", nowMs);
        } else {
          t.incident = inc;
        }
      });
      if (found) return;
      openId = 0;
    }

    AlarmIncident inc;
    inc.id = nextId_.fetch_add(1);
    inc.sensor_id = sensorId;
    inc.gateway_id = gatewayId;
    inc.severity = severity;
    inc.state = IncidentState::active;
    inc.triggered_ms = nowMs;
    inc.trigger_count = 1;

    incidents_.upsert(inc.id, [&](AlarmIncident& slot, bool) { slot = inc; });
    openId = inc.id;

    t.status = TransitionStatus::ok;
    t.incident = inc;
    t.fanout = FanOut::base;
    emit(t, "incident_triggered", nowMs);
  });

  return t;
}

AlarmTransition AlarmStateMachine::acknowledge(uint32_t incidentId, const std::string& userId, uint32_t nowMs) {
  AlarmTransition t = rejected(TransitionStatus::not_found, nullptr);
  incidents_.update(incidentId, [&](AlarmIncident& inc) {
    if (inc.state != IncidentState::active) {
      t = rejected(TransitionStatus::invalid_transition, &inc);
      return;
    }
    inc.state = IncidentState::acknowledged;
    inc.acknowledged = true;
    inc.acknowledged_by = userId;
    t.status = TransitionStatus::ok;
    t.incident = inc;
    emit(t, "incident_acknowledged", nowMs);
  });
  return t;
}

AlarmTransition AlarmStateMachine::escalate(uint32_t incidentId, uint32_t nowMs) {
  AlarmTransition t = rejected(TransitionStatus::not_found, nullptr);
  incidents_.update(incidentId, [&](AlarmIncident& inc) {
    if (inc.state != IncidentState::active) {
      t = rejected(TransitionStatus::invalid_transition, &inc);
      return;
    }
    inc.state = IncidentState::escalated;
    inc.severity = raiseSeverity(inc.severity);
    inc.escalated_ms = nowMs;
    t.status = TransitionStatus::ok;
    t.incident = inc;
    t.fanout = FanOut::escalation;
    emit(t, "incident_escalated", nowMs);
  });
  return t;
}

AlarmTransition AlarmStateMachine::resolveLocked(AlarmIncident& inc, uint32_t nowMs) const {
  AlarmTransition t;
  t.status = TransitionStatus::ok;
  if (inc.state == IncidentState::resolved) {
    t.incident = inc;
    return t;
  }
  inc.state = IncidentState::resolved;
  inc.resolved = true;
  inc.resolved_ms = nowMs;
  t.incident = inc;
  emit(t, "incident_resolved", nowMs);
  return t;
}

AlarmTransition AlarmStateMachine::resolve(uint32_t incidentId, uint32_t nowMs) {
  AlarmIncident current;
  if (!incidents_.read(incidentId, current)) {
    return rejected(TransitionStatus::not_found, nullptr);
  }

  AlarmTransition t = rejected(TransitionStatus::not_found, nullptr);
  const bool indexed = openBySensor_.updateOrRemove(current.sensor_id, [&](uint32_t& openId) {
    incidents_.update(incidentId, [&](AlarmIncident& inc) { t = resolveLocked(inc, nowMs); });
    return openId == incidentId;
  });
  if (!indexed) {
    // Sensor index already cleared: the incident can only be resolved.
    incidents_.update(incidentId, [&](AlarmIncident& inc) { t = resolveLocked(inc, nowMs); });
  }
  return t;
}

std::vector<uint32_t> AlarmStateMachine::dueForEscalation(uint32_t nowMs) const {
  std::vector<uint32_t> due;
  const uint32_t timeout = cfg_.ack_timeout_ms;
  for (const auto& kv : incidents_.records()) {
    std::lock_guard<std::mutex> lk(kv.second->mu);
    if (kv.second->removed) continue;
    const AlarmIncident& inc = kv.second->value;
    if (inc.state != IncidentState::active) continue;
    if (!reached(nowMs, inc.triggered_ms + timeout)) continue;
    due.push_back(inc.id);
  }
  std::sort(due.begin(), due.end());
  return due;
}

std::vector<uint32_t> AlarmStateMachine::pruneResolved(uint32_t nowMs, uint32_t keepMs) {
  std::vector<uint32_t> dropped;
  for (const auto& kv : incidents_.records()) {
    incidents_.updateOrRemove(kv.first, [&](AlarmIncident& inc) {
      const bool drop = inc.resolved && reached(nowMs, inc.resolved_ms + keepMs);
      if (drop) dropped.push_back(inc.id);
      return drop;
    });
  }
  std::sort(dropped.begin(), dropped.end());
  return dropped;
}

bool AlarmStateMachine::find(uint32_t incidentId, AlarmIncident& out) const {
  return incidents_.read(incidentId, out);
}

bool AlarmStateMachine::openIncidentFor(const std::string& sensorId, uint32_t& incidentId) const {
  uint32_t id = 0;
  if (!openBySensor_.read(sensorId, id) || id == 0) return false;
  incidentId = id;
  return true;
}

std::vector<AlarmIncident> AlarmStateMachine::openIncidents() const {
  std::vector<AlarmIncident> out;
  for (const auto& kv : incidents_.records()) {
    std::lock_guard<std::mutex> lk(kv.second->mu);
    if (kv.second->removed) continue;
    if (isOpen(kv.second->value.state)) out.push_back(kv.second->value);
  }
  std::sort(out.begin(), out.end(), [](const AlarmIncident& a, const AlarmIncident& b) {
    return a.id < b.id;
  });
  return out;
}
