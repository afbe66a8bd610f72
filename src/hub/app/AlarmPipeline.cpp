#include "app/AlarmPipeline.h"

#include "app/StateJson.h"

AlarmPipeline::AlarmPipeline(const Config& cfg, const Directory& dir, PushTransport& transport, StateSink* sink)
: cfg_(cfg),
  dir_(dir),
  sink_(sink),
  tracker_(cfg),
  alarms_(cfg),
  dispatcher_(cfg, transport, sink),
  router_(cfg, dir, dispatcher_),
  hub_(cfg),
  scheduler_(cfg) {}

Scope AlarmPipeline::scopeForGateway(const std::string& gatewayId) const {
  Scope s;
  House house;
  if (dir_.houseForGateway(gatewayId, house)) {
    s.tenant_id = house.tenant_id;
    s.house_id = house.id;
  }
  return s;
}

size_t AlarmPipeline::publish(BroadcastEnvelope env, const std::string& gatewayId) {
  env.scope = scopeForGateway(gatewayId);
  return hub_.broadcast(env);
}

size_t AlarmPipeline::publishDevice(const char* type, const DeviceState& st, uint32_t nowMs) {
  BroadcastEnvelope env;
  env.event_type = type;
  env.payload = toJson(st);
  env.timestamp_ms = nowMs;
  const std::string& gw = (st.kind == DeviceKind::gateway) ? st.id : st.gateway_id;
  return publish(env, gw);
}

FanOutReport AlarmPipeline::fanOut(const AlarmIncident& inc, uint32_t nowMs) {
  FanOutReport r;
  r.attempted = true;

  // Routing finishes before the first task is admitted.
  std::vector<NotificationTask> tasks;
  r.route = router_.route(inc, tasks);
  if (r.route != RouteError::none) return r;

  for (const NotificationTask& task : tasks) {
    switch (dispatcher_.dispatch(task, nowMs)) {
      case AdmitResult::queued:     ++r.queued; break;
      case AdmitResult::no_channel: ++r.no_channel; break;
      case AdmitResult::duplicate:  ++r.duplicate; break;
      default: break;
    }
  }
  return r;
}

void AlarmPipeline::settle(const AlarmTransition& t, uint32_t nowMs, FanOutReport* fan, size_t* broadcasts) {
  if (!t.ok()) return;
  if (sink_) sink_->saveIncident(t.incident);

  if (t.fanout != FanOut::none) {
    const FanOutReport r = fanOut(t.incident, nowMs);
    if (fan) *fan = r;
  }

  if (t.has_envelope) {
    const size_t n = publish(t.envelope, t.incident.gateway_id);
    if (broadcasts) *broadcasts += n;
  }
}

IngestReport AlarmPipeline::ingest(const std::string& topic, const std::string& body, uint32_t nowMs) {
  IngestReport r;
  r.decode = decoder_.decode(topic, body, nowMs, r.event, &r.detail);
  if (!r.decoded()) return r;

  r.device = tracker_.applyEvent(r.event);
  const DeviceUpdate& u = r.device;

  if (sink_) {
    if (r.event.namesSensor()) sink_->saveDevice(u.gateway);
    if (!u.removed) sink_->saveDevice(u.state);
  }

  if (r.event.namesSensor() && u.gatewayStatusChanged()) {
    r.broadcasts += publishDevice("device_status", u.gateway, nowMs);
  }
  if (u.removed) {
    r.broadcasts += publishDevice("device_removed", u.state, nowMs);
  } else if (u.statusChanged()) {
    r.broadcasts += publishDevice("device_status", u.state, nowMs);
  }
  if (u.low_battery) {
    r.broadcasts += publishDevice("device_low_battery", u.state, nowMs);
  }

  if (r.event.kind == EventKind::smoke_alarm) {
    const Severity sev = r.event.has_severity ? r.event.severity : cfg_.default_smoke_severity;
    r.incident = true;
    r.transition = alarms_.trigger(r.event.sensor_id, r.event.gateway_id, sev, nowMs);
    settle(r.transition, nowMs, &r.fanout, &r.broadcasts);
  }
  return r;
}

AlarmTransition AlarmPipeline::triggerTest(const std::string& sensorId, Severity severity, uint32_t nowMs, FanOutReport* fan) {
  DeviceState sensor;
  if (!tracker_.find(sensorId, sensor) || sensor.kind != DeviceKind::sensor) {
    AlarmTransition t;
    t.status = TransitionStatus::not_found;
    return t;
  }
  AlarmTransition t = alarms_.trigger(sensor.id, sensor.gateway_id, severity, nowMs);
  settle(t, nowMs, fan, nullptr);
  return t;
}

AlarmTransition AlarmPipeline::acknowledge(uint32_t incidentId, const std::string& userId, uint32_t nowMs) {
  AlarmTransition t = alarms_.acknowledge(incidentId, userId, nowMs);
  settle(t, nowMs, nullptr, nullptr);
  return t;
}

AlarmTransition AlarmPipeline::escalate(uint32_t incidentId, uint32_t nowMs, FanOutReport* fan) {
  AlarmTransition t = alarms_.escalate(incidentId, nowMs);
  settle(t, nowMs, fan, nullptr);

  // A resolve that lands while the escalation tier is being routed cancels
  // before those tasks exist; sweep them up here instead.
  AlarmIncident cur;
  if (t.ok() && alarms_.find(incidentId, cur) && cur.state == IncidentState::resolved) {
    dispatcher_.cancelPending(incidentId, Tier::escalation, nowMs);
  }
  return t;
}

AlarmTransition AlarmPipeline::resolve(uint32_t incidentId, uint32_t nowMs, size_t* cancelled) {
  AlarmTransition t = alarms_.resolve(incidentId, nowMs);
  if (t.ok()) {
    const size_t n = dispatcher_.cancelPending(incidentId, Tier::escalation, nowMs);
    if (cancelled) *cancelled = n;
  }
  settle(t, nowMs, nullptr, nullptr);
  return t;
}

TickReport AlarmPipeline::tick(uint32_t nowMs) {
  TickReport r;
  if (!scheduler_.pollSweep(nowMs)) return r;
  r.swept = true;

  r.offline = tracker_.sweep(nowMs);
  for (const DeviceState& st : r.offline) {
    if (sink_) sink_->saveDevice(st);
    publishDevice("device_status", st, nowMs);
  }

  for (uint32_t id : scheduler_.pollEscalations(alarms_, nowMs)) {
    FanOutReport fan;
    AlarmTransition t = escalate(id, nowMs, &fan);
    // Acknowledged or resolved between the scan and now.
    if (!t.ok()) continue;
    r.escalated.push_back(t);
    r.escalation_fanout.push_back(fan);
  }

  r.pruned = alarms_.pruneResolved(nowMs, cfg_.resolved_retention_ms);
  for (uint32_t id : r.pruned) dispatcher_.forgetIncident(id);
  return r;
}
