#include "app/OperatorConsole.h"

namespace {
static CommandAck reply(CommandKind kind, bool ok, const std::string& detail) {
  CommandAck a;
  a.cmd = toString(kind);
  a.ok = ok;
  a.detail = detail;
  return a;
}

static std::string describe(const AlarmTransition& t) {
  std::string out = "incident=";
  out += std::to_string(t.incident.id);
  out += " state=";
  out += toString(t.incident.state);
  out += " severity=";
  out += toString(t.incident.severity);
  if (t.status == TransitionStatus::coalesced) out += " coalesced";
  return out;
}

static void appendFanOut(std::string& out, const FanOutReport& f) {
  if (!f.attempted) return;
  if (f.route != RouteError::none) {
    out += " route=";
    out += toString(f.route);
    return;
  }
  out += " queued=";
  out += std::to_string(f.queued);
  if (f.no_channel) {
    out += " no_channel=";
    out += std::to_string(f.no_channel);
  }
}
} // namespace

CommandAck OperatorConsole::handle(const std::string& line, uint32_t nowMs) {
  OperatorCommand c;
  const CommandError err = parseCommand(line, c);
  if (err != CommandError::none) {
    CommandAck a;
    a.cmd = "parse";
    a.ok = false;
    a.detail = toString(err);
    return a;
  }

  switch (c.kind) {
    case CommandKind::mock:     return runMock(c, nowMs);
    case CommandKind::test:     return runTest(c, nowMs);
    case CommandKind::ack:
    case CommandKind::escalate:
    case CommandKind::resolve:  return runTransition(c, nowMs);
    case CommandKind::set:      return runSet(c);
    case CommandKind::status:   return runStatus();
    case CommandKind::help:     return reply(c.kind, true, commandHelp());
    default:                    return reply(c.kind, false, "unsupported");
  }
}

CommandAck OperatorConsole::runMock(const OperatorCommand& c, uint32_t nowMs) {
  const IngestReport r = pipeline_.ingest(c.topic, c.body, nowMs);
  if (!r.decoded()) {
    std::string detail = toString(r.decode);
    if (!r.detail.empty()) {
      detail += ": ";
      detail += r.detail;
    }
    return reply(c.kind, false, detail);
  }

  std::string detail = toString(r.event.kind);
  detail += " device=";
  detail += r.device.state.id;
  detail += " status=";
  detail += toString(r.device.state.status);
  if (r.incident) {
    detail += ' ';
    if (!r.transition.ok()) {
      detail += toString(r.transition.status);
      return reply(c.kind, false, detail);
    }
    detail += describe(r.transition);
    appendFanOut(detail, r.fanout);
  }
  return reply(c.kind, true, detail);
}

CommandAck OperatorConsole::runTest(const OperatorCommand& c, uint32_t nowMs) {
  const Severity sev = c.has_severity ? c.severity : live_.default_smoke_severity;
  FanOutReport fan;
  const AlarmTransition t = pipeline_.triggerTest(c.sensor_id, sev, nowMs, &fan);
  if (!t.ok()) return reply(c.kind, false, toString(t.status));

  std::string detail = describe(t);
  appendFanOut(detail, fan);
  return reply(c.kind, true, detail);
}

CommandAck OperatorConsole::runTransition(const OperatorCommand& c, uint32_t nowMs) {
  AlarmTransition t;
  FanOutReport fan;
  size_t cancelled = 0;

  switch (c.kind) {
    case CommandKind::ack:
      t = pipeline_.acknowledge(c.incident_id, c.user_id, nowMs);
      break;
    case CommandKind::escalate:
      t = pipeline_.escalate(c.incident_id, nowMs, &fan);
      break;
    case CommandKind::resolve:
    default:
      t = pipeline_.resolve(c.incident_id, nowMs, &cancelled);
      break;
  }

  if (!t.ok()) {
    std::string detail = toString(t.status);
    if (t.status == TransitionStatus::invalid_transition) {
      detail += " state=";
      detail += toString(t.incident.state);
    }
    return reply(c.kind, false, detail);
  }

  std::string detail = describe(t);
  appendFanOut(detail, fan);
  if (cancelled) {
    detail += " cancelled=";
    detail += std::to_string(cancelled);
  }
  return reply(c.kind, true, detail);
}

CommandAck OperatorConsole::runSet(const OperatorCommand& c) {
  const ConfigError err = applyConfigOverride(staged_, c.key, c.value);
  if (err != ConfigError::none) {
    return reply(c.kind, false, std::string(toString(err)) + " " + c.key);
  }
  if (store_ && !store_->save(c.key, c.value)) {
    return reply(c.kind, false, "persist_failed " + c.key);
  }
  return reply(c.kind, true, c.key + "=" + c.value + " applies after restart");
}

CommandAck OperatorConsole::runStatus() const {
  const DeliveryDispatcher::Stats d = pipeline_.dispatcher().stats();
  const BroadcastHub::Stats h = pipeline_.hub().stats();

  std::string detail = "devices=";
  detail += std::to_string(pipeline_.tracker().size());
  detail += " open=";
  detail += std::to_string(pipeline_.alarms().openIncidents().size());
  detail += " queued=";
  detail += std::to_string(d.queued);
  detail += " sent=";
  detail += std::to_string(d.sent);
  detail += " failed=";
  detail += std::to_string(d.failed);
  detail += " clients=";
  detail += std::to_string(h.connections);
  detail += " backpressure=";
  detail += std::to_string(h.backpressure_drops);
  detail += " cfg=";
  detail += describeConfig(live_);
  return reply(CommandKind::status, true, detail);
}
