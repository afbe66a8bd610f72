#include <iostream>
#include <deque>
#include <functional>
#include <initializer_list>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "app/AlarmPipeline.h"
#include "app/Broadcast.h"
#include "app/CommandParser.h"
#include "app/Config.h"
#include "app/OperatorConsole.h"
#include "app/RecipientDirectory.h"
#include "app/StateJson.h"
#include "pipelines/BroadcastHub.h"
#include "pipelines/DeliveryDispatcher.h"
#include "pipelines/MessageDecoder.h"
#include "pipelines/TimeoutScheduler.h"

namespace {

#define CHECK(cond) \
  do { \
    if (!(cond)) { \
      std::cerr << "CHECK failed: " #cond << " at " << __FILE__ << ":" << __LINE__ << "\n"; \
      return false; \
    } \
  } while (0)

// Plays back a per-recipient result script; anything unscripted succeeds.
class ScriptedTransport : public PushTransport {
public:
  void script(const std::string& recipientId, std::initializer_list<PushResult> results) {
    std::lock_guard<std::mutex> lk(mu_);
    for (PushResult r : results) script_[recipientId].push_back(r);
  }

  PushResult send(const std::string& recipientId, const std::string& payload, std::string& error) override {
    std::lock_guard<std::mutex> lk(mu_);
    ++calls_[recipientId];
    lastPayload_ = payload;
    std::deque<PushResult>& q = script_[recipientId];
    if (q.empty()) return PushResult::success;
    const PushResult r = q.front();
    q.pop_front();
    if (r != PushResult::success) error = (r == PushResult::transient_error) ? "http 503" : "http 410";
    return r;
  }

  int calls(const std::string& recipientId) {
    std::lock_guard<std::mutex> lk(mu_);
    return calls_[recipientId];
  }

  std::string lastPayload() {
    std::lock_guard<std::mutex> lk(mu_);
    return lastPayload_;
  }

private:
  std::mutex mu_;
  std::map<std::string, std::deque<PushResult>> script_;
  std::map<std::string, int> calls_;
  std::string lastPayload_;
};

class RecordingSink : public StateSink {
public:
  std::vector<DeviceState> devices;
  std::vector<AlarmIncident> incidents;
  std::vector<AuditRecord> audits;

  void saveDevice(const DeviceState& st) override { devices.push_back(st); }
  void saveIncident(const AlarmIncident& inc) override { incidents.push_back(inc); }
  void appendAudit(const AuditRecord& rec) override { audits.push_back(rec); }
};

class RecordingChannel : public ClientChannel {
public:
  bool open = true;
  std::vector<std::string> frames;

  bool canSend() const override { return open; }
  bool write(const std::string& frame) override {
    frames.push_back(frame);
    return true;
  }
};

class MemorySettings : public SettingsStore {
public:
  bool fail = false;
  std::map<std::string, std::string> saved;

  bool save(const std::string& key, const std::string& value) override {
    if (fail) return false;
    saved[key] = value;
    return true;
  }
};

// Asks the hub for its own queue depth from inside canSend(), the way a
// websocket adapter checking for backlog would.
class HubQueryingChannel : public ClientChannel {
public:
  BroadcastHub* hub = nullptr;
  uint32_t id = 0;
  mutable size_t lastDepth = 0;
  std::vector<std::string> frames;

  bool canSend() const override {
    size_t depth = 0;
    if (hub && hub->queueDepth(id, depth)) lastDepth = depth;
    return true;
  }
  bool write(const std::string& frame) override {
    frames.push_back(frame);
    return true;
  }
};

// Forwards to an InMemoryDirectory and runs a one-shot hook on the next
// radius query, which lets a test land a call mid-routing.
class HookedDirectory : public Directory {
public:
  explicit HookedDirectory(const InMemoryDirectory& inner) : inner_(inner) {}

  mutable std::function<void()> onRadiusQuery;

  bool houseForGateway(const std::string& gatewayId, House& out) const override {
    return inner_.houseForGateway(gatewayId, out);
  }
  std::vector<Recipient> occupantsOf(const std::string& houseId) const override {
    return inner_.occupantsOf(houseId);
  }
  std::vector<Recipient> findWithinRadius(const GeoPoint& center, double radiusM) const override {
    if (onRadiusQuery) {
      std::function<void()> hook;
      hook.swap(onRadiusQuery);
      hook();
    }
    return inner_.findWithinRadius(center, radiusM);
  }

private:
  const InMemoryDirectory& inner_;
};

bool contains(const std::string& text, const std::string& part) {
  return text.find(part) != std::string::npos;
}

// H1 sits at 45.0,7.0. e1 is ~100 m away, n1 ~400 m, far ~111 km.
bool seedDirectory(InMemoryDirectory& dir) {
  static const char* const kMessages[][2] = {
    {"firehub/dir/house/H1", "{\"lat\":45.0,\"lon\":7.0,\"tenant\":\"T1\"}"},
    {"firehub/dir/house/H2", "{\"lat\":45.5,\"lon\":7.5,\"tenant\":\"T2\"}"},
    {"firehub/dir/gateway/gw-1", "{\"house\":\"H1\"}"},
    {"firehub/dir/gateway/gw-2", "{\"house\":\"H2\"}"},
    {"firehub/dir/recipient/u1", "{\"lat\":45.0,\"lon\":7.0,\"house\":\"H1\",\"push\":true}"},
    {"firehub/dir/recipient/u2", "{\"lat\":45.0,\"lon\":7.0,\"house\":\"H1\",\"push\":true}"},
    {"firehub/dir/recipient/e1", "{\"lat\":45.0009,\"lon\":7.0,\"role\":\"emergency\",\"sms\":true}"},
    {"firehub/dir/recipient/n1", "{\"lat\":45.0036,\"lon\":7.0,\"house\":\"H3\",\"push\":true}"},
    {"firehub/dir/recipient/far", "{\"lat\":46.0,\"lon\":7.0,\"house\":\"H4\",\"email\":true}"},
  };
  for (const auto& m : kMessages) {
    if (dir.applyMessage(m[0], m[1]) != DirectoryError::none) return false;
  }
  return true;
}

size_t drain(DeliveryDispatcher& d, uint32_t nowMs) {
  size_t n = 0;
  while (d.workOnce(nowMs)) ++n;
  return n;
}

NotificationTask makeTask(const std::string& recipient, uint32_t incident, Channel ch, Tier tier = Tier::base) {
  NotificationTask t;
  t.recipient_id = recipient;
  t.incident_id = incident;
  t.channel = ch;
  t.tier = tier;
  t.severity = Severity::high;
  return t;
}

bool test_decoder_accepts_known_kinds_and_reports_bad_input() {
  MessageDecoder dec;
  DeviceEvent ev;
  std::string detail;

  CHECK(dec.decode("uplink/gw-1/heartbeat", "{\"battery_v\":3.1,\"rssi\":-70}", 500, ev, &detail) == DecodeError::none);
  CHECK(ev.gateway_id == "gw-1");
  CHECK(ev.kind == EventKind::heartbeat);
  CHECK(ev.received_ms == 500);
  CHECK(ev.has_battery && ev.has_rssi);
  CHECK(ev.rssi_dbm == -70);
  CHECK(!ev.namesSensor());

  CHECK(dec.decode("uplink/gw-1/smoke_alarm", "{\"sensor\":\"s-1\",\"severity\":\"critical\"}", 1, ev) == DecodeError::none);
  CHECK(ev.sensor_id == "s-1");
  CHECK(ev.has_severity && ev.severity == Severity::critical);

  CHECK(dec.decode("uplink/gw-1/self_test", "{\"sensor\":\"s-1\",\"result\":\"fail\"}", 1, ev) == DecodeError::none);
  CHECK(!ev.self_test_ok);

  CHECK(dec.decode("uplink/gw-1/bogus", "{}", 1, ev, &detail) == DecodeError::unknown_kind);
  CHECK(detail == "bogus");
  CHECK(dec.decode("devices/gw-1/heartbeat", "{}", 1, ev) == DecodeError::bad_topic);
  CHECK(dec.decode("uplink/gw-1", "{}", 1, ev) == DecodeError::bad_topic);
  CHECK(dec.decode("uplink/gw-1/heartbeat/extra", "{}", 1, ev) == DecodeError::bad_topic);
  CHECK(dec.decode("uplink//heartbeat", "{}", 1, ev) == DecodeError::bad_topic);

  CHECK(dec.decode("uplink/gw-1/heartbeat", "{\"battery_v\":\"abc\",\"rssi\":-70}", 1, ev, &detail) == DecodeError::malformed_payload);
  CHECK(detail == "invalid battery_v");
  CHECK(dec.decode("uplink/gw-1/smoke_alarm", "{\"severity\":\"high\"}", 1, ev, &detail) == DecodeError::malformed_payload);
  CHECK(detail == "missing sensor");
  CHECK(dec.decode("uplink/gw-1/smoke_alarm", "{\"sensor\":\"s-1\",\"severity\":\"loud\"}", 1, ev) == DecodeError::malformed_payload);
  CHECK(dec.decode("uplink/gw-1/power_on", "[1,2]", 1, ev) == DecodeError::malformed_payload);
  return true;
}

bool test_tracker_heartbeat_sweep_low_battery_and_delete() {
  Config cfg;
  cfg.heartbeat_staleness_ms = 5000;
  DeviceStateTracker tracker(cfg);
  MessageDecoder dec;
  DeviceEvent ev;

  CHECK(dec.decode("uplink/gw-1/smoke_register", "{\"sensor\":\"s-1\",\"fw\":\"1.2\"}", 1000, ev) == DecodeError::none);
  DeviceUpdate u = tracker.applyEvent(ev);
  CHECK(u.created);
  CHECK(u.state.kind == DeviceKind::sensor);
  CHECK(u.state.registered);
  CHECK(u.state.status == DeviceStatus::online);
  CHECK(u.statusChanged());
  CHECK(u.gateway.id == "gw-1");
  CHECK(u.gatewayStatusChanged());
  CHECK(tracker.size() == 2);

  CHECK(dec.decode("uplink/gw-1/heartbeat", "{\"battery_v\":3.0,\"rssi\":-60}", 3000, ev) == DecodeError::none);
  u = tracker.applyEvent(ev);
  CHECK(!u.statusChanged());
  CHECK(u.state.last_heartbeat_ms == 3000);

  // s-1 last heard at 1000, gw-1 at 3000.
  CHECK(tracker.sweep(5999).empty());
  std::vector<DeviceState> off = tracker.sweep(6000);
  CHECK(off.size() == 1);
  CHECK(off[0].id == "s-1");
  CHECK(off[0].status == DeviceStatus::offline);
  CHECK(tracker.sweep(6500).empty());
  off = tracker.sweep(8000);
  CHECK(off.size() == 1 && off[0].id == "gw-1");

  CHECK(dec.decode("uplink/gw-1/low_battery", "{\"sensor\":\"s-1\",\"battery_v\":2.1}", 9000, ev) == DecodeError::none);
  u = tracker.applyEvent(ev);
  CHECK(u.low_battery);
  CHECK(u.state.low_battery);
  CHECK(u.previous == DeviceStatus::offline);
  CHECK(u.state.status == DeviceStatus::online);

  CHECK(dec.decode("uplink/gw-1/delete_response", "{\"sensor\":\"s-1\",\"ok\":false}", 9100, ev) == DecodeError::none);
  u = tracker.applyEvent(ev);
  CHECK(!u.removed);
  DeviceState st;
  CHECK(tracker.find("s-1", st));

  CHECK(dec.decode("uplink/gw-1/delete_response", "{\"sensor\":\"s-1\"}", 9200, ev) == DecodeError::none);
  u = tracker.applyEvent(ev);
  CHECK(u.removed);
  CHECK(!tracker.find("s-1", st));
  CHECK(tracker.size() == 1);
  return true;
}

bool test_state_machine_coalesces_and_guards_transitions() {
  Config cfg;
  AlarmStateMachine alarms(cfg);

  AlarmTransition t = alarms.trigger("s-1", "gw-1", Severity::medium, 100);
  CHECK(t.status == TransitionStatus::ok);
  CHECK(t.fanout == FanOut::base);
  CHECK(t.has_envelope && t.envelope.event_type == "incident_triggered");
  const uint32_t id = t.incident.id;

  t = alarms.trigger("s-1", "gw-1", Severity::low, 200);
  CHECK(t.status == TransitionStatus::coalesced);
  CHECK(t.incident.id == id);
  CHECK(t.incident.trigger_count == 2);
  CHECK(!t.has_envelope);
  CHECK(t.fanout == FanOut::none);

  t = alarms.trigger("s-1", "gw-1", Severity::critical, 300);
  CHECK(t.status == TransitionStatus::coalesced);
  CHECK(t.incident.severity == Severity::critical);
  CHECK(t.has_envelope && t.envelope.event_type == "incident_updated");
  CHECK(t.fanout == FanOut::base);

  t = alarms.acknowledge(id, "alice", 400);
  CHECK(t.status == TransitionStatus::ok);
  CHECK(t.incident.state == IncidentState::acknowledged);
  CHECK(t.incident.acknowledged_by == "alice");
  CHECK(contains(t.envelope.payload, "\"acknowledged_by\":\"alice\""));

  CHECK(alarms.acknowledge(id, "bob", 500).status == TransitionStatus::invalid_transition);
  CHECK(alarms.escalate(id, 500).status == TransitionStatus::invalid_transition);
  CHECK(alarms.acknowledge(999, "bob", 500).status == TransitionStatus::not_found);

  t = alarms.resolve(id, 600);
  CHECK(t.status == TransitionStatus::ok);
  CHECK(t.has_envelope && t.envelope.event_type == "incident_resolved");
  t = alarms.resolve(id, 700);
  CHECK(t.status == TransitionStatus::ok);
  CHECK(!t.has_envelope);
  CHECK(t.incident.resolved_ms == 600);
  CHECK(alarms.resolve(999, 700).status == TransitionStatus::not_found);

  uint32_t open = 0;
  CHECK(!alarms.openIncidentFor("s-1", open));
  t = alarms.trigger("s-1", "gw-1", Severity::low, 800);
  CHECK(t.status == TransitionStatus::ok);
  CHECK(t.incident.id != id);
  CHECK(alarms.openIncidents().size() == 1);

  CHECK(alarms.pruneResolved(900, 1000).empty());
  const std::vector<uint32_t> pruned = alarms.pruneResolved(1600, 1000);
  CHECK(pruned.size() == 1 && pruned[0] == id);
  AlarmIncident inc;
  CHECK(!alarms.find(id, inc));
  return true;
}

bool test_escalation_raises_severity_once_ack_window_lapses() {
  Config cfg;
  cfg.ack_timeout_ms = 1000;
  AlarmStateMachine alarms(cfg);

  const uint32_t id = alarms.trigger("s-1", "gw-1", Severity::critical, 0xFFFFFF00u).incident.id;
  CHECK(alarms.dueForEscalation(0xFFFFFF00u + 999u).empty());
  const std::vector<uint32_t> due = alarms.dueForEscalation(0xFFFFFF00u + 1000u);
  CHECK(due.size() == 1 && due[0] == id);

  const AlarmTransition t = alarms.escalate(id, 0x100);
  CHECK(t.status == TransitionStatus::ok);
  CHECK(t.fanout == FanOut::escalation);
  CHECK(t.incident.severity == Severity::critical);
  CHECK(t.incident.state == IncidentState::escalated);
  CHECK(alarms.dueForEscalation(0x200).empty());
  return true;
}

bool test_router_widens_audience_by_severity_and_orders_by_id() {
  Config cfg;
  InMemoryDirectory dir;
  CHECK(seedDirectory(dir));
  ScriptedTransport transport;
  DeliveryDispatcher dispatcher(cfg, transport);
  NotificationRouter router(cfg, dir, dispatcher);

  AlarmIncident inc;
  inc.id = 7;
  inc.sensor_id = "s-1";
  inc.gateway_id = "gw-1";
  inc.severity = Severity::medium;

  std::vector<NotificationTask> tasks;
  House site;
  CHECK(router.route(inc, tasks, &site) == RouteError::none);
  CHECK(site.id == "H1");
  CHECK(tasks.size() == 2);
  CHECK(tasks[0].recipient_id == "u1" && tasks[1].recipient_id == "u2");
  CHECK(tasks[0].channel == Channel::push);
  CHECK(tasks[0].tier == Tier::base);

  inc.severity = Severity::high;
  CHECK(router.route(inc, tasks) == RouteError::none);
  CHECK(tasks.size() == 3);
  CHECK(tasks[0].recipient_id == "e1");
  CHECK(tasks[0].channel == Channel::sms);

  std::vector<NotificationTask> again;
  CHECK(router.route(inc, again) == RouteError::none);
  CHECK(again.size() == tasks.size());
  for (size_t i = 0; i < again.size(); ++i) CHECK(again[i].recipient_id == tasks[i].recipient_id);

  inc.state = IncidentState::escalated;
  CHECK(router.route(inc, tasks) == RouteError::none);
  CHECK(tasks.size() == 4);
  CHECK(tasks[2].recipient_id == "u1");
  CHECK(tasks[1].recipient_id == "n1");
  CHECK(tasks[1].tier == Tier::escalation);

  inc.gateway_id = "gw-unbound";
  CHECK(router.route(inc, tasks) == RouteError::unknown_location);
  CHECK(tasks.empty());

  Recipient mute;
  CHECK(NotificationRouter::pickChannel(mute) == Channel::none);
  mute.has_email = true;
  mute.has_sms = true;
  CHECK(NotificationRouter::pickChannel(mute) == Channel::sms);
  return true;
}

bool test_dispatch_retries_transient_then_succeeds_and_ack_closes() {
  Config cfg;
  InMemoryDirectory dir;
  CHECK(seedDirectory(dir));
  ScriptedTransport transport;
  transport.script("u1", {PushResult::transient_error, PushResult::transient_error, PushResult::success});
  RecordingSink sink;
  AlarmPipeline pipeline(cfg, dir, transport, &sink);

  const IngestReport r = pipeline.ingest("uplink/gw-1/smoke_alarm", "{\"sensor\":\"s-1\",\"severity\":\"medium\"}", 1000);
  CHECK(r.decoded());
  CHECK(r.incident);
  CHECK(r.transition.status == TransitionStatus::ok);
  CHECK(r.fanout.attempted);
  CHECK(r.fanout.queued == 2);
  const uint32_t id = r.transition.incident.id;

  DeliveryDispatcher& d = pipeline.dispatcher();
  CHECK(drain(d, 1000) == 2);
  uint32_t wait = 0;
  CHECK(d.nextDueIn(1000, wait) && wait == cfg.delivery_backoff_base_ms);
  CHECK(drain(d, 1999) == 0);
  CHECK(drain(d, 2000) == 1);
  CHECK(drain(d, 3999) == 0);
  CHECK(drain(d, 4000) == 1);
  CHECK(!d.nextDueIn(4000, wait));

  DeliveryOutcome o;
  CHECK(d.outcome("u1", id, o));
  CHECK(o.status == DeliveryStatus::sent);
  CHECK(o.attempts == 3);
  CHECK(o.last_error.empty());
  CHECK(d.outcome("u2", id, o));
  CHECK(o.status == DeliveryStatus::sent);
  CHECK(o.attempts == 1);
  CHECK(transport.calls("u1") == 3);
  CHECK(contains(transport.lastPayload(), "\"attempt\":3"));

  const std::vector<AuditRecord> audit = d.auditFor("u1", id);
  CHECK(audit.size() == 3);
  CHECK(audit[0].result == AttemptResult::transient_error && audit[0].detail == "http 503");
  CHECK(audit[2].result == AttemptResult::sent && audit[2].attempt == 3);
  CHECK(sink.audits.size() == 4);

  const DeliveryDispatcher::Stats s = d.stats();
  CHECK(s.sent == 2 && s.queued == 0 && s.attempts == 4 && s.retries == 2);

  const AlarmTransition ack = pipeline.acknowledge(id, "u1", 5000);
  CHECK(ack.status == TransitionStatus::ok);
  CHECK(!sink.incidents.empty() && sink.incidents.back().state == IncidentState::acknowledged);

  CHECK(pipeline.tick(5000).swept);
  const TickReport late = pipeline.tick(1000 + cfg.ack_timeout_ms + cfg.sweep_period_ms);
  CHECK(late.swept);
  CHECK(late.escalated.empty());
  return true;
}

bool test_unacknowledged_incident_escalates_without_duplicate_delivery() {
  Config cfg;
  InMemoryDirectory dir;
  CHECK(seedDirectory(dir));
  ScriptedTransport transport;
  AlarmPipeline pipeline(cfg, dir, transport);

  const IngestReport r = pipeline.ingest("uplink/gw-1/smoke_alarm", "{\"sensor\":\"s-9\",\"severity\":\"high\"}", 1000);
  CHECK(r.fanout.queued == 3);
  const uint32_t id = r.transition.incident.id;
  CHECK(drain(pipeline.dispatcher(), 1000) == 3);

  CHECK(pipeline.tick(1000).escalated.empty());
  CHECK(!pipeline.tick(1001).swept);

  const TickReport t = pipeline.tick(1000 + cfg.ack_timeout_ms);
  CHECK(t.swept);
  CHECK(t.escalated.size() == 1);
  CHECK(t.escalated[0].incident.id == id);
  CHECK(t.escalated[0].incident.severity == Severity::critical);
  CHECK(t.escalation_fanout.size() == 1);
  CHECK(t.escalation_fanout[0].queued == 1);

  DeliveryOutcome o;
  CHECK(pipeline.dispatcher().outcome("n1", id, o));
  CHECK(o.status == DeliveryStatus::pending);
  CHECK(!pipeline.dispatcher().outcome("far", id, o));

  std::vector<NotificationTask> tasks;
  AlarmIncident inc;
  CHECK(pipeline.alarms().find(id, inc));
  CHECK(pipeline.router().route(inc, tasks) == RouteError::none);
  CHECK(tasks.empty());

  CHECK(pipeline.tick(1000 + cfg.ack_timeout_ms + 2 * cfg.sweep_period_ms).escalated.empty());
  CHECK(pipeline.escalate(id, 200000).status == TransitionStatus::invalid_transition);
  CHECK(transport.calls("u1") == 1);
  return true;
}

bool test_resolve_cancels_unstarted_escalation_deliveries() {
  Config cfg;
  InMemoryDirectory dir;
  CHECK(seedDirectory(dir));
  ScriptedTransport transport;
  RecordingSink sink;
  AlarmPipeline pipeline(cfg, dir, transport, &sink);

  const uint32_t id = pipeline.ingest("uplink/gw-1/smoke_alarm", "{\"sensor\":\"s-1\",\"severity\":\"high\"}", 0)
                          .transition.incident.id;
  CHECK(drain(pipeline.dispatcher(), 0) == 3);

  FanOutReport fan;
  CHECK(pipeline.escalate(id, 10, &fan).status == TransitionStatus::ok);
  CHECK(fan.queued == 1);

  size_t cancelled = 0;
  const AlarmTransition t = pipeline.resolve(id, 20, &cancelled);
  CHECK(t.status == TransitionStatus::ok);
  CHECK(cancelled == 1);

  DeliveryOutcome o;
  CHECK(pipeline.dispatcher().outcome("n1", id, o));
  CHECK(o.status == DeliveryStatus::cancelled);
  CHECK(o.last_error == "Cancelled");
  CHECK(pipeline.dispatcher().outcome("u1", id, o));
  CHECK(o.status == DeliveryStatus::sent);
  CHECK(drain(pipeline.dispatcher(), 100) == 0);
  CHECK(transport.calls("n1") == 0);
  CHECK(!sink.audits.empty() && sink.audits.back().result == AttemptResult::cancelled);

  cancelled = 7;
  CHECK(pipeline.resolve(id, 30, &cancelled).status == TransitionStatus::ok);
  CHECK(cancelled == 0);
  return true;
}

bool test_permanent_failure_and_exhausted_retries_are_terminal() {
  Config cfg;
  cfg.delivery_max_attempts = 4;
  cfg.delivery_backoff_base_ms = 1000;
  ScriptedTransport transport;
  transport.script("gone", {PushResult::permanent_error});
  transport.script("flaky", {PushResult::transient_error, PushResult::transient_error,
                             PushResult::transient_error, PushResult::transient_error});
  DeliveryDispatcher d(cfg, transport);

  CHECK(d.dispatch(makeTask("gone", 1, Channel::push), 0) == AdmitResult::queued);
  CHECK(d.dispatch(makeTask("gone", 1, Channel::push), 0) == AdmitResult::duplicate);
  DeliveryOutcome o;
  CHECK(d.workOnce(0, &o));
  CHECK(o.status == DeliveryStatus::failed);
  CHECK(o.last_error == "http 410");
  CHECK(!d.workOnce(100000));
  CHECK(transport.calls("gone") == 1);

  CHECK(d.dispatch(makeTask("flaky", 2, Channel::push), 0) == AdmitResult::queued);
  CHECK(drain(d, 0) == 1);
  CHECK(drain(d, 1000) == 1);
  CHECK(drain(d, 2999) == 0);
  CHECK(drain(d, 3000) == 1);
  CHECK(drain(d, 7000) == 1);
  CHECK(d.outcome("flaky", 2, o));
  CHECK(o.status == DeliveryStatus::failed);
  CHECK(o.attempts == 4);
  CHECK(drain(d, 60000) == 0);
  CHECK(d.failures().size() == 2);

  // A failed pair may be admitted again; a pending or sent one may not.
  CHECK(d.dispatch(makeTask("flaky", 2, Channel::push), 70000) == AdmitResult::queued);
  CHECK(d.hasPendingOrSent("flaky", 2));

  CHECK(d.dispatch(makeTask("mute", 3, Channel::none), 0) == AdmitResult::no_channel);
  CHECK(d.outcome("mute", 3, o));
  CHECK(o.status == DeliveryStatus::failed && o.last_error == "NoChannel");
  CHECK(d.auditFor("mute", 3).size() == 1);
  CHECK(d.auditFor("mute", 3)[0].result == AttemptResult::no_channel);
  CHECK(transport.calls("mute") == 0);
  return true;
}

bool test_backoff_doubles_caps_and_survives_wraparound() {
  Config cfg;
  cfg.delivery_backoff_base_ms = 1000;
  cfg.delivery_max_backoff_ms = 30000;
  ScriptedTransport transport;
  transport.script("r", {PushResult::transient_error});
  DeliveryDispatcher d(cfg, transport);

  CHECK(d.backoffFor(1) == 1000);
  CHECK(d.backoffFor(2) == 2000);
  CHECK(d.backoffFor(5) == 16000);
  CHECK(d.backoffFor(6) == 30000);
  CHECK(d.backoffFor(200) == 30000);

  const uint32_t start = 0xFFFFFE00u;
  CHECK(d.dispatch(makeTask("r", 1, Channel::push), start) == AdmitResult::queued);
  CHECK(d.workOnce(start));
  CHECK(!d.workOnce(start + 999u));
  CHECK(d.workOnce(start + 1000u));
  DeliveryOutcome o;
  CHECK(d.outcome("r", 1, o) && o.status == DeliveryStatus::sent);

  CHECK(reached(start + 1000u, start + 1000u));
  CHECK(reached(0x10u, 0xFFFFFFF0u));
  CHECK(!reached(0xFFFFFFF0u, 0x10u));
  CHECK(!reached(start, start + 1u));
  return true;
}

bool test_concurrent_workers_deliver_each_task_once() {
  Config cfg;
  ScriptedTransport transport;
  DeliveryDispatcher d(cfg, transport);

  const int kTasks = 200;
  for (int i = 0; i < kTasks; ++i) {
    CHECK(d.dispatch(makeTask("r" + std::to_string(i), 1, Channel::push), 0) == AdmitResult::queued);
  }

  std::vector<std::thread> workers;
  for (int w = 0; w < 4; ++w) {
    workers.push_back(std::thread([&d]() {
      while (d.workOnce(0)) {
      }
    }));
  }
  for (std::thread& t : workers) t.join();

  for (int i = 0; i < kTasks; ++i) CHECK(transport.calls("r" + std::to_string(i)) == 1);
  const DeliveryDispatcher::Stats s = d.stats();
  CHECK(s.sent == (uint32_t)kTasks);
  CHECK(s.in_flight == 0);
  return true;
}

bool test_concurrent_ingest_keeps_per_device_state() {
  Config cfg;
  InMemoryDirectory dir;
  CHECK(seedDirectory(dir));
  ScriptedTransport transport;
  AlarmPipeline pipeline(cfg, dir, transport);

  std::vector<std::thread> gateways;
  for (int g = 0; g < 4; ++g) {
    gateways.push_back(std::thread([&pipeline, g]() {
      const std::string topic = "uplink/gw-" + std::to_string(g) + "/heartbeat";
      for (int i = 0; i < 100; ++i) {
        pipeline.ingest(topic, "{\"sensor\":\"s-" + std::to_string(g) + "\",\"battery_v\":3.0,\"rssi\":-50}",
                        (uint32_t)(i + 1));
      }
    }));
  }
  for (std::thread& t : gateways) t.join();

  CHECK(pipeline.tracker().size() == 8);
  DeviceState st;
  for (int g = 0; g < 4; ++g) {
    CHECK(pipeline.tracker().find("s-" + std::to_string(g), st));
    CHECK(st.gateway_id == "gw-" + std::to_string(g));
    CHECK(st.status == DeviceStatus::online);
  }
  return true;
}

bool test_stalled_client_is_bounded_and_others_keep_up() {
  Config cfg;
  cfg.connection_queue_depth = 16;
  BroadcastHub hub(cfg);

  std::vector<std::shared_ptr<RecordingChannel>> channels;
  std::vector<uint32_t> ids;
  for (int i = 0; i < 1000; ++i) {
    std::shared_ptr<RecordingChannel> ch = std::make_shared<RecordingChannel>();
    channels.push_back(ch);
    ids.push_back(hub.connect(Scope(), ch));
  }
  channels[500]->open = false;
  CHECK(hub.connectionCount() == 1000);

  for (int i = 0; i < 50; ++i) {
    BroadcastEnvelope env;
    env.event_type = "device_status";
    env.timestamp_ms = (uint32_t)i;
    CHECK(hub.broadcast(env) == 1000);
    hub.pump(8);
  }

  size_t depth = 0;
  uint32_t drops = 0;
  CHECK(hub.queueDepth(ids[500], depth));
  CHECK(depth == 16);
  CHECK(hub.backpressureOf(ids[500], drops));
  CHECK(drops == 34);
  CHECK(channels[500]->frames.empty());

  CHECK(hub.queueDepth(ids[0], depth) && depth == 0);
  CHECK(channels[0]->frames.size() == 50);
  CHECK(channels[999]->frames.size() == 50);
  CHECK(contains(channels[0]->frames.back(), "\"ts\":49"));

  // The stalled client resumes with the 16 newest frames.
  channels[500]->open = true;
  hub.pump(100);
  CHECK(channels[500]->frames.size() == 16);
  CHECK(contains(channels[500]->frames.front(), "\"ts\":34"));

  const BroadcastHub::Stats s = hub.stats();
  CHECK(s.backpressure_drops == 34);
  CHECK(s.broadcasts == 50);
  return true;
}

bool test_scope_filtering_and_connection_lifecycle() {
  Config cfg;
  BroadcastHub hub(cfg);

  Scope tenant1;
  tenant1.tenant_id = "T1";
  Scope house2;
  house2.house_id = "H2";
  std::shared_ptr<RecordingChannel> a = std::make_shared<RecordingChannel>();
  std::shared_ptr<RecordingChannel> b = std::make_shared<RecordingChannel>();
  std::shared_ptr<RecordingChannel> c = std::make_shared<RecordingChannel>();
  const uint32_t ida = hub.connect(tenant1, a);
  const uint32_t idb = hub.connect(house2, b);
  hub.connect(Scope(), c);

  BroadcastEnvelope env;
  env.event_type = "incident_triggered";
  env.scope.tenant_id = "T1";
  env.scope.house_id = "H1";
  CHECK(hub.broadcast(env) == 2);

  Scope otherHouse;
  otherHouse.house_id = "H2";
  CHECK(hub.broadcast(env, otherHouse) == 0);

  BroadcastEnvelope global;
  global.event_type = "device_status";
  Scope tenant2;
  tenant2.tenant_id = "T2";
  CHECK(hub.broadcast(global, tenant2) == 1);

  CHECK(hub.pump(10) == 3);
  CHECK(a->frames.size() == 1);
  CHECK(b->frames.empty());
  CHECK(c->frames.size() == 2);

  CHECK(hub.subscribe(idb, tenant1));
  CHECK(hub.broadcast(env) == 3);

  CHECK(hub.disconnect(ida));
  CHECK(!hub.disconnect(ida));
  CHECK(!hub.subscribe(ida, tenant1));
  CHECK(hub.connectionCount() == 2);

  hub.shutdown();
  CHECK(hub.connectionCount() == 0);
  CHECK(hub.broadcast(env) == 0);
  return true;
}

bool test_parse_scope_accepts_tenant_and_house_tokens() {
  Scope s;
  CHECK(parseScope("tenant=T1 house=H1", s));
  CHECK(s.tenant_id == "T1" && s.house_id == "H1");
  CHECK(parseScope("  house=H2\n", s));
  CHECK(s.tenant_id.empty() && s.house_id == "H2");
  CHECK(!parseScope("", s));
  CHECK(!parseScope("tenant=", s));
  CHECK(!parseScope("color=red", s));
  CHECK(!parseScope("tenant", s));
  CHECK(s.house_id == "H2");
  return true;
}

bool test_pipeline_publishes_scoped_frames_and_offline_sweep() {
  Config cfg;
  cfg.heartbeat_staleness_ms = 60000;
  InMemoryDirectory dir;
  CHECK(seedDirectory(dir));
  ScriptedTransport transport;
  RecordingSink sink;
  AlarmPipeline pipeline(cfg, dir, transport, &sink);

  Scope t1;
  t1.tenant_id = "T1";
  Scope t2;
  t2.tenant_id = "T2";
  std::shared_ptr<RecordingChannel> mine = std::make_shared<RecordingChannel>();
  std::shared_ptr<RecordingChannel> theirs = std::make_shared<RecordingChannel>();
  pipeline.hub().connect(t1, mine);
  pipeline.hub().connect(t2, theirs);

  IngestReport r = pipeline.ingest("uplink/gw-1/smoke_alarm", "{\"sensor\":\"s-1\"}", 1000);
  CHECK(r.decoded());
  CHECK(r.transition.incident.severity == cfg.default_smoke_severity);
  CHECK(r.broadcasts == 3);
  pipeline.hub().pump(10);
  CHECK(mine->frames.size() == 3);
  CHECK(contains(mine->frames.back(), "\"type\":\"incident_triggered\""));
  CHECK(theirs->frames.empty());
  CHECK(sink.devices.size() == 2);
  CHECK(sink.incidents.size() == 1);

  // Same sensor again: coalesced, nothing new routed.
  r = pipeline.ingest("uplink/gw-1/smoke_alarm", "{\"sensor\":\"s-1\",\"severity\":\"low\"}", 2000);
  CHECK(r.transition.status == TransitionStatus::coalesced);
  CHECK(!r.fanout.attempted);
  CHECK(r.broadcasts == 0);

  r = pipeline.ingest("uplink/gw-1/low_battery", "{\"sensor\":\"s-1\",\"battery_v\":2.0}", 3000);
  CHECK(r.device.low_battery);
  CHECK(r.broadcasts == 1);
  pipeline.hub().pump(10);
  CHECK(contains(mine->frames.back(), "device_low_battery"));

  r = pipeline.ingest("uplink/gw-1/heartbeat", "oops", 3000);
  CHECK(r.decode == DecodeError::malformed_payload);

  CHECK(pipeline.tick(3000).offline.empty());
  const TickReport t = pipeline.tick(63000);
  CHECK(t.offline.size() == 2);
  CHECK(t.offline[0].id == "gw-1");
  CHECK(t.offline[1].id == "s-1");
  pipeline.hub().pump(10);
  CHECK(contains(mine->frames.back(), "\"status\":\"offline\""));
  CHECK(sink.devices.back().status == DeviceStatus::offline);

  CHECK(pipeline.triggerTest("nope", Severity::low, 64000).status == TransitionStatus::not_found);
  CHECK(pipeline.triggerTest("gw-1", Severity::low, 64000).status == TransitionStatus::not_found);
  return true;
}

bool test_resolved_incidents_are_pruned_after_retention() {
  Config cfg;
  cfg.resolved_retention_ms = 5000;
  InMemoryDirectory dir;
  CHECK(seedDirectory(dir));
  ScriptedTransport transport;
  AlarmPipeline pipeline(cfg, dir, transport);

  const uint32_t id = pipeline.ingest("uplink/gw-2/smoke_alarm", "{\"sensor\":\"s-5\",\"severity\":\"low\"}", 0)
                          .transition.incident.id;
  CHECK(pipeline.resolve(id, 100).status == TransitionStatus::ok);
  CHECK(pipeline.tick(200).pruned.empty());
  const TickReport t = pipeline.tick(200 + cfg.sweep_period_ms);
  CHECK(t.pruned.size() == 1 && t.pruned[0] == id);
  AlarmIncident inc;
  CHECK(!pipeline.alarms().find(id, inc));
  CHECK(pipeline.dispatcher().outcomesFor(id).empty());
  return true;
}

bool test_command_parser_reads_operator_lines() {
  OperatorCommand c;
  CHECK(parseCommand("mock uplink/gw-1/smoke_alarm {\"sensor\": \"s-1\"}  ", c) == CommandError::none);
  CHECK(c.kind == CommandKind::mock);
  CHECK(c.topic == "uplink/gw-1/smoke_alarm");
  CHECK(c.body == "{\"sensor\": \"s-1\"}");

  CHECK(parseCommand("TEST s-1 Critical", c) == CommandError::none);
  CHECK(c.kind == CommandKind::test && c.sensor_id == "s-1");
  CHECK(c.has_severity && c.severity == Severity::critical);

  CHECK(parseCommand("ack 12 alice", c) == CommandError::none);
  CHECK(c.incident_id == 12 && c.user_id == "alice");
  CHECK(parseCommand("resolve 3", c) == CommandError::none && c.kind == CommandKind::resolve);
  CHECK(parseCommand("set ACK_TIMEOUT_MS 5000", c) == CommandError::none);
  CHECK(c.key == "ack_timeout_ms" && c.value == "5000");
  CHECK(parseCommand("?", c) == CommandError::none && c.kind == CommandKind::help);

  CHECK(parseCommand("   ", c) == CommandError::empty);
  CHECK(parseCommand("reboot", c) == CommandError::unknown_command);
  CHECK(parseCommand("ack 12", c) == CommandError::missing_argument);
  CHECK(parseCommand("ack 0 alice", c) == CommandError::bad_argument);
  CHECK(parseCommand("escalate 99999999999", c) == CommandError::bad_argument);
  CHECK(parseCommand("test s-1 loud", c) == CommandError::bad_argument);
  CHECK(parseCommand("mock uplink/gw-1/heartbeat", c) == CommandError::missing_argument);
  CHECK(parseCommand("status now", c) == CommandError::bad_argument);
  return true;
}

bool test_operator_console_drives_pipeline_and_stages_config() {
  Config cfg;
  InMemoryDirectory dir;
  CHECK(seedDirectory(dir));
  ScriptedTransport transport;
  AlarmPipeline pipeline(cfg, dir, transport);
  MemorySettings settings;
  OperatorConsole console(pipeline, cfg, &settings);

  CommandAck a = console.handle("mock uplink/gw-1/smoke_alarm {\"sensor\":\"s-1\",\"severity\":\"medium\"}", 1000);
  CHECK(a.ok);
  CHECK(a.cmd == "mock");
  CHECK(contains(a.detail, "incident=1"));
  CHECK(contains(a.detail, "queued=2"));

  a = console.handle("test s-1 critical", 1100);
  CHECK(a.ok && contains(a.detail, "coalesced"));
  CHECK(contains(a.detail, "severity=critical"));

  a = console.handle("ack 1 alice", 1200);
  CHECK(a.ok && contains(a.detail, "state=acknowledged"));
  a = console.handle("escalate 1", 1300);
  CHECK(!a.ok && a.detail == "invalid_transition state=acknowledged");
  a = console.handle("resolve 1", 1400);
  CHECK(a.ok && contains(a.detail, "state=resolved"));
  a = console.handle("ack 42 bob", 1500);
  CHECK(!a.ok && a.detail == "not_found");

  a = console.handle("status", 1600);
  CHECK(a.ok && contains(a.detail, "open=0"));
  CHECK(contains(a.detail, "ack_timeout_ms=120000"));

  a = console.handle("set ack_timeout_ms 60000", 1700);
  CHECK(a.ok);
  CHECK(console.staged().ack_timeout_ms == 60000);
  CHECK(cfg.ack_timeout_ms == 120000);
  CHECK(settings.saved["ack_timeout_ms"] == "60000");

  a = console.handle("set ack_timeout_ms soon", 1800);
  CHECK(!a.ok && a.detail == "bad_value ack_timeout_ms");
  a = console.handle("set volume 11", 1800);
  CHECK(!a.ok && a.detail == "unknown_key volume");
  settings.fail = true;
  a = console.handle("set sweep_period_ms 500", 1800);
  CHECK(!a.ok && a.detail == "persist_failed sweep_period_ms");

  a = console.handle("mock uplink/gw-1/bogus {}", 1900);
  CHECK(!a.ok && a.detail == "unknown_kind: bogus");
  a = console.handle("launch", 1900);
  CHECK(!a.ok && a.cmd == "parse" && a.detail == "unknown_command");
  a = console.handle("test ghost", 1900);
  CHECK(!a.ok && a.detail == "not_found");
  return true;
}

bool test_config_overrides_validate_values() {
  Config cfg;
  CHECK(applyConfigOverride(cfg, "ack_timeout_ms", "30000") == ConfigError::none);
  CHECK(cfg.ack_timeout_ms == 30000);
  CHECK(applyConfigOverride(cfg, "default_smoke_severity", "critical") == ConfigError::none);
  CHECK(cfg.default_smoke_severity == Severity::critical);
  CHECK(applyConfigOverride(cfg, "connection_queue_depth", "64") == ConfigError::none);
  CHECK(cfg.connection_queue_depth == 64);

  CHECK(applyConfigOverride(cfg, "ack_timeout_ms", "12x") == ConfigError::bad_value);
  CHECK(applyConfigOverride(cfg, "ack_timeout_ms", "-5") == ConfigError::bad_value);
  CHECK(applyConfigOverride(cfg, "ack_timeout_ms", "") == ConfigError::bad_value);
  CHECK(applyConfigOverride(cfg, "delivery_max_attempts", "0") == ConfigError::bad_value);
  CHECK(applyConfigOverride(cfg, "dispatch_workers", "99") == ConfigError::bad_value);
  CHECK(applyConfigOverride(cfg, "default_smoke_severity", "loud") == ConfigError::bad_value);
  CHECK(applyConfigOverride(cfg, "colour", "red") == ConfigError::unknown_key);
  CHECK(cfg.ack_timeout_ms == 30000);
  CHECK(cfg.default_smoke_severity == Severity::critical);

  const std::string d = describeConfig(cfg);
  CHECK(contains(d, "ack_timeout_ms=30000;"));
  CHECK(contains(d, "default_smoke_severity=critical"));
  return true;
}

bool test_directory_messages_and_push_status_mapping() {
  InMemoryDirectory dir;
  CHECK(seedDirectory(dir));
  CHECK(dir.recipientCount() == 5);
  CHECK(dir.applyMessage("firehub/dir/recipient/x", "{\"lat\":95.0,\"lon\":7.0}") == DirectoryError::malformed_payload);
  CHECK(dir.applyMessage("firehub/dir/recipient/x", "{\"lat\":45.0,\"lon\":7.0,\"role\":\"chef\"}") == DirectoryError::malformed_payload);
  CHECK(dir.applyMessage("firehub/dir/gateway/gw-9", "{}") == DirectoryError::malformed_payload);
  CHECK(dir.applyMessage("firehub/dir/planet/x", "{}") == DirectoryError::bad_topic);
  CHECK(dir.applyMessage("firehub/dir/recipient/far", "") == DirectoryError::none);
  CHECK(dir.recipientCount() == 4);

  House h;
  CHECK(dir.houseForGateway("gw-2", h) && h.tenant_id == "T2");
  CHECK(dir.applyMessage("firehub/dir/house/H2", "") == DirectoryError::none);
  CHECK(!dir.houseForGateway("gw-2", h));

  GeoPoint a;
  a.lat = 45.0;
  a.lon = 7.0;
  GeoPoint b = a;
  b.lat = 45.0036;
  const double m = distanceMeters(a, b);
  CHECK(m > 390.0 && m < 410.0);

  CHECK(classifyPushStatus(200) == PushResult::success);
  CHECK(classifyPushStatus(204) == PushResult::success);
  CHECK(classifyPushStatus(400) == PushResult::permanent_error);
  CHECK(classifyPushStatus(404) == PushResult::permanent_error);
  CHECK(classifyPushStatus(408) == PushResult::transient_error);
  CHECK(classifyPushStatus(429) == PushResult::transient_error);
  CHECK(classifyPushStatus(503) == PushResult::transient_error);
  CHECK(classifyPushStatus(-1) == PushResult::transient_error);
  return true;
}

bool test_state_documents_render_expected_fields() {
  DeviceState st;
  st.id = "s-1";
  st.kind = DeviceKind::sensor;
  st.gateway_id = "gw-1";
  st.status = DeviceStatus::online;
  st.battery_v = 2.954f;
  const std::string dev = toJson(st);
  CHECK(contains(dev, "\"id\":\"s-1\""));
  CHECK(contains(dev, "\"battery_v\":2.95"));
  CHECK(contains(dev, "\"registered\":false"));

  AuditRecord rec;
  rec.recipient_id = "u\"1";
  rec.incident_id = 4;
  rec.result = AttemptResult::permanent_error;
  rec.detail = "http 410";
  const std::string audit = toJson(rec);
  CHECK(contains(audit, "\"recipient\":\"u\\\"1\""));
  CHECK(contains(audit, "\"result\":\"permanent_error\""));

  BroadcastEnvelope env;
  env.event_type = "incident_resolved";
  env.timestamp_ms = 9;
  CHECK(toFrame(env) == "{\"type\":\"incident_resolved\",\"ts\":9,\"data\":{}}");
  return true;
}

bool test_decoder_rejects_truncated_and_nested_bodies() {
  MessageDecoder dec;
  DeviceEvent ev;
  std::string detail;

  CHECK(dec.decode("uplink/gw-1/smoke_alarm", "{\"sensor\":\"s1\"", 1, ev, &detail) == DecodeError::malformed_payload);
  CHECK(contains(detail, "bad json"));
  CHECK(dec.decode("uplink/gw-1/smoke_alarm", "{\"meta\":{\"sensor\":\"s9\"}}", 1, ev, &detail) == DecodeError::malformed_payload);
  CHECK(detail == "missing sensor");
  CHECK(dec.decode("uplink/gw-1/power_on", "[1,2]", 1, ev, &detail) == DecodeError::malformed_payload);
  CHECK(detail == "body is not an object");

  CHECK(dec.decode("uplink/gw-1/heartbeat", "{\"battery_v\":\"3.1\",\"rssi\":-70}", 1, ev, &detail) == DecodeError::malformed_payload);
  CHECK(detail == "invalid battery_v");
  CHECK(dec.decode("uplink/gw-1/heartbeat", "{\"battery_v\":3.1,\"rssi\":-70.5}", 1, ev, &detail) == DecodeError::malformed_payload);
  CHECK(detail == "invalid rssi");
  CHECK(dec.decode("uplink/gw-1/delete_response", "{\"sensor\":\"s-1\",\"ok\":\"yes\"}", 1, ev, &detail) == DecodeError::malformed_payload);
  CHECK(detail == "invalid ok");

  CHECK(dec.decode("uplink/gw-1/smoke_alarm", " \n{\"sensor\":\"s-1\"}", 1, ev) == DecodeError::none);
  CHECK(ev.sensor_id == "s-1" && !ev.has_severity);

  InMemoryDirectory dir;
  CHECK(dir.applyMessage("firehub/dir/house/H1", "{\"lat\":45.0,\"lon\":7.0") == DirectoryError::malformed_payload);
  CHECK(dir.applyMessage("firehub/dir/house/H1", "{\"pos\":{\"lat\":45.0,\"lon\":7.0}}") == DirectoryError::malformed_payload);
  CHECK(dir.applyMessage("firehub/dir/gateway/gw-1", "{\"house\":7}") == DirectoryError::malformed_payload);
  CHECK(dir.applyMessage("firehub/dir/planet/x", "{") == DirectoryError::bad_topic);
  House h;
  CHECK(!dir.houseForGateway("gw-1", h));
  return true;
}

bool test_escalating_low_incident_widens_to_neighbourhood() {
  Config cfg;
  InMemoryDirectory dir;
  CHECK(seedDirectory(dir));
  ScriptedTransport transport;
  AlarmPipeline pipeline(cfg, dir, transport);

  const IngestReport r = pipeline.ingest("uplink/gw-1/smoke_alarm", "{\"sensor\":\"s-2\",\"severity\":\"low\"}", 0);
  CHECK(r.fanout.queued == 2);
  const uint32_t id = r.transition.incident.id;
  CHECK(drain(pipeline.dispatcher(), 0) == 2);

  FanOutReport fan;
  const AlarmTransition t = pipeline.escalate(id, 10, &fan);
  CHECK(t.status == TransitionStatus::ok);
  CHECK(t.incident.severity == Severity::medium);
  CHECK(fan.queued == 2);

  DeliveryOutcome o;
  CHECK(pipeline.dispatcher().outcome("n1", id, o));
  CHECK(o.status == DeliveryStatus::pending);
  CHECK(pipeline.dispatcher().outcome("e1", id, o));
  CHECK(!pipeline.dispatcher().outcome("far", id, o));
  CHECK(drain(pipeline.dispatcher(), 10) == 2);
  CHECK(transport.calls("n1") == 1);
  return true;
}

bool test_coalesced_raise_into_high_fans_out_once() {
  Config cfg;
  InMemoryDirectory dir;
  CHECK(seedDirectory(dir));
  ScriptedTransport transport;
  AlarmPipeline pipeline(cfg, dir, transport);

  IngestReport r = pipeline.ingest("uplink/gw-1/smoke_alarm", "{\"sensor\":\"s-3\",\"severity\":\"low\"}", 0);
  CHECK(r.fanout.queued == 2);
  const uint32_t id = r.transition.incident.id;

  r = pipeline.ingest("uplink/gw-1/smoke_alarm", "{\"sensor\":\"s-3\",\"severity\":\"critical\"}", 50);
  CHECK(r.transition.status == TransitionStatus::coalesced);
  CHECK(r.transition.incident.id == id);
  CHECK(r.fanout.attempted);
  CHECK(r.fanout.queued == 1);

  DeliveryOutcome o;
  CHECK(pipeline.dispatcher().outcome("e1", id, o));
  CHECK(o.status == DeliveryStatus::pending);
  CHECK(!pipeline.dispatcher().outcome("n1", id, o));

  // Already wide: a further raise only updates.
  AlarmStateMachine alarms(cfg);
  alarms.trigger("s-4", "gw-1", Severity::high, 0);
  const AlarmTransition t = alarms.trigger("s-4", "gw-1", Severity::critical, 10);
  CHECK(t.status == TransitionStatus::coalesced);
  CHECK(t.has_envelope);
  CHECK(t.fanout == FanOut::none);
  return true;
}

bool test_resolve_during_escalation_routing_cancels_late_tasks() {
  Config cfg;
  InMemoryDirectory seeded;
  CHECK(seedDirectory(seeded));
  HookedDirectory dir(seeded);
  ScriptedTransport transport;
  AlarmPipeline pipeline(cfg, dir, transport);

  const uint32_t id = pipeline.ingest("uplink/gw-1/smoke_alarm", "{\"sensor\":\"s-1\",\"severity\":\"high\"}", 0)
                          .transition.incident.id;
  CHECK(drain(pipeline.dispatcher(), 0) == 3);

  size_t cancelledByResolve = 7;
  TransitionStatus resolved = TransitionStatus::not_found;
  dir.onRadiusQuery = [&]() {
    resolved = pipeline.resolve(id, 15, &cancelledByResolve).status;
  };

  FanOutReport fan;
  CHECK(pipeline.escalate(id, 10, &fan).status == TransitionStatus::ok);
  CHECK(resolved == TransitionStatus::ok);
  CHECK(cancelledByResolve == 0);
  CHECK(fan.queued == 1);

  AlarmIncident inc;
  CHECK(pipeline.alarms().find(id, inc) && inc.state == IncidentState::resolved);
  DeliveryOutcome o;
  CHECK(pipeline.dispatcher().outcome("n1", id, o));
  CHECK(o.status == DeliveryStatus::cancelled);
  CHECK(drain(pipeline.dispatcher(), 100) == 0);
  CHECK(transport.calls("n1") == 0);
  return true;
}

bool test_pump_allows_channel_to_query_hub() {
  Config cfg;
  BroadcastHub hub(cfg);
  std::shared_ptr<HubQueryingChannel> ch = std::make_shared<HubQueryingChannel>();
  ch->hub = &hub;
  ch->id = hub.connect(Scope(), ch);

  BroadcastEnvelope env;
  env.event_type = "device_status";
  CHECK(hub.broadcast(env) == 1);
  CHECK(hub.broadcast(env) == 1);

  CHECK(hub.pump(10) == 2);
  CHECK(ch->frames.size() == 2);
  CHECK(ch->lastDepth == 0);
  size_t depth = 9;
  CHECK(hub.queueDepth(ch->id, depth) && depth == 0);
  return true;
}

} // namespace

int main() {
  bool ok = true;

  ok &= test_decoder_accepts_known_kinds_and_reports_bad_input();
  ok &= test_tracker_heartbeat_sweep_low_battery_and_delete();
  ok &= test_state_machine_coalesces_and_guards_transitions();
  ok &= test_escalation_raises_severity_once_ack_window_lapses();
  ok &= test_router_widens_audience_by_severity_and_orders_by_id();
  ok &= test_dispatch_retries_transient_then_succeeds_and_ack_closes();
  ok &= test_unacknowledged_incident_escalates_without_duplicate_delivery();
  ok &= test_resolve_cancels_unstarted_escalation_deliveries();
  ok &= test_permanent_failure_and_exhausted_retries_are_terminal();
  ok &= test_backoff_doubles_caps_and_survives_wraparound();
  ok &= test_concurrent_workers_deliver_each_task_once();
  ok &= test_concurrent_ingest_keeps_per_device_state();
  ok &= test_stalled_client_is_bounded_and_others_keep_up();
  ok &= test_scope_filtering_and_connection_lifecycle();
  ok &= test_parse_scope_accepts_tenant_and_house_tokens();
  ok &= test_pipeline_publishes_scoped_frames_and_offline_sweep();
  ok &= test_resolved_incidents_are_pruned_after_retention();
  ok &= test_command_parser_reads_operator_lines();
  ok &= test_operator_console_drives_pipeline_and_stages_config();
  ok &= test_config_overrides_validate_values();
  ok &= test_directory_messages_and_push_status_mapping();
  ok &= test_state_documents_render_expected_fields();
  ok &= test_decoder_rejects_truncated_and_nested_bodies();
  ok &= test_escalating_low_incident_widens_to_neighbourhood();
  ok &= test_coalesced_raise_into_high_fans_out_once();
  ok &= test_resolve_during_escalation_routing_cancels_late_tasks();
  ok &= test_pump_allows_channel_to_query_hub();

  if (!ok) return 1;

  std::cout << "native_flow tests passed\n";
  return 0;
}
