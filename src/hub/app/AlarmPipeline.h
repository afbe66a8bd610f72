#pragma once
#include <stdint.h>

#include <string>
#include <vector>

#include "app/AlarmStateMachine.h"
#include "app/Config.h"
#include "app/DeviceStateTracker.h"
#include "app/NotificationRouter.h"
#include "app/RecipientDirectory.h"
#include "app/StateSink.h"
#include "pipelines/BroadcastHub.h"
#include "pipelines/DeliveryDispatcher.h"
#include "pipelines/MessageDecoder.h"
#include "pipelines/TimeoutScheduler.h"

// Result of routing one incident into the dispatcher.
struct FanOutReport {
  bool attempted = false;
  RouteError route = RouteError::none;
  size_t queued = 0;
  size_t no_channel = 0;
  size_t duplicate = 0;
};

struct IngestReport {
  DecodeError decode = DecodeError::none;
  std::string detail;

  DeviceEvent event;
  DeviceUpdate device;

  bool incident = false;
  AlarmTransition transition;
  FanOutReport fanout;

  size_t broadcasts = 0;

  bool decoded() const { return decode == DecodeError::none; }
};

struct TickReport {
  bool swept = false;
  std::vector<DeviceState> offline;
  std::vector<AlarmTransition> escalated;
  std::vector<FanOutReport> escalation_fanout;
  std::vector<uint32_t> pruned;
};

// Wires decoder -> tracker -> state machine -> {router -> dispatcher, hub}.
// Safe to call from several tasks at once: all shared state lives in the
// components, which lock per key. tick() is meant for a single sweep task.
class AlarmPipeline {
public:
  AlarmPipeline(const Config& cfg, const Directory& dir, PushTransport& transport, StateSink* sink = nullptr);

  // One transport message. Bad input is reported, never thrown.
  IngestReport ingest(const std::string& topic, const std::string& body, uint32_t nowMs);

  // Raises an alarm for a known sensor without a gateway message.
  AlarmTransition triggerTest(const std::string& sensorId, Severity severity, uint32_t nowMs, FanOutReport* fan = nullptr);

  AlarmTransition acknowledge(uint32_t incidentId, const std::string& userId, uint32_t nowMs);
  AlarmTransition escalate(uint32_t incidentId, uint32_t nowMs, FanOutReport* fan = nullptr);
  AlarmTransition resolve(uint32_t incidentId, uint32_t nowMs, size_t* cancelled = nullptr);

  // Staleness sweep, escalation scan and pruning, paced by sweep_period_ms.
  TickReport tick(uint32_t nowMs);

  DeviceStateTracker& tracker() { return tracker_; }
  AlarmStateMachine& alarms() { return alarms_; }
  DeliveryDispatcher& dispatcher() { return dispatcher_; }
  BroadcastHub& hub() { return hub_; }
  const NotificationRouter& router() const { return router_; }

private:
  const Config& cfg_;
  const Directory& dir_;
  StateSink* sink_;

  MessageDecoder decoder_;
  DeviceStateTracker tracker_;
  AlarmStateMachine alarms_;
  DeliveryDispatcher dispatcher_;
  NotificationRouter router_;
  BroadcastHub hub_;
  TimeoutScheduler scheduler_;

  Scope scopeForGateway(const std::string& gatewayId) const;
  size_t publish(BroadcastEnvelope env, const std::string& gatewayId);
  size_t publishDevice(const char* type, const DeviceState& st, uint32_t nowMs);
  FanOutReport fanOut(const AlarmIncident& inc, uint32_t nowMs);
  void settle(const AlarmTransition& t, uint32_t nowMs, FanOutReport* fan, size_t* broadcasts);
};
