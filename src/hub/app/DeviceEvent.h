#pragma once
#include <stdint.h>

#include <string>

#include "app/Incident.h"

enum class EventKind {
  power_on,
  heartbeat,
  smoke_alarm,
  smoke_register,
  delete_response,
  self_test,
  low_battery
};

static inline const char* toString(EventKind k) {
  switch (k) {
    case EventKind::power_on:        return "power_on";
    case EventKind::heartbeat:       return "heartbeat";
    case EventKind::smoke_alarm:     return "smoke_alarm";
    case EventKind::smoke_register:  return "smoke_register";
    case EventKind::delete_response: return "delete_response";
    case EventKind::self_test:       return "self_test";
    case EventKind::low_battery:     return "low_battery";
    default:                         return "unknown";
  }
}

static inline bool parseEventKind(const std::string& text, EventKind& out) {
  static const EventKind kAll[] = {
    EventKind::power_on,
    EventKind::heartbeat,
    EventKind::smoke_alarm,
    EventKind::smoke_register,
    EventKind::delete_response,
    EventKind::self_test,
    EventKind::low_battery,
  };
  for (EventKind k : kAll) {
    if (text == toString(k)) {
      out = k;
      return true;
    }
  }
  return false;
}

// One decoded uplink message. Optional fields carry a has_* flag.
struct DeviceEvent {
  std::string gateway_id;
  EventKind kind = EventKind::heartbeat;
  uint32_t received_ms = 0;

  std::string sensor_id;

  bool has_battery = false;
  float battery_v = 0.0f;

  bool has_rssi = false;
  int16_t rssi_dbm = 0;

  std::string firmware;

  bool has_severity = false;
  Severity severity = Severity::low;

  bool self_test_ok = false;
  bool delete_ok = true;

  bool namesSensor() const { return !sensor_id.empty(); }
};
