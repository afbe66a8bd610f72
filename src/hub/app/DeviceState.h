#pragma once
#include <stdint.h>

#include <string>

enum class DeviceKind : uint8_t { gateway, sensor };
enum class DeviceStatus : uint8_t { unknown, online, offline };

static inline const char* toString(DeviceKind k) {
  switch (k) {
    case DeviceKind::gateway: return "gateway";
    case DeviceKind::sensor:  return "sensor";
    default:                  return "unknown";
  }
}

static inline const char* toString(DeviceStatus s) {
  switch (s) {
    case DeviceStatus::unknown: return "unknown";
    case DeviceStatus::online:  return "online";
    case DeviceStatus::offline: return "offline";
    default:                    return "unknown";
  }
}

struct DeviceState {
  std::string id;
  DeviceKind kind = DeviceKind::gateway;
  std::string gateway_id;

  DeviceStatus status = DeviceStatus::unknown;
  float battery_v = 0.0f;
  int16_t rssi_dbm = 0;
  uint32_t last_heartbeat_ms = 0;

  std::string firmware;
  bool registered = false;
  bool self_test_ok = true;
  bool low_battery = false;
};
