#pragma once
#include <stdint.h>

#include <string>
#include <vector>

#include "app/Config.h"
#include "app/DeviceEvent.h"
#include "app/DeviceState.h"
#include "pipelines/KeyedStore.h"

// What applyEvent() changed, for the pipeline to act on.
struct DeviceUpdate {
  DeviceState state;
  DeviceStatus previous = DeviceStatus::unknown;
  bool created = false;
  bool removed = false;
  bool low_battery = false;

  // Gateway relaying the event, refreshed on every message.
  DeviceState gateway;
  DeviceStatus gateway_previous = DeviceStatus::unknown;

  bool statusChanged() const { return state.status != previous; }
  bool gatewayStatusChanged() const { return gateway.status != gateway_previous; }
};

class DeviceStateTracker {
public:
  explicit DeviceStateTracker(const Config& cfg) : cfg_(cfg) {}

  // Applies one decoded event. Updates for the same id are serialized;
  // different ids proceed in parallel.
  DeviceUpdate applyEvent(const DeviceEvent& e);

  // Moves devices silent for longer than the staleness window to offline.
  // Returns the records that changed, ordered by id.
  std::vector<DeviceState> sweep(uint32_t nowMs);

  bool find(const std::string& id, DeviceState& out) const;
  std::vector<DeviceState> snapshot() const;
  size_t size() const { return devices_.size(); }

private:
  const Config& cfg_;
  KeyedStore<std::string, DeviceState> devices_;

  void touchGateway(const DeviceEvent& e, DeviceUpdate& u);
};
