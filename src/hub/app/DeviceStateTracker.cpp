#include "app/DeviceStateTracker.h"

#include <algorithm>

#include "pipelines/TimeoutScheduler.h"

namespace {
static bool byId(const DeviceState& a, const DeviceState& b) {
  return a.id < b.id;
}

static void applyTelemetry(const DeviceEvent& e, DeviceState& st) {
  if (e.has_battery) st.battery_v = e.battery_v;
  if (e.has_rssi) st.rssi_dbm = e.rssi_dbm;
}

static void markAlive(const DeviceEvent& e, DeviceState& st) {
  st.status = DeviceStatus::online;
  st.last_heartbeat_ms = e.received_ms;
}
} // namespace

void DeviceStateTracker::touchGateway(const DeviceEvent& e, DeviceUpdate& u) {
  const bool gatewayLevel = !e.namesSensor();
  devices_.upsert(e.gateway_id, [&](DeviceState& st, bool created) {
    if (created) {
      st.id = e.gateway_id;
      st.kind = DeviceKind::gateway;
    }
    u.gateway_previous = st.status;
    markAlive(e, st);

    if (gatewayLevel) {
      applyTelemetry(e, st);
      if (e.kind == EventKind::power_on) {
        st.firmware = e.firmware;
        st.low_battery = false;
      }
      if (e.kind == EventKind::low_battery) st.low_battery = true;
      u.created = created;
      u.previous = u.gateway_previous;
    }
    u.gateway = st;
  });
}

DeviceUpdate DeviceStateTracker::applyEvent(const DeviceEvent& e) {
  DeviceUpdate u;
  touchGateway(e, u);

  if (!e.namesSensor()) {
    u.state = u.gateway;
    u.low_battery = (e.kind == EventKind::low_battery);
    return u;
  }

  if (e.kind == EventKind::delete_response) {
    u.state.id = e.sensor_id;
    u.state.kind = DeviceKind::sensor;
    u.state.gateway_id = e.gateway_id;
    if (!e.delete_ok) {
      devices_.read(e.sensor_id, u.state);
      u.previous = u.state.status;
      return u;
    }
    devices_.updateOrRemove(e.sensor_id, [&](DeviceState& st) {
      u.previous = st.status;
      u.state = st;
      return true;
    });
    u.state.status = DeviceStatus::unknown;
    u.removed = true;
    return u;
  }

  devices_.upsert(e.sensor_id, [&](DeviceState& st, bool created) {
    if (created) {
      st.id = e.sensor_id;
      st.kind = DeviceKind::sensor;
    }
    st.gateway_id = e.gateway_id;
    u.created = created;
    u.previous = st.status;

    markAlive(e, st);
    applyTelemetry(e, st);

    switch (e.kind) {
      case EventKind::power_on:
        st.firmware = e.firmware;
        st.low_battery = false;
        break;
      case EventKind::smoke_register:
        st.registered = true;
        if (!e.firmware.empty()) st.firmware = e.firmware;
        break;
      case EventKind::self_test:
        st.self_test_ok = e.self_test_ok;
        break;
      case EventKind::low_battery:
        st.low_battery = true;
        u.low_battery = true;
        break;
      default:
        break;
    }
    u.state = st;
  });
  return u;
}

std::vector<DeviceState> DeviceStateTracker::sweep(uint32_t nowMs) {
  std::vector<DeviceState> changed;
  const uint32_t window = cfg_.heartbeat_staleness_ms;

  for (const auto& kv : devices_.records()) {
    const auto& rec = kv.second;
    std::lock_guard<std::mutex> lk(rec->mu);
    if (rec->removed) continue;
    DeviceState& st = rec->value;
    if (st.status != DeviceStatus::online) continue;
    if (!reached(nowMs, st.last_heartbeat_ms + window)) continue;
    st.status = DeviceStatus::offline;
    changed.push_back(st);
  }

  std::sort(changed.begin(), changed.end(), byId);
  return changed;
}

bool DeviceStateTracker::find(const std::string& id, DeviceState& out) const {
  return devices_.read(id, out);
}

std::vector<DeviceState> DeviceStateTracker::snapshot() const {
  std::vector<DeviceState> out;
  for (const auto& kv : devices_.records()) {
    std::lock_guard<std::mutex> lk(kv.second->mu);
    if (kv.second->removed) continue;
    out.push_back(kv.second->value);
  }
  std::sort(out.begin(), out.end(), byId);
  return out;
}
