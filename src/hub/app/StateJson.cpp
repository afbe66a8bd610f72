#include "app/StateJson.h"

#include <stdio.h>

#include "pipelines/JsonFields.h"

std::string toJson(const DeviceState& st) {
  char volts[16];
  snprintf(volts, sizeof(volts), "%.2f", (double)st.battery_v);

  std::string out = "{\"id\":";
  out += JsonFields::quote(st.id);
  out += ",\"kind\":\"";
  out += toString(st.kind);
  out += "\"";
  if (!st.gateway_id.empty()) {
    out += ",\"gateway\":";
    out += JsonFields::quote(st.gateway_id);
  }
  out += ",\"status\":\"";
  out += toString(st.status);
  out += "\",\"battery_v\":";
  out += volts;
  out += ",\"rssi\":";
  out += std::to_string(st.rssi_dbm);
  out += ",\"last_heartbeat_ms\":";
  out += std::to_string(st.last_heartbeat_ms);
  if (!st.firmware.empty()) {
    out += ",\"fw\":";
    out += JsonFields::quote(st.firmware);
  }
  if (st.kind == DeviceKind::sensor) {
    out += ",\"registered\":";
    out += st.registered ? "true" : "false";
    out += ",\"self_test_ok\":";
    out += st.self_test_ok ? "true" : "false";
  }
  out += ",\"low_battery\":";
  out += st.low_battery ? "true" : "false";
  out += "}";
  return out;
}

std::string toJson(const AlarmIncident& inc) {
  std::string out = "{\"incident\":";
  out += std::to_string(inc.id);
  out += ",\"sensor\":";
  out += JsonFields::quote(inc.sensor_id);
  out += ",\"gateway\":";
  out += JsonFields::quote(inc.gateway_id);
  out += ",\"severity\":\"";
  out += toString(inc.severity);
  out += "\",\"state\":\"";
  out += toString(inc.state);
  out += "\",\"triggered_ms\":";
  out += std::to_string(inc.triggered_ms);
  out += ",\"triggers\":";
  out += std::to_string(inc.trigger_count);
  if (inc.state == IncidentState::escalated || inc.escalated_ms != 0) {
    out += ",\"escalated_ms\":";
    out += std::to_string(inc.escalated_ms);
  }
  if (inc.acknowledged) {
    out += ",\"acknowledged_by\":";
    out += JsonFields::quote(inc.acknowledged_by);
  }
  if (inc.resolved) {
    out += ",\"resolved_ms\":";
    out += std::to_string(inc.resolved_ms);
  }
  out += "}";
  return out;
}

std::string toJson(const AuditRecord& rec) {
  std::string out = "{\"recipient\":";
  out += JsonFields::quote(rec.recipient_id);
  out += ",\"incident\":";
  out += std::to_string(rec.incident_id);
  out += ",\"attempt\":";
  out += std::to_string(rec.attempt);
  out += ",\"at_ms\":";
  out += std::to_string(rec.at_ms);
  out += ",\"result\":\"";
  out += toString(rec.result);
  out += "\"";
  if (!rec.detail.empty()) {
    out += ",\"detail\":";
    out += JsonFields::quote(rec.detail);
  }
  out += "}";
  return out;
}
