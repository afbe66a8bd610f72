#include "services/MqttStateSink.h"

#include "app/HubConfig.h"
#include "app/StateJson.h"

void MqttStateSink::put(const std::string& topic, const std::string& body, bool retain) {
  if (!bus_.publishState(topic, body, retain)) ++dropped_;
}

void MqttStateSink::saveDevice(const DeviceState& st) {
  put(std::string(MQTT_TOPIC_STATE_PREFIX) + "device/" + st.id, toJson(st), true);
}

void MqttStateSink::saveIncident(const AlarmIncident& inc) {
  put(std::string(MQTT_TOPIC_STATE_PREFIX) + "incident/" + std::to_string(inc.id), toJson(inc), true);
}

void MqttStateSink::appendAudit(const AuditRecord& rec) {
  put(std::string(MQTT_TOPIC_STATE_PREFIX) + "audit/" + std::to_string(rec.incident_id), toJson(rec), false);
}
