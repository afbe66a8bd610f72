#include "services/MqttClient.h"

#include <cstring>
#include <string>

#include "pipelines/JsonFields.h"
#include "pipelines/TimeoutScheduler.h"

MqttClient* MqttClient::self_ = nullptr;

static const char* wlStatusText(wl_status_t st) {
  switch (st) {
    case WL_NO_SHIELD:       return "NO_SHIELD";
    case WL_IDLE_STATUS:     return "IDLE";
    case WL_NO_SSID_AVAIL:   return "NO_SSID";
    case WL_SCAN_COMPLETED:  return "SCAN_COMPLETED";
    case WL_CONNECTED:       return "CONNECTED";
    case WL_CONNECT_FAILED:  return "CONNECT_FAILED";
    case WL_CONNECTION_LOST: return "CONNECTION_LOST";
    case WL_DISCONNECTED:    return "DISCONNECTED";
    default:                 return "UNKNOWN";
  }
}

MqttClient::MqttClient()
: mqtt_(wifiClient_) {}

void MqttClient::begin(MessageCallback cb) {
  msgCb_ = cb;
  self_ = this;

  WiFi.mode(WIFI_STA);
  WiFi.setAutoReconnect(true);
  WiFi.persistent(false);

  mqtt_.setServer(MQTT_BROKER, MQTT_PORT);
  mqtt_.setKeepAlive(MQTT_KEEPALIVE_S);
  mqtt_.setSocketTimeout(MQTT_SOCKET_TIMEOUT_S);
  mqtt_.setBufferSize(MQTT_BUFFER_SIZE);
  mqtt_.setCallback(onMqttMessage);
}

void MqttClient::connectWifi(uint32_t nowMs) {
  const wl_status_t st = WiFi.status();
  if (st != lastWifiStatus_) {
    lastWifiStatus_ = st;
    Serial.print("[WIFI] ");
    Serial.println(wlStatusText(st));
  }

  if (st == WL_CONNECTED) return;
  if (!reached(nowMs, nextWifiRetryMs_)) return;

  nextWifiRetryMs_ = nowMs + WIFI_RECONNECT_MS;

  if (strlen(WIFI_SSID) == 0) {
    return;
  }
  WiFi.begin(WIFI_SSID, WIFI_PASSWORD);
}

void MqttClient::connectMqtt(uint32_t nowMs) {
  if (WiFi.status() != WL_CONNECTED) return;
  if (mqtt_.connected()) return;
  if (!reached(nowMs, nextMqttRetryMs_)) return;

  nextMqttRetryMs_ = nowMs + MQTT_RECONNECT_MS;

  const bool hasAuth = strlen(MQTT_USERNAME) > 0;
  bool connected = false;

  if (hasAuth) {
    connected = mqtt_.connect(
      MQTT_CLIENT_ID,
      MQTT_USERNAME,
      MQTT_PASSWORD,
      MQTT_TOPIC_STATUS,
      1,
      true,
      "{\"reason\":\"offline\"}"
    );
  } else {
    connected = mqtt_.connect(
      MQTT_CLIENT_ID,
      MQTT_TOPIC_STATUS,
      1,
      true,
      "{\"reason\":\"offline\"}"
    );
  }

  if (!connected) {
    Serial.print("[MQTT] connect failed rc=");
    Serial.println(mqtt_.state());
    return;
  }

  // Directory first so retained houses/recipients land before new uplinks.
  mqtt_.subscribe(MQTT_TOPIC_DIR, 1);
  mqtt_.subscribe(MQTT_TOPIC_UPLINK, 1);
  mqtt_.subscribe(MQTT_TOPIC_CMD);

  lastConnected_ = true;
  Serial.println("[MQTT] connected");
  publishStatus("online");
}

void MqttClient::update(uint32_t nowMs) {
  if (lastConnected_ && !mqtt_.connected()) {
    lastConnected_ = false;
    Serial.println("[MQTT] disconnected");
  }

  connectWifi(nowMs);
  connectMqtt(nowMs);

  if (mqtt_.connected()) {
    mqtt_.loop();
  }
}

bool MqttClient::ready() {
  return mqtt_.connected();
}

bool MqttClient::publishState(const char* topic, const char* payload, bool retain) {
  if (!ready() || !topic || !payload) return false;
  return mqtt_.publish(topic, payload, retain);
}

bool MqttClient::publishStatus(const char* reason) {
  if (!ready()) return false;

  String payload = "{\"reason\":\"";
  payload += (reason ? reason : "unknown");
  payload += "\",\"ip\":\"";
  payload += WiFi.localIP().toString();
  payload += "\",\"uptime_ms\":";
  payload += String(millis());
  payload += "}";

  return mqtt_.publish(MQTT_TOPIC_STATUS, payload.c_str(), true);
}

bool MqttClient::publishAck(const char* cmd, bool ok, const char* detail) {
  if (!ready()) return false;

  String payload = "{\"cmd\":\"";
  payload += (cmd ? cmd : "");
  payload += "\",\"ok\":";
  payload += ok ? "true" : "false";
  payload += ",\"detail\":";
  payload += JsonFields::quote(detail ? detail : "").c_str();
  payload += ",\"uptime_ms\":";
  payload += String(millis());
  payload += "}";

  return mqtt_.publish(MQTT_TOPIC_ACK, payload.c_str(), false);
}

bool MqttClient::publishMetrics(const HubMetrics& m) {
  if (!ready()) return false;

  String payload = "{\"ingress_drops\":";
  payload += String(m.ingressDrops);
  payload += ",\"pub_drops\":";
  payload += String(m.pubDrops);
  payload += ",\"cmd_drops\":";
  payload += String(m.cmdDrops);
  payload += ",\"store_drops\":";
  payload += String(m.storeDrops);
  payload += ",\"decode_errors\":";
  payload += String(m.decodeErrors);
  payload += ",\"q_ingress\":";
  payload += String(m.ingressDepth);
  payload += ",\"q_pub\":";
  payload += String(m.pubDepth);
  payload += ",\"q_cmd\":";
  payload += String(m.cmdDepth);
  payload += ",\"q_store\":";
  payload += String(m.storeDepth);
  payload += ",\"delivery_queued\":";
  payload += String(m.deliveryQueued);
  payload += ",\"delivery_failed\":";
  payload += String(m.deliveryFailed);
  payload += ",\"delivery_retries\":";
  payload += String(m.deliveryRetries);
  payload += ",\"ws_clients\":";
  payload += String(m.clients);
  payload += ",\"backpressure\":";
  payload += String(m.backpressure);
  payload += ",\"overruns\":";
  payload += String(m.tickOverruns);
  payload += ",\"uptime_ms\":";
  payload += String(millis());
  payload += "}";

  return mqtt_.publish(MQTT_TOPIC_METRICS, payload.c_str(), false);
}

void MqttClient::onMqttMessage(char* topic, uint8_t* payload, unsigned int length) {
  if (!self_ || !self_->msgCb_) return;
  self_->msgCb_(topic ? topic : "", payload, length);
}
