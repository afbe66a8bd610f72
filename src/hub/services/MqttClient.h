#pragma once

#include <Arduino.h>
#include <WiFi.h>
#include <PubSubClient.h>

#include "app/HubConfig.h"

struct HubMetrics {
  uint32_t ingressDrops = 0;
  uint32_t pubDrops = 0;
  uint32_t cmdDrops = 0;
  uint32_t storeDrops = 0;
  uint32_t decodeErrors = 0;
  uint32_t ingressDepth = 0;
  uint32_t pubDepth = 0;
  uint32_t cmdDepth = 0;
  uint32_t storeDepth = 0;
  uint32_t deliveryQueued = 0;
  uint32_t deliveryFailed = 0;
  uint32_t deliveryRetries = 0;
  uint32_t clients = 0;
  uint32_t backpressure = 0;
  uint32_t tickOverruns = 0;
};

class MqttClient {
public:
  using MessageCallback = void (*)(const char* topic, const uint8_t* payload, unsigned int length);

  MqttClient();

  void begin(MessageCallback cb = nullptr);
  void update(uint32_t nowMs);

  bool ready();
  bool publishState(const char* topic, const char* payload, bool retain);
  bool publishStatus(const char* reason);
  bool publishAck(const char* cmd, bool ok, const char* detail);
  bool publishMetrics(const HubMetrics& m);

private:
  static MqttClient* self_;

  WiFiClient wifiClient_;
  PubSubClient mqtt_;
  MessageCallback msgCb_ = nullptr;
  bool lastConnected_ = false;
  wl_status_t lastWifiStatus_ = WL_IDLE_STATUS;

  uint32_t nextWifiRetryMs_ = 0;
  uint32_t nextMqttRetryMs_ = 0;

  static void onMqttMessage(char* topic, uint8_t* payload, unsigned int length);
  void connectWifi(uint32_t nowMs);
  void connectMqtt(uint32_t nowMs);
};
