#pragma once

#include <Arduino.h>
#include <ESPAsyncWebServer.h>

#include <map>
#include <memory>
#include <string>

#include <freertos/FreeRTOS.h>
#include <freertos/semphr.h>

#include "pipelines/BroadcastHub.h"

// Realtime client channel on top of one AsyncWebSocket client.
class WsClientChannel : public ClientChannel {
public:
  WsClientChannel(AsyncWebSocket* ws, uint32_t clientId) : ws_(ws), clientId_(clientId) {}

  bool canSend() const override;
  bool write(const std::string& frame) override;

private:
  AsyncWebSocket* ws_;
  uint32_t clientId_;
};

// WebSocket endpoint feeding the broadcast hub. A client joins the hub with
// its first text frame ("tenant=<id> house=<id>"); later frames re-scope it.
class RealtimeServer {
public:
  RealtimeServer(BroadcastHub& hub, uint16_t port, const char* path);

  void begin();
  void update(uint32_t nowMs);

  uint32_t clientCount() const;

private:
  BroadcastHub& hub_;
  AsyncWebServer server_;
  AsyncWebSocket ws_;

  SemaphoreHandle_t mu_ = nullptr;
  // websocket client id -> hub connection id
  std::map<uint32_t, uint32_t> connections_;

  void onEvent(AsyncWebSocketClient* client, AwsEventType type, void* arg, uint8_t* data, size_t len);
  void handleSubscribe(AsyncWebSocketClient* client, const std::string& text);
  void handleClose(uint32_t clientId);
  void handleHealth(AsyncWebServerRequest* request);
};
