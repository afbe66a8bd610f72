#include "services/RealtimeServer.h"

bool WsClientChannel::canSend() const {
  AsyncWebSocketClient* c = ws_->client(clientId_);
  return c && c->status() == WS_CONNECTED && c->canSend();
}

bool WsClientChannel::write(const std::string& frame) {
  AsyncWebSocketClient* c = ws_->client(clientId_);
  if (!c || c->status() != WS_CONNECTED) return false;
  c->text(frame.c_str());
  return true;
}

RealtimeServer::RealtimeServer(BroadcastHub& hub, uint16_t port, const char* path)
: hub_(hub), server_(port), ws_(path) {}

void RealtimeServer::begin() {
  if (!mu_) mu_ = xSemaphoreCreateMutex();

  ws_.onEvent([this](AsyncWebSocket*, AsyncWebSocketClient* client, AwsEventType type, void* arg, uint8_t* data, size_t len) {
    onEvent(client, type, arg, data, len);
  });
  server_.addHandler(&ws_);
  server_.on("/api/health", HTTP_GET, [this](AsyncWebServerRequest* request) { handleHealth(request); });
  server_.begin();
}

void RealtimeServer::update(uint32_t) {
  ws_.cleanupClients();
}

uint32_t RealtimeServer::clientCount() const {
  return (uint32_t)hub_.connectionCount();
}

void RealtimeServer::onEvent(AsyncWebSocketClient* client, AwsEventType type, void* arg, uint8_t* data, size_t len) {
  if (!client) return;

  switch (type) {
    case WS_EVT_CONNECT:
      client->text("{\"type\":\"hello\",\"data\":{\"subscribe\":\"tenant=<id> house=<id>\"}}");
      break;

    case WS_EVT_DISCONNECT:
      handleClose(client->id());
      break;

    case WS_EVT_DATA: {
      const AwsFrameInfo* info = static_cast<const AwsFrameInfo*>(arg);
      // Subscription lines are tiny; fragmented frames are not expected.
      if (!info || !info->final || info->index != 0 || info->len != len) break;
      if (info->opcode != WS_TEXT) break;
      handleSubscribe(client, std::string(reinterpret_cast<const char*>(data), len));
      break;
    }

    default:
      break;
  }
}

void RealtimeServer::handleSubscribe(AsyncWebSocketClient* client, const std::string& text) {
  Scope scope;
  if (!parseScope(text, scope)) {
    client->text("{\"type\":\"error\",\"data\":{\"reason\":\"bad_scope\"}}");
    return;
  }

  const uint32_t clientId = client->id();
  bool known = false;
  uint32_t connId = 0;

  xSemaphoreTake(mu_, portMAX_DELAY);
  auto it = connections_.find(clientId);
  if (it != connections_.end()) {
    known = true;
    connId = it->second;
  }
  xSemaphoreGive(mu_);

  if (known) {
    hub_.subscribe(connId, scope);
  } else {
    connId = hub_.connect(scope, std::make_shared<WsClientChannel>(&ws_, clientId));
    xSemaphoreTake(mu_, portMAX_DELAY);
    connections_[clientId] = connId;
    xSemaphoreGive(mu_);
  }

  client->text("{\"type\":\"subscribed\",\"data\":{\"connection\":" + String(connId) + "}}");
}

void RealtimeServer::handleClose(uint32_t clientId) {
  uint32_t connId = 0;
  bool known = false;

  xSemaphoreTake(mu_, portMAX_DELAY);
  auto it = connections_.find(clientId);
  if (it != connections_.end()) {
    connId = it->second;
    known = true;
    connections_.erase(it);
  }
  xSemaphoreGive(mu_);

  if (known) hub_.disconnect(connId);
}

void RealtimeServer::handleHealth(AsyncWebServerRequest* request) {
  const BroadcastHub::Stats s = hub_.stats();
  String json = "{";
  json += "\"clients\":" + String(s.connections) + ",";
  json += "\"broadcasts\":" + String(s.broadcasts) + ",";
  json += "\"frames_sent\":" + String(s.frames_sent) + ",";
  json += "\"backpressure\":" + String(s.backpressure_drops) + ",";
  json += "\"uptime_ms\":" + String(millis());
  json += "}";

  request->send(200, "application/json", json);
}
