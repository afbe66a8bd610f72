#pragma once

#include <Arduino.h>

#include <string>

// Task-safe front for MQTT publishes and operator commands. Publishes are
// queued for the network task, which parks them in the NVS outbox while the
// broker is unreachable.
class MqttBus {
public:
  struct Stats {
    uint32_t ingressDrops = 0;
    uint32_t pubDrops = 0;
    uint32_t cmdDrops = 0;
    uint32_t storeDrops = 0;
    uint32_t tickOverruns = 0;
    uint32_t storeDepth = 0;
    uint32_t ingressDepth = 0;
    uint32_t pubQueueDepth = 0;
    uint32_t cmdQueueDepth = 0;
  };

  bool publishState(const std::string& topic, const std::string& body, bool retain);
  bool publishStatus(const char* reason);
  bool publishAck(const char* cmd, bool ok, const char* detail);

  bool pollCommand(std::string& outPayload);

  Stats stats() const;
};
