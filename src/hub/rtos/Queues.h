#pragma once

#include <Arduino.h>

#include "app/HubConfig.h"

#if defined(ARDUINO_ARCH_ESP32)
#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>
#endif

namespace RtosQueues {

// Raw MQTT message handed from the network task to the ingress task.
struct InboundMsg {
  char topic[96]{};
  char payload[384]{};
};

enum class PublishKind : uint8_t {
  state,
  status,
  ack
};

// `retain` applies to state documents only.
struct PublishMsg {
  PublishKind kind = PublishKind::state;
  bool ok = false;
  bool retain = false;
  char topic[80]{};
  char text1[24]{};
  char text2[320]{};
};

struct CmdMsg {
  char payload[256]{};
};

#if defined(ARDUINO_ARCH_ESP32)
extern QueueHandle_t ingressQ;
extern QueueHandle_t mqttPubQ;
extern QueueHandle_t mqttCmdQ;
#endif

bool init();

} // namespace RtosQueues
