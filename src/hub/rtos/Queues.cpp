#include "rtos/Queues.h"

namespace RtosQueues {

#if defined(ARDUINO_ARCH_ESP32)
QueueHandle_t ingressQ = nullptr;
QueueHandle_t mqttPubQ = nullptr;
QueueHandle_t mqttCmdQ = nullptr;
#endif

bool init() {
#if defined(ARDUINO_ARCH_ESP32)
  if (!ingressQ) ingressQ = xQueueCreate(HUB_INGRESS_QUEUE_DEPTH, sizeof(InboundMsg));
  if (!mqttPubQ) mqttPubQ = xQueueCreate(HUB_PUB_QUEUE_DEPTH, sizeof(PublishMsg));
  if (!mqttCmdQ) mqttCmdQ = xQueueCreate(HUB_CMD_QUEUE_DEPTH, sizeof(CmdMsg));
  return ingressQ && mqttPubQ && mqttCmdQ;
#else
  return false;
#endif
}

} // namespace RtosQueues
