#include "services/MqttBus.h"

#include <cstring>

#include "rtos/Queues.h"
#include "rtos/Tasks.h"

namespace {
static bool copyText(char* dst, size_t dstLen, const char* src) {
  if (!dst || dstLen == 0) return false;
  dst[0] = '\0';
  if (!src) return true;
  std::strncpy(dst, src, dstLen - 1);
  dst[dstLen - 1] = '\0';
  return std::strlen(src) < dstLen;
}
} // namespace

bool MqttBus::publishState(const std::string& topic, const std::string& body, bool retain) {
  RtosQueues::PublishMsg msg{};
  msg.kind = RtosQueues::PublishKind::state;
  msg.retain = retain;
  // A truncated JSON document is worse than none.
  if (!copyText(msg.topic, sizeof(msg.topic), topic.c_str())) return false;
  if (!copyText(msg.text2, sizeof(msg.text2), body.c_str())) return false;
  return RtosTasks::enqueuePublish(msg);
}

bool MqttBus::publishStatus(const char* reason) {
  RtosQueues::PublishMsg msg{};
  msg.kind = RtosQueues::PublishKind::status;
  copyText(msg.text1, sizeof(msg.text1), reason);
  return RtosTasks::enqueuePublish(msg);
}

bool MqttBus::publishAck(const char* cmd, bool ok, const char* detail) {
  RtosQueues::PublishMsg msg{};
  msg.kind = RtosQueues::PublishKind::ack;
  msg.ok = ok;
  copyText(msg.text1, sizeof(msg.text1), cmd);
  copyText(msg.text2, sizeof(msg.text2), detail);
  return RtosTasks::enqueuePublish(msg);
}

bool MqttBus::pollCommand(std::string& outPayload) {
  outPayload.clear();
  RtosQueues::CmdMsg msg{};
  if (!RtosTasks::dequeueCommand(msg)) return false;
  outPayload = msg.payload;
  return true;
}

MqttBus::Stats MqttBus::stats() const {
  MqttBus::Stats out{};
  const auto s = RtosTasks::stats();
  out.ingressDrops = s.ingressDrops;
  out.pubDrops = s.pubDrops;
  out.cmdDrops = s.cmdDrops;
  out.storeDrops = s.storeDrops;
  out.tickOverruns = s.tickOverruns;
  out.storeDepth = s.storeDepth;
#if defined(ARDUINO_ARCH_ESP32)
  out.ingressDepth = RtosQueues::ingressQ ? (uint32_t)uxQueueMessagesWaiting(RtosQueues::ingressQ) : 0;
  out.pubQueueDepth = RtosQueues::mqttPubQ ? (uint32_t)uxQueueMessagesWaiting(RtosQueues::mqttPubQ) : 0;
  out.cmdQueueDepth = RtosQueues::mqttCmdQ ? (uint32_t)uxQueueMessagesWaiting(RtosQueues::mqttCmdQ) : 0;
#endif
  return out;
}
