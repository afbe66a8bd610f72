#include "rtos/Tasks.h"

#include <cstdio>
#include <cstring>

#include "app/HubConfig.h"
#include "pipelines/TimeoutScheduler.h"
#include "rtos/Queues.h"

#include <Preferences.h>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>

namespace RtosTasks {

static MqttClient* gMqtt = nullptr;
static AlarmPipeline* gPipeline = nullptr;
static InMemoryDirectory* gDirectory = nullptr;
static const Config* gCfg = nullptr;
static Logger* gLog = nullptr;

static TaskHandle_t hMqtt = nullptr;
static TaskHandle_t hIngress = nullptr;
static TaskHandle_t hHub = nullptr;
static TaskHandle_t hSweep = nullptr;
static TaskHandle_t hDispatch[HUB_MAX_DISPATCH_WORKERS] = {};
static bool started = false;

static volatile uint32_t gIngressDrops = 0;
static volatile uint32_t gPubDrops = 0;
static volatile uint32_t gCmdDrops = 0;
static volatile uint32_t gStoreDrops = 0;
static volatile uint32_t gDecodeErrors = 0;
static volatile uint32_t gTickOverruns = 0;
static volatile uint32_t gStoreDepth = 0;

static Preferences pref;
static bool prefReady = false;
static RtosQueues::PublishMsg store[MQTT_STORE_CAP];
static uint32_t storeHead = 0;
static uint32_t storeTail = 0;
static uint32_t storeCount = 0;

static inline bool hasPrefix(const char* s, const char* prefix) {
  return std::strncmp(s, prefix, std::strlen(prefix)) == 0;
}

static bool copyBytes(char* dst, size_t dstLen, const char* src, size_t srcLen) {
  if (srcLen >= dstLen) return false;
  std::memcpy(dst, src, srcLen);
  dst[srcLen] = '\0';
  return true;
}

static void slotKey(uint32_t idx, char* out, size_t outLen) {
  std::snprintf(out, outLen, "s%02lu", (unsigned long)idx);
}

static void persistMeta() {
  if (!prefReady) return;
  pref.putUInt("h", storeHead);
  pref.putUInt("t", storeTail);
  pref.putUInt("c", storeCount);
}

static void persistSlot(uint32_t idx, const RtosQueues::PublishMsg& msg) {
  if (!prefReady) return;
  char key[8];
  slotKey(idx, key, sizeof(key));
  pref.putBytes(key, &msg, sizeof(RtosQueues::PublishMsg));
}

static void resetStore() {
  storeHead = 0;
  storeTail = 0;
  storeCount = 0;
  persistMeta();
}

static void loadStore() {
  prefReady = pref.begin(OUTBOX_NVS_NAMESPACE, false);
  if (!prefReady) {
    resetStore();
    return;
  }

  storeHead = pref.getUInt("h", 0);
  storeTail = pref.getUInt("t", 0);
  storeCount = pref.getUInt("c", 0);

  if (storeHead >= MQTT_STORE_CAP || storeTail >= MQTT_STORE_CAP || storeCount > MQTT_STORE_CAP) {
    resetStore();
  }

  for (uint32_t i = 0; i < MQTT_STORE_CAP; ++i) {
    char key[8];
    slotKey(i, key, sizeof(key));
    if (pref.getBytesLength(key) == sizeof(RtosQueues::PublishMsg)) {
      pref.getBytes(key, &store[i], sizeof(RtosQueues::PublishMsg));
    }
  }
}

static bool storePush(const RtosQueues::PublishMsg& msg) {
  if (storeCount >= MQTT_STORE_CAP) return false;
  store[storeTail] = msg;
  persistSlot(storeTail, msg);
  storeTail = (storeTail + 1) % MQTT_STORE_CAP;
  ++storeCount;
  persistMeta();
  return true;
}

static bool storePeek(RtosQueues::PublishMsg& out) {
  if (storeCount == 0) return false;
  out = store[storeHead];
  return true;
}

static void storePop() {
  if (storeCount == 0) return;
  storeHead = (storeHead + 1) % MQTT_STORE_CAP;
  --storeCount;
  persistMeta();
}

static bool publishMsg(const RtosQueues::PublishMsg& msg) {
  if (!gMqtt) return false;
  switch (msg.kind) {
    case RtosQueues::PublishKind::state:
      return gMqtt->publishState(msg.topic, msg.text2, msg.retain);
    case RtosQueues::PublishKind::status:
      return gMqtt->publishStatus(msg.text1);
    case RtosQueues::PublishKind::ack:
      return gMqtt->publishAck(msg.text1, msg.ok, msg.text2);
    default:
      return false;
  }
}

// Runs on the network task inside PubSubClient::loop(); never blocks.
static void onMqttMessage(const char* topic, const uint8_t* payload, unsigned int length) {
  if (hasPrefix(topic, MQTT_TOPIC_CMD)) {
    if (!RtosQueues::mqttCmdQ) return;
    RtosQueues::CmdMsg msg{};
    if (!copyBytes(msg.payload, sizeof(msg.payload), (const char*)payload, length) ||
        xQueueSend(RtosQueues::mqttCmdQ, &msg, 0) != pdTRUE) {
      ++gCmdDrops;
    }
    return;
  }

  if (!hasPrefix(topic, MQTT_TOPIC_UPLINK_PREFIX) && !hasPrefix(topic, MQTT_TOPIC_DIR_PREFIX)) return;
  if (!RtosQueues::ingressQ) return;

  RtosQueues::InboundMsg msg{};
  if (!copyBytes(msg.topic, sizeof(msg.topic), topic, std::strlen(topic)) ||
      !copyBytes(msg.payload, sizeof(msg.payload), (const char*)payload, length) ||
      xQueueSend(RtosQueues::ingressQ, &msg, 0) != pdTRUE) {
    ++gIngressDrops;
  }
}

static void buildMetrics(HubMetrics& m) {
  m.ingressDrops = gIngressDrops;
  m.pubDrops = gPubDrops;
  m.cmdDrops = gCmdDrops;
  m.storeDrops = gStoreDrops;
  m.decodeErrors = gDecodeErrors;
  m.tickOverruns = gTickOverruns;
  m.ingressDepth = RtosQueues::ingressQ ? (uint32_t)uxQueueMessagesWaiting(RtosQueues::ingressQ) : 0;
  m.pubDepth = RtosQueues::mqttPubQ ? (uint32_t)uxQueueMessagesWaiting(RtosQueues::mqttPubQ) : 0;
  m.cmdDepth = RtosQueues::mqttCmdQ ? (uint32_t)uxQueueMessagesWaiting(RtosQueues::mqttCmdQ) : 0;
  m.storeDepth = storeCount;

  if (gPipeline) {
    const DeliveryDispatcher::Stats d = gPipeline->dispatcher().stats();
    const BroadcastHub::Stats h = gPipeline->hub().stats();
    m.deliveryQueued = d.queued;
    m.deliveryFailed = d.failed;
    m.deliveryRetries = d.retries;
    m.clients = h.connections;
    m.backpressure = h.backpressure_drops;
  }
}

static void mqttTask(void*) {
  if (!gMqtt) vTaskDelete(nullptr);

  loadStore();
  gMqtt->begin(onMqttMessage);

  const TickType_t period = pdMS_TO_TICKS(10);
  TickType_t last = xTaskGetTickCount();
  uint32_t nextMetricsMs = 0;

  for (;;) {
    const uint32_t nowMs = millis();
    gMqtt->update(nowMs);

    if (gMqtt->ready()) {
      RtosQueues::PublishMsg msg{};
      uint32_t burst = 0;
      while (burst < MQTT_STORE_FLUSH_BURST && storePeek(msg)) {
        if (!publishMsg(msg)) break;
        storePop();
        ++burst;
      }
    }

    if (RtosQueues::mqttPubQ) {
      RtosQueues::PublishMsg msg{};
      uint32_t burst = 0;
      while (burst < MQTT_PUB_DRAIN_BURST && xQueueReceive(RtosQueues::mqttPubQ, &msg, 0) == pdTRUE) {
        if (gMqtt->ready() && storeCount == 0) {
          if (!publishMsg(msg) && !storePush(msg)) {
            ++gStoreDrops;
          }
        } else if (!storePush(msg)) {
          ++gStoreDrops;
        }
        ++burst;
      }
    }

    if (reached(nowMs, nextMetricsMs)) {
      nextMetricsMs = nowMs + MQTT_METRICS_PERIOD_MS;
      HubMetrics m;
      buildMetrics(m);
      gMqtt->publishMetrics(m);
    }

    gStoreDepth = storeCount;

    const TickType_t nowTicks = xTaskGetTickCount();
    if ((nowTicks - last) > period) {
      ++gTickOverruns;
    }
    vTaskDelayUntil(&last, period);
  }
}

static void ingressTask(void*) {
  RtosQueues::InboundMsg msg{};
  for (;;) {
    if (xQueueReceive(RtosQueues::ingressQ, &msg, portMAX_DELAY) != pdTRUE) continue;

    if (hasPrefix(msg.topic, MQTT_TOPIC_DIR_PREFIX)) {
      const DirectoryError err = gDirectory->applyMessage(msg.topic, msg.payload);
      if (gLog) gLog->logDirectory(msg.topic, err);
      continue;
    }

    const IngestReport r = gPipeline->ingest(msg.topic, msg.payload, millis());
    if (!r.decoded()) ++gDecodeErrors;
    if (gLog) gLog->logIngest(r);
  }
}

static void dispatchTask(void*) {
  for (;;) {
    DeliveryOutcome o;
    const uint32_t nowMs = millis();
    if (gPipeline->dispatcher().workOnce(nowMs, &o)) {
      if (gLog) gLog->logDelivery(o);
      continue;
    }

    uint32_t waitMs = HUB_DISPATCH_IDLE_MS;
    uint32_t dueMs = 0;
    if (gPipeline->dispatcher().nextDueIn(nowMs, dueMs) && dueMs < waitMs) waitMs = dueMs;
    vTaskDelay(pdMS_TO_TICKS(waitMs ? waitMs : 1));
  }
}

static void hubTask(void*) {
  const TickType_t period = pdMS_TO_TICKS(HUB_PUMP_PERIOD_MS);
  TickType_t last = xTaskGetTickCount();
  for (;;) {
    gPipeline->hub().pump(HUB_PUMP_BURST);
    vTaskDelayUntil(&last, period);
  }
}

static void sweepTask(void*) {
  const TickType_t period = pdMS_TO_TICKS(HUB_SWEEP_POLL_MS);
  TickType_t last = xTaskGetTickCount();
  for (;;) {
    const TickReport r = gPipeline->tick(millis());
    if (r.swept && gLog) gLog->logTick(r);
    vTaskDelayUntil(&last, period);
  }
}

static bool spawn(TaskFunction_t fn, const char* name, uint32_t stack, UBaseType_t prio, TaskHandle_t* handle, BaseType_t core) {
  if (xTaskCreatePinnedToCore(fn, name, stack, nullptr, prio, handle, core) == pdPASS) return true;
  Serial.print("[RTOS] failed to start task ");
  Serial.println(name);
  return false;
}

void attachMqtt(MqttClient* client) {
  gMqtt = client;
}

void attachPipeline(AlarmPipeline* pipeline, InMemoryDirectory* directory, const Config* cfg, Logger* logger) {
  gPipeline = pipeline;
  gDirectory = directory;
  gCfg = cfg;
  gLog = logger;
}

bool startIfReady() {
  if (started) return true;
  if (!gMqtt || !gPipeline || !gDirectory || !gCfg) return false;
  if (!RtosQueues::init()) {
    Serial.println("[RTOS] queue allocation failed");
    return false;
  }

  // Network on core 0 next to the WiFi stack; pipeline work on core 1.
  spawn(mqttTask, "Mqtt", 6144, 2, &hMqtt, 0);
  spawn(ingressTask, "Ingress", 6144, 2, &hIngress, 1);
  spawn(hubTask, "HubPump", 4096, 1, &hHub, 1);
  spawn(sweepTask, "Sweep", 4096, 1, &hSweep, 1);

  uint8_t workers = gCfg->dispatch_workers;
  if (workers == 0) workers = 1;
  if (workers > HUB_MAX_DISPATCH_WORKERS) workers = HUB_MAX_DISPATCH_WORKERS;
  for (uint8_t i = 0; i < workers; ++i) {
    char name[12];
    std::snprintf(name, sizeof(name), "Push%u", (unsigned)i);
    // HTTPClient + TLS needs the larger stack.
    spawn(dispatchTask, name, 8192, 1, &hDispatch[i], 1);
  }

  started = true;
  return true;
}

Stats stats() {
  Stats s{};
  s.ingressDrops = gIngressDrops;
  s.pubDrops = gPubDrops;
  s.cmdDrops = gCmdDrops;
  s.storeDrops = gStoreDrops;
  s.decodeErrors = gDecodeErrors;
  s.tickOverruns = gTickOverruns;
  s.storeDepth = gStoreDepth;
  return s;
}

bool enqueuePublish(const RtosQueues::PublishMsg& msg) {
  if (!RtosQueues::mqttPubQ) return false;
  if (xQueueSend(RtosQueues::mqttPubQ, &msg, 0) != pdTRUE) {
    ++gPubDrops;
    return false;
  }
  return true;
}

bool dequeueCommand(RtosQueues::CmdMsg& out) {
  if (!RtosQueues::mqttCmdQ) return false;
  return xQueueReceive(RtosQueues::mqttCmdQ, &out, 0) == pdTRUE;
}

} // namespace RtosTasks
