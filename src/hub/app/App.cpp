#include "app/App.h"

#include <string>

#include "app/AlarmPipeline.h"
#include "app/Config.h"
#include "app/HubConfig.h"
#include "app/OperatorConsole.h"
#include "app/RecipientDirectory.h"
#include "pipelines/TimeoutScheduler.h"
#include "rtos/Tasks.h"
#include "services/ConfigStore.h"
#include "services/HttpPushTransport.h"
#include "services/Logger.h"
#include "services/MqttBus.h"
#include "services/MqttClient.h"
#include "services/MqttStateSink.h"
#include "services/RealtimeServer.h"
#include "services/SerialConsole.h"

namespace {
constexpr uint32_t STATUS_HEARTBEAT_MS = 60000;
constexpr int COMMAND_BURST = 4;
} // namespace

static Config cfg;
static InMemoryDirectory directory;
static Logger logger;
static ConfigStore configStore;

static MqttClient mqttClient;
static MqttBus mqttBus;
static MqttStateSink stateSink(mqttBus);
static HttpPushTransport pushTransport(PUSH_GATEWAY_URL, PUSH_AUTH_TOKEN, PUSH_TIMEOUT_MS);

static AlarmPipeline pipeline(cfg, directory, pushTransport, &stateSink);
static OperatorConsole console(pipeline, cfg, &configStore);
static RealtimeServer realtime(pipeline.hub(), WS_PORT, WS_PATH);
static SerialConsole serialConsole;

static uint32_t nextStatusMs = 0;

static void runCommand(const char* origin, const std::string& line, uint32_t nowMs) {
  const CommandAck ack = console.handle(line, nowMs);
  logger.logCommand(origin, ack);
  mqttBus.publishAck(ack.cmd.c_str(), ack.ok, ack.detail.c_str());
}

void App::begin() {
  logger.begin();

  // Overrides must land before any task reads cfg.
  if (configStore.begin()) {
    const uint32_t applied = configStore.load(cfg);
    if (applied > 0) {
      logger.info("CFG", (std::string("applied ") + std::to_string(applied) + " stored overrides").c_str());
    }
  }
  logger.info("CFG", describeConfig(cfg).c_str());

  RtosTasks::attachMqtt(&mqttClient);
  RtosTasks::attachPipeline(&pipeline, &directory, &cfg, &logger);
  if (!RtosTasks::startIfReady()) {
    logger.info("RTOS", "pipeline tasks not started");
  }

  realtime.begin();
  serialConsole.begin();
  mqttBus.publishStatus("boot");

  Serial.println("READY");
}

void App::tick(uint32_t nowMs) {
  realtime.update(nowMs);

  std::string line;
  if (serialConsole.poll(nowMs, line)) {
    runCommand("serial", line, nowMs);
  }

  std::string cmd;
  int burst = 0;
  while (burst < COMMAND_BURST && mqttBus.pollCommand(cmd)) {
    runCommand("mqtt", cmd, nowMs);
    ++burst;
  }

  if (reached(nowMs, nextStatusMs)) {
    nextStatusMs = nowMs + STATUS_HEARTBEAT_MS;
    mqttBus.publishStatus("heartbeat");
  }
}
