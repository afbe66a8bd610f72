#pragma once

#include <Arduino.h>

#include "app/AlarmPipeline.h"
#include "app/Config.h"
#include "app/RecipientDirectory.h"
#include "rtos/Queues.h"
#include "services/Logger.h"
#include "services/MqttClient.h"

namespace RtosTasks {

struct Stats {
  uint32_t ingressDrops = 0;
  uint32_t pubDrops = 0;
  uint32_t cmdDrops = 0;
  uint32_t storeDrops = 0;
  uint32_t decodeErrors = 0;
  uint32_t tickOverruns = 0;
  uint32_t storeDepth = 0;
};

void attachMqtt(MqttClient* client);
void attachPipeline(AlarmPipeline* pipeline, InMemoryDirectory* directory, const Config* cfg, Logger* logger);
bool startIfReady();

Stats stats();

bool enqueuePublish(const RtosQueues::PublishMsg& msg);
bool dequeueCommand(RtosQueues::CmdMsg& out);

} // namespace RtosTasks
