#pragma once
#include <Arduino.h>

#if defined(ARDUINO_ARCH_ESP32)
#include <freertos/FreeRTOS.h>
#include <freertos/semphr.h>
#endif

#include "app/AlarmPipeline.h"
#include "app/OperatorConsole.h"
#include "app/RecipientDirectory.h"

// Serial log lines, one "[TAG] ..." per call. Safe to call from any task.
class Logger {
public:
  void begin();

  void logIngest(const IngestReport& r);
  void logDirectory(const char* topic, DirectoryError err);
  void logDelivery(const DeliveryOutcome& o);
  void logTick(const TickReport& r);
  void logCommand(const char* origin, const CommandAck& ack);
  void logDrop(const char* what, uint32_t total);
  void info(const char* tag, const char* text);

private:
#if defined(ARDUINO_ARCH_ESP32)
  SemaphoreHandle_t mu_ = nullptr;
#endif

  void line(const char* tag, const String& text);
};
