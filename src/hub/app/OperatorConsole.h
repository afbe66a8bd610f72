#pragma once
#include <stdint.h>

#include <string>

#include "app/AlarmPipeline.h"
#include "app/CommandParser.h"
#include "app/Config.h"

// Reply published on the ack topic / echoed to serial.
struct CommandAck {
  std::string cmd;
  bool ok = false;
  std::string detail;
};

// Durable home for config overrides (NVS on the device).
class SettingsStore {
public:
  virtual ~SettingsStore() = default;
  virtual bool save(const std::string& key, const std::string& value) = 0;
};

// Runs operator commands against the pipeline. Config changes are validated
// against a staged copy and persisted; the running pipeline keeps its config
// until restart.
class OperatorConsole {
public:
  OperatorConsole(AlarmPipeline& pipeline, const Config& live, SettingsStore* store = nullptr)
  : pipeline_(pipeline), live_(live), staged_(live), store_(store) {}

  CommandAck handle(const std::string& line, uint32_t nowMs);

  const Config& staged() const { return staged_; }

private:
  AlarmPipeline& pipeline_;
  const Config& live_;
  Config staged_;
  SettingsStore* store_;

  CommandAck runMock(const OperatorCommand& c, uint32_t nowMs);
  CommandAck runTest(const OperatorCommand& c, uint32_t nowMs);
  CommandAck runTransition(const OperatorCommand& c, uint32_t nowMs);
  CommandAck runSet(const OperatorCommand& c);
  CommandAck runStatus() const;
};
