#pragma once
#include <stdint.h>

#include <string>

#include "app/Incident.h"

enum class CommandKind {
  none,
  mock,
  test,
  ack,
  escalate,
  resolve,
  set,
  status,
  help
};

static inline const char* toString(CommandKind k) {
  switch (k) {
    case CommandKind::none:     return "none";
    case CommandKind::mock:     return "mock";
    case CommandKind::test:     return "test";
    case CommandKind::ack:      return "ack";
    case CommandKind::escalate: return "escalate";
    case CommandKind::resolve:  return "resolve";
    case CommandKind::set:      return "set";
    case CommandKind::status:   return "status";
    case CommandKind::help:     return "help";
    default:                    return "unknown";
  }
}

enum class CommandError {
  none,
  empty,
  unknown_command,
  missing_argument,
  bad_argument
};

static inline const char* toString(CommandError e) {
  switch (e) {
    case CommandError::none:             return "ok";
    case CommandError::empty:            return "empty";
    case CommandError::unknown_command:  return "unknown_command";
    case CommandError::missing_argument: return "missing_argument";
    case CommandError::bad_argument:     return "bad_argument";
    default:                             return "unknown";
  }
}

// One operator line, e.g.
//   mock uplink/gw-1/smoke_alarm {"sensor":"s-1"}
//   test s-1 critical
//   ack 7 alice
//   set ack_timeout_ms 60000
struct OperatorCommand {
  CommandKind kind = CommandKind::none;

  std::string topic;
  std::string body;

  std::string sensor_id;
  bool has_severity = false;
  Severity severity = Severity::low;

  uint32_t incident_id = 0;
  std::string user_id;

  std::string key;
  std::string value;
};

// The command word is case-insensitive; arguments are kept verbatim.
CommandError parseCommand(const std::string& line, OperatorCommand& out);

const char* commandHelp();
