#pragma once
#include <stdint.h>

#include <string>

enum class Severity : uint8_t { low = 0, medium = 1, high = 2, critical = 3 };
enum class IncidentState : uint8_t { active, acknowledged, escalated, resolved };

static inline const char* toString(Severity s) {
  switch (s) {
    case Severity::low:      return "low";
    case Severity::medium:   return "medium";
    case Severity::high:     return "high";
    case Severity::critical: return "critical";
    default:                 return "unknown";
  }
}

static inline const char* toString(IncidentState st) {
  switch (st) {
    case IncidentState::active:       return "active";
    case IncidentState::acknowledged: return "acknowledged";
    case IncidentState::escalated:    return "escalated";
    case IncidentState::resolved:     return "resolved";
    default:                          return "unknown";
  }
}

static inline bool parseSeverity(const std::string& text, Severity& out) {
  if (text == "low")      { out = Severity::low;      return true; }
  if (text == "medium")   { out = Severity::medium;   return true; }
  if (text == "high")     { out = Severity::high;     return true; }
  if (text == "critical") { out = Severity::critical; return true; }
  return false;
}

static inline Severity raiseSeverity(Severity s) {
  return (s == Severity::critical) ? Severity::critical
                                   : static_cast<Severity>(static_cast<uint8_t>(s) + 1);
}

// High and critical incidents also reach neighbours and emergency roles.
static inline bool widensAudience(Severity s) {
  return s >= Severity::high;
}

static inline bool isOpen(IncidentState st) {
  return st != IncidentState::resolved;
}

struct AlarmIncident {
  uint32_t id = 0;
  std::string sensor_id;
  std::string gateway_id;
  Severity severity = Severity::low;
  IncidentState state = IncidentState::active;

  uint32_t triggered_ms = 0;
  uint32_t escalated_ms = 0;
  uint32_t trigger_count = 0;

  bool acknowledged = false;
  std::string acknowledged_by;

  bool resolved = false;
  uint32_t resolved_ms = 0;
};
