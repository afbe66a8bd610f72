#pragma once
#include <stdint.h>

#include <string>

// Tenant/house filter. An empty field matches anything.
struct Scope {
  std::string tenant_id;
  std::string house_id;

  // True when an event tagged with `event` should reach a subscriber with
  // this scope.
  bool admits(const Scope& event) const {
    if (!tenant_id.empty() && tenant_id != event.tenant_id) return false;
    if (!house_id.empty() && house_id != event.house_id) return false;
    return true;
  }
};

// Parses a subscription line "tenant=<id> house=<id>"; either part may be
// left out, but not both. Unknown keys are rejected.
static inline bool parseScope(const std::string& line, Scope& out) {
  Scope s;
  bool any = false;
  size_t pos = 0;
  while (pos < line.size()) {
    while (pos < line.size() && (line[pos] == ' ' || line[pos] == '\t' || line[pos] == '\r' || line[pos] == '\n')) ++pos;
    if (pos >= line.size()) break;
    size_t end = pos;
    while (end < line.size() && line[end] != ' ' && line[end] != '\t' && line[end] != '\r' && line[end] != '\n') ++end;

    const std::string token = line.substr(pos, end - pos);
    pos = end;
    const size_t eq = token.find('=');
    if (eq == std::string::npos || eq + 1 >= token.size()) return false;
    const std::string key = token.substr(0, eq);
    const std::string value = token.substr(eq + 1);
    if (key == "tenant") {
      s.tenant_id = value;
    } else if (key == "house") {
      s.house_id = value;
    } else {
      return false;
    }
    any = true;
  }
  if (!any) return false;
  out = s;
  return true;
}

struct BroadcastEnvelope {
  std::string event_type;
  std::string payload;
  uint32_t timestamp_ms = 0;
  Scope scope;
};

// {"type":"...","ts":123,"data":{...}}
static inline std::string toFrame(const BroadcastEnvelope& env) {
  std::string out = "{\"type\":\"";
  out += env.event_type;
  out += "\",\"ts\":";
  out += std::to_string(env.timestamp_ms);
  out += ",\"data\":";
  out += env.payload.empty() ? "{}" : env.payload;
  out += "}";
  return out;
}
