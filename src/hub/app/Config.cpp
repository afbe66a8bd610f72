#include "app/Config.h"

namespace {
static bool parseUint32Strict(const std::string& s, uint32_t& out) {
  if (s.empty()) return false;
  uint64_t v = 0;
  for (size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    if (c < '0' || c > '9') return false;
    v = (v * 10u) + (uint64_t)(c - '0');
    if (v > 0xFFFFFFFFull) return false;
  }
  out = (uint32_t)v;
  return true;
}

static bool parseBounded(const std::string& s, uint32_t minV, uint32_t maxV, uint32_t& out) {
  uint32_t v = 0;
  if (!parseUint32Strict(s, v)) return false;
  if (v < minV || v > maxV) return false;
  out = v;
  return true;
}

static void appendField(std::string& out, const char* key, uint32_t value) {
  out += key;
  out += '=';
  out += std::to_string(value);
  out += ';';
}
} // namespace

const char* toString(ConfigError e) {
  switch (e) {
    case ConfigError::none:        return "ok";
    case ConfigError::unknown_key: return "unknown_key";
    case ConfigError::bad_value:   return "bad_value";
    default:                       return "unknown";
  }
}

ConfigError applyConfigOverride(Config& cfg, const std::string& key, const std::string& value) {
  uint32_t v = 0;

  if (key == "default_smoke_severity") {
    Severity s = Severity::low;
    if (!parseSeverity(value, s)) return ConfigError::bad_value;
    cfg.default_smoke_severity = s;
    return ConfigError::none;
  }

  if (key == "heartbeat_staleness_ms") {
    if (!parseBounded(value, 1000, 0x7FFFFFFFu, v)) return ConfigError::bad_value;
    cfg.heartbeat_staleness_ms = v;
    return ConfigError::none;
  }
  if (key == "sweep_period_ms") {
    if (!parseBounded(value, 100, 0x7FFFFFFFu, v)) return ConfigError::bad_value;
    cfg.sweep_period_ms = v;
    return ConfigError::none;
  }
  if (key == "ack_timeout_ms") {
    if (!parseBounded(value, 1000, 0x7FFFFFFFu, v)) return ConfigError::bad_value;
    cfg.ack_timeout_ms = v;
    return ConfigError::none;
  }
  if (key == "resolved_retention_ms") {
    if (!parseBounded(value, 0, 0x7FFFFFFFu, v)) return ConfigError::bad_value;
    cfg.resolved_retention_ms = v;
    return ConfigError::none;
  }
  if (key == "base_radius_m") {
    if (!parseBounded(value, 1, 100000, v)) return ConfigError::bad_value;
    cfg.base_radius_m = v;
    return ConfigError::none;
  }
  if (key == "escalation_radius_multiplier") {
    if (!parseBounded(value, 1, 50, v)) return ConfigError::bad_value;
    cfg.escalation_radius_multiplier = (uint8_t)v;
    return ConfigError::none;
  }
  if (key == "delivery_max_attempts") {
    if (!parseBounded(value, 1, 16, v)) return ConfigError::bad_value;
    cfg.delivery_max_attempts = (uint8_t)v;
    return ConfigError::none;
  }
  if (key == "delivery_backoff_base_ms") {
    if (!parseBounded(value, 1, 600000, v)) return ConfigError::bad_value;
    cfg.delivery_backoff_base_ms = v;
    return ConfigError::none;
  }
  if (key == "delivery_max_backoff_ms") {
    if (!parseBounded(value, 1, 3600000, v)) return ConfigError::bad_value;
    cfg.delivery_max_backoff_ms = v;
    return ConfigError::none;
  }
  if (key == "dispatch_workers") {
    if (!parseBounded(value, 1, 8, v)) return ConfigError::bad_value;
    cfg.dispatch_workers = (uint8_t)v;
    return ConfigError::none;
  }
  if (key == "connection_queue_depth") {
    if (!parseBounded(value, 1, 1024, v)) return ConfigError::bad_value;
    cfg.connection_queue_depth = (uint16_t)v;
    return ConfigError::none;
  }

  return ConfigError::unknown_key;
}

std::string describeConfig(const Config& cfg) {
  std::string out;
  appendField(out, "heartbeat_staleness_ms", cfg.heartbeat_staleness_ms);
  appendField(out, "sweep_period_ms", cfg.sweep_period_ms);
  appendField(out, "ack_timeout_ms", cfg.ack_timeout_ms);
  appendField(out, "resolved_retention_ms", cfg.resolved_retention_ms);
  appendField(out, "base_radius_m", cfg.base_radius_m);
  appendField(out, "escalation_radius_multiplier", cfg.escalation_radius_multiplier);
  appendField(out, "delivery_max_attempts", cfg.delivery_max_attempts);
  appendField(out, "delivery_backoff_base_ms", cfg.delivery_backoff_base_ms);
  appendField(out, "delivery_max_backoff_ms", cfg.delivery_max_backoff_ms);
  appendField(out, "dispatch_workers", cfg.dispatch_workers);
  appendField(out, "connection_queue_depth", cfg.connection_queue_depth);
  out += "default_smoke_severity=";
  out += toString(cfg.default_smoke_severity);
  return out;
}
