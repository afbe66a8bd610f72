#pragma once
#include <stdint.h>

#include <string>

#include "app/Incident.h"

// Pipeline policy. Defaults are placeholders for bench use; deployments are
// expected to override them (see applyConfigOverride / ConfigStore).
struct Config {
  // Device liveness.
  uint32_t heartbeat_staleness_ms = 300000;
  uint32_t sweep_period_ms = 10000;

  // Incident escalation.
  uint32_t ack_timeout_ms = 120000;
  uint32_t resolved_retention_ms = 600000;
  Severity default_smoke_severity = Severity::high;

  // Spatial routing.
  uint32_t base_radius_m = 200;
  uint8_t escalation_radius_multiplier = 3;

  // Delivery retry policy.
  uint8_t delivery_max_attempts = 4;
  uint32_t delivery_backoff_base_ms = 1000;
  uint32_t delivery_max_backoff_ms = 30000;
  uint8_t dispatch_workers = 2;

  // Realtime fan-out.
  uint16_t connection_queue_depth = 16;
};

enum class ConfigError {
  none,
  unknown_key,
  bad_value
};

const char* toString(ConfigError e);

// Applies one "key value" override. Leaves cfg untouched on error.
ConfigError applyConfigOverride(Config& cfg, const std::string& key, const std::string& value);

// Writes "key=value;..." for status reporting.
std::string describeConfig(const Config& cfg);
