#include "services/ConfigStore.h"

#include "app/HubConfig.h"

namespace {
struct KeyAlias {
  const char* key;
  const char* nvs;
};

static const KeyAlias kAliases[] = {
  {"heartbeat_staleness_ms",       "hb_stale"},
  {"sweep_period_ms",              "sweep"},
  {"ack_timeout_ms",               "ack_to"},
  {"resolved_retention_ms",        "resolved_keep"},
  {"default_smoke_severity",       "smoke_sev"},
  {"base_radius_m",                "radius"},
  {"escalation_radius_multiplier", "radius_mul"},
  {"delivery_max_attempts",        "dl_attempts"},
  {"delivery_backoff_base_ms",     "dl_backoff"},
  {"delivery_max_backoff_ms",      "dl_backoff_max"},
  {"dispatch_workers",             "workers"},
  {"connection_queue_depth",       "ws_depth"},
};

static const char* nvsKeyFor(const std::string& key) {
  for (const KeyAlias& a : kAliases) {
    if (key == a.key) return a.nvs;
  }
  return nullptr;
}
} // namespace

bool ConfigStore::begin() {
  ready_ = pref_.begin(CONFIG_NVS_NAMESPACE, false);
  if (!ready_) {
    Serial.println("[CFG] WARN: NVS unavailable; overrides will not persist");
  }
  return ready_;
}

uint32_t ConfigStore::load(Config& cfg) {
  if (!ready_) return 0;

  uint32_t applied = 0;
  for (const KeyAlias& a : kAliases) {
    if (!pref_.isKey(a.nvs)) continue;
    const String raw = pref_.getString(a.nvs, "");
    const ConfigError err = applyConfigOverride(cfg, a.key, raw.c_str());
    if (err != ConfigError::none) {
      Serial.print("[CFG] ignoring stored ");
      Serial.print(a.key);
      Serial.print(": ");
      Serial.println(toString(err));
      continue;
    }
    ++applied;
  }
  return applied;
}

bool ConfigStore::save(const std::string& key, const std::string& value) {
  if (!ready_) return false;
  const char* nvs = nvsKeyFor(key);
  if (!nvs) return false;
  return pref_.putString(nvs, value.c_str()) == value.size();
}
