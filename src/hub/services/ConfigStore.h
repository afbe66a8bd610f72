#pragma once

#include <Arduino.h>
#include <Preferences.h>

#include "app/Config.h"
#include "app/OperatorConsole.h"

// NVS-backed config overrides. Keys are stored under short aliases because
// NVS limits key names to 15 characters.
class ConfigStore : public SettingsStore {
public:
  bool begin();

  // Applies every stored override to cfg. Returns how many were applied.
  uint32_t load(Config& cfg);

  bool save(const std::string& key, const std::string& value) override;

private:
  Preferences pref_;
  bool ready_ = false;
};
