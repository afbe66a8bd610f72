#pragma once
#include <stdint.h>

#include <vector>

#include "app/AlarmStateMachine.h"
#include "app/Config.h"

// True once `nowMs` is at or past `targetMs`, across millis() wraparound.
static inline bool reached(uint32_t nowMs, uint32_t targetMs) {
  return (int32_t)(nowMs - targetMs) >= 0;
}

// Paces the periodic work of the sweep task.
class TimeoutScheduler {
public:
  explicit TimeoutScheduler(const Config& cfg) : cfg_(cfg) {}

  // True once per sweep period; the first call always fires.
  bool pollSweep(uint32_t nowMs);

  // Incidents whose acknowledgement window ran out, ascending by id.
  std::vector<uint32_t> pollEscalations(const AlarmStateMachine& alarms, uint32_t nowMs) const;

  // Forces the next pollSweep() to fire.
  void rearm() { armed_ = false; }

private:
  const Config& cfg_;
  bool armed_ = false;
  uint32_t nextSweepMs_ = 0;
};
