#include "pipelines/TimeoutScheduler.h"

bool TimeoutScheduler::pollSweep(uint32_t nowMs) {
  if (armed_ && !reached(nowMs, nextSweepMs_)) return false;
  armed_ = true;
  nextSweepMs_ = nowMs + cfg_.sweep_period_ms;
  return true;
}

std::vector<uint32_t> TimeoutScheduler::pollEscalations(const AlarmStateMachine& alarms, uint32_t nowMs) const {
  return alarms.dueForEscalation(nowMs);
}
