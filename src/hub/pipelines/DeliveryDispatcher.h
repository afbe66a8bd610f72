#pragma once
#include <stdint.h>

#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "app/Config.h"
#include "app/Notification.h"
#include "app/NotificationRouter.h"
#include "app/StateSink.h"

enum class PushResult {
  success,
  transient_error,
  permanent_error
};

static inline const char* toString(PushResult r) {
  switch (r) {
    case PushResult::success:         return "success";
    case PushResult::transient_error: return "transient_error";
    case PushResult::permanent_error: return "permanent_error";
    default:                          return "unknown";
  }
}

// Maps an HTTP status from the push gateway onto a delivery result.
// Negative codes are client-side failures (refused, timeout).
static inline PushResult classifyPushStatus(int httpCode) {
  if (httpCode >= 200 && httpCode < 300) return PushResult::success;
  if (httpCode < 0) return PushResult::transient_error;
  if (httpCode == 408 || httpCode == 429 || httpCode >= 500) return PushResult::transient_error;
  return PushResult::permanent_error;
}

// External push transport. `error` is filled on failure.
class PushTransport {
public:
  virtual ~PushTransport() = default;
  virtual PushResult send(const std::string& recipientId, const std::string& payload, std::string& error) = 0;
};

enum class AdmitResult {
  queued,
  duplicate,
  no_channel
};

static inline const char* toString(AdmitResult r) {
  switch (r) {
    case AdmitResult::queued:     return "queued";
    case AdmitResult::duplicate:  return "duplicate";
    case AdmitResult::no_channel: return "no_channel";
    default:                      return "unknown";
  }
}

// Owns notification tasks from admission to a terminal outcome.
// Worker tasks call workOnce(); a task is claimed by at most one worker at a
// time, so retries for the same task never overlap. Transport calls happen
// outside the lock so independent tasks go out concurrently.
class DeliveryDispatcher : public DeliveryLedger {
public:
  struct Stats {
    uint32_t queued = 0;
    uint32_t in_flight = 0;
    uint32_t sent = 0;
    uint32_t failed = 0;
    uint32_t cancelled = 0;
    uint32_t attempts = 0;
    uint32_t retries = 0;
  };

  DeliveryDispatcher(const Config& cfg, PushTransport& transport, StateSink* sink = nullptr)
  : cfg_(cfg), transport_(transport), sink_(sink) {}

  // Admits a task. Channel-less tasks are recorded failed:NoChannel at once.
  AdmitResult dispatch(const NotificationTask& task, uint32_t nowMs);

  // Runs one due attempt. Returns false when nothing was due. `out` receives
  // the task's outcome after the attempt.
  bool workOnce(uint32_t nowMs, DeliveryOutcome* out = nullptr);

  // Cancels tasks of `tier` for the incident that have not had a first
  // attempt yet. Returns how many were cancelled.
  size_t cancelPending(uint32_t incidentId, Tier tier, uint32_t nowMs);

  // Forgets every record of an incident (after it was pruned upstream).
  void forgetIncident(uint32_t incidentId);

  bool hasPendingOrSent(const std::string& recipientId, uint32_t incidentId) const override;

  bool outcome(const std::string& recipientId, uint32_t incidentId, DeliveryOutcome& out) const;
  std::vector<AuditRecord> auditFor(const std::string& recipientId, uint32_t incidentId) const;
  std::vector<DeliveryOutcome> outcomesFor(uint32_t incidentId) const;
  std::vector<DeliveryOutcome> failures() const;

  // Milliseconds until the earliest queued attempt is due (0 = due now,
  // false = nothing queued).
  bool nextDueIn(uint32_t nowMs, uint32_t& waitMs) const;

  Stats stats() const;

  // Delay before attempt number `attempt` + 1, after `attempt` transient failures.
  uint32_t backoffFor(uint8_t attempt) const;

private:
  using Key = std::pair<std::string, uint32_t>;

  struct Job {
    NotificationTask task;
    DeliveryStatus status = DeliveryStatus::pending;
    bool in_flight = false;
    uint32_t not_before_ms = 0;
    std::string last_error;
  };

  const Config& cfg_;
  PushTransport& transport_;
  StateSink* sink_;

  mutable std::mutex mu_;
  std::map<Key, Job> jobs_;
  std::map<Key, std::vector<AuditRecord>> audit_;
  Stats stats_;

  AuditRecord recordLocked(const Job& job, uint32_t nowMs, AttemptResult result, const std::string& detail);
  static DeliveryOutcome outcomeOf(const Job& job);
  static std::string payloadFor(const NotificationTask& task);
};
