#include "pipelines/DeliveryDispatcher.h"

#include "pipelines/JsonFields.h"
#include "pipelines/TimeoutScheduler.h"

uint32_t DeliveryDispatcher::backoffFor(uint8_t attempt) const {
  if (attempt == 0) return 0;
  const uint8_t shift = (attempt - 1 > 20) ? 20 : (uint8_t)(attempt - 1);
  const uint64_t delay = (uint64_t)cfg_.delivery_backoff_base_ms << shift;
  const uint64_t cap = cfg_.delivery_max_backoff_ms;
  return (uint32_t)((delay > cap) ? cap : delay);
}

std::string DeliveryDispatcher::payloadFor(const NotificationTask& task) {
  std::string out = "{\"recipient\":";
  out += JsonFields::quote(task.recipient_id);
  out += ",\"incident\":";
  out += std::to_string(task.incident_id);
  out += ",\"channel\":\"";
  out += toString(task.channel);
  out += "\",\"severity\":\"";
  out += toString(task.severity);
  out += "\",\"tier\":\"";
  out += toString(task.tier);
  out += "\",\"attempt\":";
  out += std::to_string(task.attempt);
  out += "}";
  return out;
}

DeliveryOutcome DeliveryDispatcher::outcomeOf(const Job& job) {
  DeliveryOutcome o;
  o.recipient_id = job.task.recipient_id;
  o.incident_id = job.task.incident_id;
  o.status = job.status;
  o.attempts = job.task.attempt;
  o.last_error = job.last_error;
  return o;
}

AuditRecord DeliveryDispatcher::recordLocked(const Job& job,
                                             uint32_t nowMs,
                                             AttemptResult result,
                                             const std::string& detail) {
  AuditRecord rec;
  rec.recipient_id = job.task.recipient_id;
  rec.incident_id = job.task.incident_id;
  rec.attempt = job.task.attempt;
  rec.at_ms = nowMs;
  rec.result = result;
  rec.detail = detail;
  audit_[Key(rec.recipient_id, rec.incident_id)].push_back(rec);
  return rec;
}

AdmitResult DeliveryDispatcher::dispatch(const NotificationTask& task, uint32_t nowMs) {
  AuditRecord rec;
  AdmitResult result = AdmitResult::queued;
  {
    std::lock_guard<std::mutex> lk(mu_);
    const Key key(task.recipient_id, task.incident_id);
    auto it = jobs_.find(key);
    if (it != jobs_.end() &&
        (it->second.status == DeliveryStatus::pending || it->second.status == DeliveryStatus::sent)) {
      return AdmitResult::duplicate;
    }

    Job job;
    job.task = task;
    job.task.attempt = 0;
    job.not_before_ms = nowMs;

    if (task.channel == Channel::none) {
      job.status = DeliveryStatus::failed;
      job.last_error = "NoChannel";
      rec = recordLocked(job, nowMs, AttemptResult::no_channel, job.last_error);
      result = AdmitResult::no_channel;
    }
    jobs_[key] = job;
  }

  if (result == AdmitResult::no_channel && sink_) sink_->appendAudit(rec);
  return result;
}

bool DeliveryDispatcher::workOnce(uint32_t nowMs, DeliveryOutcome* out) {
  NotificationTask task;
  Key key;
  {
    std::lock_guard<std::mutex> lk(mu_);
    Job* pick = nullptr;
    uint32_t longestWait = 0;
    for (auto& kv : jobs_) {
      Job& job = kv.second;
      if (job.status != DeliveryStatus::pending || job.in_flight) continue;
      if (!reached(nowMs, job.not_before_ms)) continue;
      const uint32_t waited = nowMs - job.not_before_ms;
      if (!pick || waited > longestWait) {
        pick = &job;
        key = kv.first;
        longestWait = waited;
      }
    }
    if (!pick) return false;

    pick->in_flight = true;
    ++pick->task.attempt;
    ++stats_.attempts;
    if (pick->task.attempt > 1) ++stats_.retries;
    task = pick->task;
  }

  std::string error;
  const PushResult res = transport_.send(task.recipient_id, payloadFor(task), error);

  AuditRecord rec;
  DeliveryOutcome outcome;
  {
    std::lock_guard<std::mutex> lk(mu_);
    Job& job = jobs_[key];
    job.in_flight = false;

    switch (res) {
      case PushResult::success:
        job.status = DeliveryStatus::sent;
        job.last_error.clear();
        rec = recordLocked(job, nowMs, AttemptResult::sent, "");
        break;

      case PushResult::permanent_error:
        job.status = DeliveryStatus::failed;
        job.last_error = error.empty() ? "permanent" : error;
        rec = recordLocked(job, nowMs, AttemptResult::permanent_error, job.last_error);
        break;

      case PushResult::transient_error:
      default:
        job.last_error = error.empty() ? "transient" : error;
        rec = recordLocked(job, nowMs, AttemptResult::transient_error, job.last_error);
        if (job.task.attempt >= cfg_.delivery_max_attempts) {
          job.status = DeliveryStatus::failed;
        } else {
          job.not_before_ms = nowMs + backoffFor(job.task.attempt);
        }
        break;
    }
    outcome = outcomeOf(job);
  }

  if (sink_) sink_->appendAudit(rec);
  if (out) *out = outcome;
  return true;
}

size_t DeliveryDispatcher::cancelPending(uint32_t incidentId, Tier tier, uint32_t nowMs) {
  std::vector<AuditRecord> recs;
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (auto& kv : jobs_) {
      Job& job = kv.second;
      if (job.task.incident_id != incidentId || job.task.tier != tier) continue;
      if (job.status != DeliveryStatus::pending || job.in_flight || job.task.attempt != 0) continue;
      job.status = DeliveryStatus::cancelled;
      job.last_error = "Cancelled";
      recs.push_back(recordLocked(job, nowMs, AttemptResult::cancelled, job.last_error));
    }
  }
  if (sink_) {
    for (const AuditRecord& rec : recs) sink_->appendAudit(rec);
  }
  return recs.size();
}

void DeliveryDispatcher::forgetIncident(uint32_t incidentId) {
  std::lock_guard<std::mutex> lk(mu_);
  for (auto it = jobs_.begin(); it != jobs_.end();) {
    const bool drop = it->first.second == incidentId && !it->second.in_flight;
    it = drop ? jobs_.erase(it) : std::next(it);
  }
  for (auto it = audit_.begin(); it != audit_.end();) {
    it = (it->first.second == incidentId) ? audit_.erase(it) : std::next(it);
  }
}

bool DeliveryDispatcher::hasPendingOrSent(const std::string& recipientId, uint32_t incidentId) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = jobs_.find(Key(recipientId, incidentId));
  if (it == jobs_.end()) return false;
  return it->second.status == DeliveryStatus::pending || it->second.status == DeliveryStatus::sent;
}

bool DeliveryDispatcher::outcome(const std::string& recipientId, uint32_t incidentId, DeliveryOutcome& out) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = jobs_.find(Key(recipientId, incidentId));
  if (it == jobs_.end()) return false;
  out = outcomeOf(it->second);
  return true;
}

std::vector<AuditRecord> DeliveryDispatcher::auditFor(const std::string& recipientId, uint32_t incidentId) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = audit_.find(Key(recipientId, incidentId));
  if (it == audit_.end()) return std::vector<AuditRecord>();
  return it->second;
}

std::vector<DeliveryOutcome> DeliveryDispatcher::outcomesFor(uint32_t incidentId) const {
  std::vector<DeliveryOutcome> out;
  std::lock_guard<std::mutex> lk(mu_);
  for (const auto& kv : jobs_) {
    if (kv.first.second == incidentId) out.push_back(outcomeOf(kv.second));
  }
  return out;
}

std::vector<DeliveryOutcome> DeliveryDispatcher::failures() const {
  std::vector<DeliveryOutcome> out;
  std::lock_guard<std::mutex> lk(mu_);
  for (const auto& kv : jobs_) {
    if (kv.second.status == DeliveryStatus::failed) out.push_back(outcomeOf(kv.second));
  }
  return out;
}

bool DeliveryDispatcher::nextDueIn(uint32_t nowMs, uint32_t& waitMs) const {
  std::lock_guard<std::mutex> lk(mu_);
  bool any = false;
  uint32_t best = 0;
  for (const auto& kv : jobs_) {
    const Job& job = kv.second;
    if (job.status != DeliveryStatus::pending || job.in_flight) continue;
    const uint32_t wait = reached(nowMs, job.not_before_ms) ? 0 : (job.not_before_ms - nowMs);
    if (!any || wait < best) best = wait;
    any = true;
  }
  if (any) waitMs = best;
  return any;
}

DeliveryDispatcher::Stats DeliveryDispatcher::stats() const {
  std::lock_guard<std::mutex> lk(mu_);
  Stats s = stats_;
  s.queued = 0;
  s.in_flight = 0;
  s.sent = 0;
  s.failed = 0;
  s.cancelled = 0;
  for (const auto& kv : jobs_) {
    switch (kv.second.status) {
      case DeliveryStatus::pending:
        if (kv.second.in_flight) {
          ++s.in_flight;
        } else {
          ++s.queued;
        }
        break;
      case DeliveryStatus::sent:      ++s.sent; break;
      case DeliveryStatus::failed:    ++s.failed; break;
      case DeliveryStatus::cancelled: ++s.cancelled; break;
      default: break;
    }
  }
  return s;
}
