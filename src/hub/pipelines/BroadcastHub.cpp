#include "pipelines/BroadcastHub.h"

namespace {
static Scope narrowed(const Scope& event, const Scope& filter) {
  Scope s = event;
  if (!filter.tenant_id.empty()) s.tenant_id = filter.tenant_id;
  if (!filter.house_id.empty()) s.house_id = filter.house_id;
  return s;
}

// A filter that contradicts the event's own scope reaches nobody.
static bool conflicts(const Scope& event, const Scope& filter) {
  if (!filter.tenant_id.empty() && !event.tenant_id.empty() && filter.tenant_id != event.tenant_id) return true;
  if (!filter.house_id.empty() && !event.house_id.empty() && filter.house_id != event.house_id) return true;
  return false;
}
} // namespace

std::shared_ptr<const BroadcastHub::Registry> BroadcastHub::snapshot() const {
  std::lock_guard<std::mutex> lk(regMu_);
  return registry_;
}

BroadcastHub::ConnectionPtr BroadcastHub::lookup(uint32_t connectionId) const {
  const std::shared_ptr<const Registry> reg = snapshot();
  for (const ConnectionPtr& c : *reg) {
    if (c->id == connectionId) return c;
  }
  return ConnectionPtr();
}

uint32_t BroadcastHub::connect(const Scope& scope, const std::shared_ptr<ClientChannel>& channel) {
  ConnectionPtr c = std::make_shared<Connection>();
  c->id = nextId_.fetch_add(1);
  c->channel = channel;
  c->scope = scope;

  std::lock_guard<std::mutex> lk(regMu_);
  std::shared_ptr<Registry> next = std::make_shared<Registry>(*registry_);
  next->push_back(c);
  registry_ = next;
  return c->id;
}

bool BroadcastHub::disconnect(uint32_t connectionId) {
  ConnectionPtr gone;
  {
    std::lock_guard<std::mutex> lk(regMu_);
    std::shared_ptr<Registry> next = std::make_shared<Registry>();
    next->reserve(registry_->size());
    for (const ConnectionPtr& c : *registry_) {
      if (c->id == connectionId) {
        gone = c;
      } else {
        next->push_back(c);
      }
    }
    if (!gone) return false;
    registry_ = next;
  }

  // Broadcasters holding an older snapshot may still see it; closed stops
  // them queueing into it.
  std::lock_guard<std::mutex> lk(gone->mu);
  gone->closed = true;
  gone->queue.clear();
  return true;
}

bool BroadcastHub::subscribe(uint32_t connectionId, const Scope& scope) {
  ConnectionPtr c = lookup(connectionId);
  if (!c) return false;
  std::lock_guard<std::mutex> lk(c->mu);
  if (c->closed) return false;
  c->scope = scope;
  return true;
}

size_t BroadcastHub::broadcast(const BroadcastEnvelope& env, const Scope& filter) {
  broadcasts_.fetch_add(1);
  if (conflicts(env.scope, filter)) return 0;

  const Scope target = narrowed(env.scope, filter);
  const std::string frame = toFrame(env);
  const size_t depth = cfg_.connection_queue_depth ? cfg_.connection_queue_depth : 1;

  size_t queued = 0;
  const std::shared_ptr<const Registry> reg = snapshot();
  for (const ConnectionPtr& c : *reg) {
    std::lock_guard<std::mutex> lk(c->mu);
    if (c->closed) continue;
    if (!c->scope.admits(target)) continue;

    while (c->queue.size() >= depth) {
      c->queue.pop_front();
      ++c->backpressure;
      drops_.fetch_add(1);
    }
    c->queue.push_back(frame);
    ++queued;
  }
  enqueued_.fetch_add((uint32_t)queued);
  return queued;
}

size_t BroadcastHub::pump(size_t maxFrames) {
  size_t written = 0;
  const std::shared_ptr<const Registry> reg = snapshot();
  for (const ConnectionPtr& c : *reg) {
    if (!c->channel) continue;
    for (size_t n = 0; n < maxFrames; ++n) {
      // The channel may call back into the hub; never hold c->mu across it.
      if (!c->channel->canSend()) break;
      std::string frame;
      {
        std::lock_guard<std::mutex> lk(c->mu);
        if (c->closed || c->queue.empty()) break;
        frame = c->queue.front();
        c->queue.pop_front();
      }
      if (!c->channel->write(frame)) break;
      ++written;
    }
  }
  framesSent_.fetch_add((uint32_t)written);
  return written;
}

void BroadcastHub::shutdown() {
  std::shared_ptr<const Registry> old;
  {
    std::lock_guard<std::mutex> lk(regMu_);
    old = registry_;
    registry_ = std::make_shared<Registry>();
  }
  for (const ConnectionPtr& c : *old) {
    std::lock_guard<std::mutex> lk(c->mu);
    c->closed = true;
    c->queue.clear();
  }
}

bool BroadcastHub::queueDepth(uint32_t connectionId, size_t& depth) const {
  ConnectionPtr c = lookup(connectionId);
  if (!c) return false;
  std::lock_guard<std::mutex> lk(c->mu);
  depth = c->queue.size();
  return true;
}

bool BroadcastHub::backpressureOf(uint32_t connectionId, uint32_t& drops) const {
  ConnectionPtr c = lookup(connectionId);
  if (!c) return false;
  std::lock_guard<std::mutex> lk(c->mu);
  drops = c->backpressure;
  return true;
}

size_t BroadcastHub::connectionCount() const {
  return snapshot()->size();
}

BroadcastHub::Stats BroadcastHub::stats() const {
  Stats s;
  s.connections = (uint32_t)connectionCount();
  s.broadcasts = broadcasts_.load();
  s.enqueued = enqueued_.load();
  s.frames_sent = framesSent_.load();
  s.backpressure_drops = drops_.load();
  return s;
}
