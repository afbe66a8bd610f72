#pragma once
#include <stdint.h>

#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "app/Broadcast.h"
#include "app/Config.h"

// One live realtime client. write() must not block; canSend() is false while
// the client has not drained what it was given.
class ClientChannel {
public:
  virtual ~ClientChannel() = default;
  virtual bool canSend() const = 0;
  virtual bool write(const std::string& frame) = 0;
};

// Fans envelopes out to live connections.
// connect/disconnect publish a new registry copy under regMu_; broadcast and
// pump work on the snapshot they grabbed and never hold the registry lock
// while touching a connection. Each connection has its own bounded queue, so
// a stalled client only ever loses its own oldest frames.
class BroadcastHub {
public:
  struct Stats {
    uint32_t connections = 0;
    uint32_t broadcasts = 0;
    uint32_t enqueued = 0;
    uint32_t frames_sent = 0;
    uint32_t backpressure_drops = 0;
  };

  explicit BroadcastHub(const Config& cfg) : cfg_(cfg), registry_(std::make_shared<Registry>()) {}

  uint32_t connect(const Scope& scope, const std::shared_ptr<ClientChannel>& channel);

  // Idempotent. Returns false when the id was not connected.
  bool disconnect(uint32_t connectionId);

  // Replaces a connection's subscription scope.
  bool subscribe(uint32_t connectionId, const Scope& scope);

  // Queues the envelope for every connection whose scope admits the event.
  // A non-empty field in `filter` narrows the event's own scope.
  // Returns how many connections it was queued for.
  size_t broadcast(const BroadcastEnvelope& env, const Scope& filter = Scope());

  // Writes up to maxFrames queued frames per connection whose channel can
  // take them. Returns frames written.
  size_t pump(size_t maxFrames);

  // Drops every connection.
  void shutdown();

  bool queueDepth(uint32_t connectionId, size_t& depth) const;
  bool backpressureOf(uint32_t connectionId, uint32_t& drops) const;
  size_t connectionCount() const;
  Stats stats() const;

private:
  struct Connection {
    uint32_t id = 0;
    std::shared_ptr<ClientChannel> channel;

    mutable std::mutex mu;
    Scope scope;
    std::deque<std::string> queue;
    uint32_t backpressure = 0;
    bool closed = false;
  };

  using ConnectionPtr = std::shared_ptr<Connection>;
  using Registry = std::vector<ConnectionPtr>;

  const Config& cfg_;

  mutable std::mutex regMu_;
  std::shared_ptr<const Registry> registry_;

  std::atomic<uint32_t> nextId_{1};
  std::atomic<uint32_t> broadcasts_{0};
  std::atomic<uint32_t> enqueued_{0};
  std::atomic<uint32_t> framesSent_{0};
  std::atomic<uint32_t> drops_{0};

  std::shared_ptr<const Registry> snapshot() const;
  ConnectionPtr lookup(uint32_t connectionId) const;
};
