#pragma once

#include <stddef.h>

#include <functional>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <utility>
#include <vector>

// Sharded map with one mutex per record.
// - Shard mutexes only guard the index and are never held while waiting on a
//   record mutex, so updates to different keys never serialize on each other.
// - A record is mutated only while its own mutex is held (single writer per key).
// - Removal marks the record dead under its mutex before unlinking it; holders
//   of a stale pointer observe `removed` and re-acquire.
template <typename K, typename V, size_t Shards = 16>
class KeyedStore {
public:
  static_assert(Shards > 0, "KeyedStore needs at least one shard");

  struct Record {
    std::mutex mu;
    bool removed = false;
    V value{};
  };
  using RecordPtr = std::shared_ptr<Record>;

  // Runs fn(value, created) with the key's record locked, creating it first
  // when absent. Returns whatever fn returns.
  template <typename Fn>
  auto upsert(const K& key, Fn fn) -> decltype(fn(std::declval<V&>(), false)) {
    for (;;) {
      bool created = false;
      RecordPtr rec = acquire(key, created);
      std::lock_guard<std::mutex> lk(rec->mu);
      if (rec->removed) continue;
      return fn(rec->value, created);
    }
  }

  // Runs fn(value) with the record locked if the key exists.
  template <typename Fn>
  bool update(const K& key, Fn fn) {
    for (;;) {
      RecordPtr rec = find(key);
      if (!rec) return false;
      std::lock_guard<std::mutex> lk(rec->mu);
      if (rec->removed) continue;
      fn(rec->value);
      return true;
    }
  }

  // Like update(), but fn returns true to drop the record afterwards.
  template <typename Fn>
  bool updateOrRemove(const K& key, Fn fn) {
    for (;;) {
      RecordPtr rec = find(key);
      if (!rec) return false;
      std::lock_guard<std::mutex> lk(rec->mu);
      if (rec->removed) continue;
      if (fn(rec->value)) {
        rec->removed = true;
        unlink(key, rec);
      }
      return true;
    }
  }

  bool read(const K& key, V& out) const {
    RecordPtr rec = find(key);
    if (!rec) return false;
    std::lock_guard<std::mutex> lk(rec->mu);
    if (rec->removed) return false;
    out = rec->value;
    return true;
  }

  // Record pointers at this instant; callers lock each one individually.
  std::vector<std::pair<K, RecordPtr>> records() const {
    std::vector<std::pair<K, RecordPtr>> out;
    for (size_t i = 0; i < Shards; ++i) {
      std::lock_guard<std::mutex> lk(shards_[i].mu);
      for (const auto& kv : shards_[i].index) out.push_back(kv);
    }
    return out;
  }

  size_t size() const {
    size_t n = 0;
    for (size_t i = 0; i < Shards; ++i) {
      std::lock_guard<std::mutex> lk(shards_[i].mu);
      n += shards_[i].index.size();
    }
    return n;
  }

private:
  struct Shard {
    mutable std::mutex mu;
    std::unordered_map<K, RecordPtr> index;
  };

  Shard shards_[Shards];

  Shard& shardFor(const K& key) {
    return shards_[std::hash<K>()(key) % Shards];
  }

  const Shard& shardFor(const K& key) const {
    return shards_[std::hash<K>()(key) % Shards];
  }

  RecordPtr acquire(const K& key, bool& created) {
    Shard& sh = shardFor(key);
    std::lock_guard<std::mutex> lk(sh.mu);
    auto it = sh.index.find(key);
    if (it != sh.index.end()) {
      created = false;
      return it->second;
    }
    RecordPtr rec = std::make_shared<Record>();
    sh.index.emplace(key, rec);
    created = true;
    return rec;
  }

  RecordPtr find(const K& key) const {
    const Shard& sh = shardFor(key);
    std::lock_guard<std::mutex> lk(sh.mu);
    auto it = sh.index.find(key);
    return (it == sh.index.end()) ? RecordPtr() : it->second;
  }

  void unlink(const K& key, const RecordPtr& rec) {
    Shard& sh = shardFor(key);
    std::lock_guard<std::mutex> lk(sh.mu);
    auto it = sh.index.find(key);
    if (it != sh.index.end() && it->second == rec) sh.index.erase(it);
  }
};
