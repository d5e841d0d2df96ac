/*
  ResultCache: bounded LRU cache of immutable results with a fixed TTL.

  Values are stored as std::shared_ptr<const Value>, so a reader keeps its
  snapshot alive even after the entry is evicted or invalidated. Each entry
  may be tagged with the entity ids it was computed from; invalidate_entity()
  drops every entry carrying a given id. There is no automatic invalidation:
  callers must invalidate when relationship data changes, otherwise staleness
  is bounded only by the TTL.
*/
#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include "amlnet/core/types.hpp"

namespace amlnet::core {

template <typename Key, typename Value, typename Hash = std::hash<Key>>
class ResultCache {
public:
  using Clock = std::chrono::steady_clock;
  using NowFn = std::function<Clock::time_point()>;
  using ValuePtr = std::shared_ptr<const Value>;

  explicit ResultCache(std::size_t max_entries,
                       std::chrono::seconds ttl = std::chrono::seconds(900),
                       NowFn now = [] { return Clock::now(); })
      : max_entries_(max_entries), ttl_(ttl), now_(std::move(now)) {}

  // Returns nullptr on miss or expiry; expired entries are removed.
  [[nodiscard]] ValuePtr get(const Key& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = map_.find(key);
    if (it == map_.end()) {
      ++misses_;
      return nullptr;
    }
    if (now_() >= it->second.expiry) {
      order_.erase(it->second.order_it);
      map_.erase(it);
      ++misses_;
      return nullptr;
    }
    order_.splice(order_.begin(), order_, it->second.order_it);
    ++hits_;
    return it->second.value;
  }

  void put(const Key& key, ValuePtr value, std::vector<EntityId> entity_tags = {}) {
    if (max_entries_ == 0) return;
    std::lock_guard<std::mutex> lock(mutex_);
    const auto expiry = now_() + ttl_;
    auto it = map_.find(key);
    if (it != map_.end()) {
      it->second.value = std::move(value);
      it->second.expiry = expiry;
      it->second.tags = {entity_tags.begin(), entity_tags.end()};
      order_.splice(order_.begin(), order_, it->second.order_it);
      return;
    }
    if (map_.size() >= max_entries_) {
      // Evict least recently used
      map_.erase(order_.back());
      order_.pop_back();
    }
    order_.push_front(key);
    map_.emplace(key, Entry{std::move(value), order_.begin(), expiry,
                            {entity_tags.begin(), entity_tags.end()}});
  }

  void invalidate_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    map_.clear();
    order_.clear();
  }

  // Drops every entry tagged with `id`; returns the number removed.
  std::size_t invalidate_entity(const EntityId& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t removed = 0;
    for (auto it = map_.begin(); it != map_.end();) {
      if (it->second.tags.count(id) != 0) {
        order_.erase(it->second.order_it);
        it = map_.erase(it);
        ++removed;
      } else {
        ++it;
      }
    }
    return removed;
  }

  [[nodiscard]] std::size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return map_.size();
  }
  [[nodiscard]] std::size_t hits() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hits_;
  }
  [[nodiscard]] std::size_t misses() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return misses_;
  }
  [[nodiscard]] std::chrono::seconds ttl() const noexcept { return ttl_; }

private:
  struct Entry {
    ValuePtr value;
    typename std::list<Key>::iterator order_it;
    Clock::time_point expiry;
    std::unordered_set<EntityId> tags;
  };

  std::size_t max_entries_;
  std::chrono::seconds ttl_;
  NowFn now_;
  std::list<Key> order_ {};
  std::unordered_map<Key, Entry, Hash> map_ {};
  std::size_t hits_ {0};
  std::size_t misses_ {0};
  mutable std::mutex mutex_;
};

} // namespace amlnet::core
