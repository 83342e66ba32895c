#pragma once

#include <chrono>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <unordered_map>

namespace docqa_core {

/**
 * @brief Thread-safe bounded map with least-recently-used eviction and optional TTL.
 *
 * A ttl of zero disables expiry. The clock is injectable for tests.
 */
template <typename Key, typename Value>
class LRUCache {
 public:
  using Clock = std::chrono::steady_clock;
  using NowFn = std::function<Clock::time_point()>;

  explicit LRUCache(size_t max_entries, std::chrono::seconds ttl = std::chrono::seconds(0),
                    NowFn now = [] { return Clock::now(); })
      : max_entries_(max_entries), ttl_(ttl), now_(std::move(now)) {
    if (max_entries_ == 0) {
      throw std::invalid_argument("LRUCache capacity must be positive");
    }
  }

  std::optional<Value> get(const Key& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
      return std::nullopt;
    }
    if (expired(it->second)) {
      recency_.erase(it->second.recency_it);
      entries_.erase(it);
      return std::nullopt;
    }
    recency_.splice(recency_.begin(), recency_, it->second.recency_it);
    return it->second.value;
  }

  void put(const Key& key, Value value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it != entries_.end()) {
      it->second.value = std::move(value);
      it->second.inserted_at = now_();
      recency_.splice(recency_.begin(), recency_, it->second.recency_it);
      return;
    }

    while (entries_.size() >= max_entries_) {
      entries_.erase(recency_.back());
      recency_.pop_back();
    }
    recency_.push_front(key);
    entries_.emplace(key, Entry{std::move(value), recency_.begin(), now_()});
  }

  bool erase(const Key& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
      return false;
    }
    recency_.erase(it->second.recency_it);
    entries_.erase(it);
    return true;
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    recency_.clear();
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
  }

  size_t capacity() const {
    return max_entries_;
  }

 private:
  struct Entry {
    Value value;
    typename std::list<Key>::iterator recency_it;
    Clock::time_point inserted_at;
  };

  bool expired(const Entry& entry) const {
    return ttl_.count() > 0 && now_() - entry.inserted_at >= ttl_;
  }

  size_t max_entries_;
  std::chrono::seconds ttl_;
  NowFn now_;
  // Most recently used at the front
  std::list<Key> recency_;
  std::unordered_map<Key, Entry> entries_;
  mutable std::mutex mutex_;
};

}  // namespace docqa_core
