#pragma once

#include <chrono>

#include "docqa_core/cache/blob_store.hpp"
#include "docqa_core/cache/lru_cache.hpp"

namespace docqa_core {

// In-process blob store; contents are lost on restart
class MemoryBlobStore : public BlobStore {
 public:
  explicit MemoryBlobStore(size_t max_entries, std::chrono::seconds ttl = std::chrono::seconds(0))
      : cache_(max_entries, ttl) {}

  std::optional<std::vector<char>> get(const std::string& key) override {
    return cache_.get(key);
  }

  void put(const std::string& key, const std::vector<char>& value) override {
    cache_.put(key, value);
  }

  size_t size() const {
    return cache_.size();
  }

 private:
  LRUCache<std::string, std::vector<char>> cache_;
};

}  // namespace docqa_core
