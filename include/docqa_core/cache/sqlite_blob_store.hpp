#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

#include "docqa_core/cache/blob_store.hpp"
#include "docqa_core/db/database_manager.hpp"

namespace docqa_core {

/**
 * @brief Disk-backed blob store in the cache_entries table.
 *
 * Bounded two ways: entries older than `ttl` are treated as absent and purged, and
 * once the table holds more than `max_entries` rows the least recently accessed rows
 * are evicted. A ttl of zero disables expiry.
 */
class SqliteBlobStore : public BlobStore {
 public:
  using NowFn = std::function<std::int64_t()>;

  SqliteBlobStore(DatabaseManager& db_manager, size_t max_entries,
                  std::chrono::seconds ttl = std::chrono::seconds(0), NowFn now_seconds = nullptr);

  std::optional<std::vector<char>> get(const std::string& key) override;
  void put(const std::string& key, const std::vector<char>& value) override;

  size_t count();
  // Deletes every expired row; returns how many were removed
  size_t purge_expired();

 private:
  DatabaseManager& db_manager_;
  size_t max_entries_;
  std::chrono::seconds ttl_;
  NowFn now_seconds_;

  bool is_expired(std::int64_t created_at, std::int64_t now) const;

  // Runs `fn` on a borrowed connection; database and pool failures become BlobStoreError
  template <typename Fn>
  auto with_connection(const char* operation, Fn&& fn);
};

}  // namespace docqa_core
