#include "docqa_core/cache/sqlite_blob_store.hpp"

#include <iostream>
#include <stdexcept>

#include "docqa_core/db/sqlite_error_utils.hpp"

namespace docqa_core {

SqliteBlobStore::SqliteBlobStore(DatabaseManager& db_manager, size_t max_entries,
                                 std::chrono::seconds ttl, NowFn now_seconds)
    : db_manager_(db_manager),
      max_entries_(max_entries),
      ttl_(ttl),
      now_seconds_(std::move(now_seconds)) {
  if (max_entries_ == 0) {
    throw std::invalid_argument("SqliteBlobStore capacity must be positive");
  }
  if (!now_seconds_) {
    now_seconds_ = [] {
      return std::chrono::duration_cast<std::chrono::seconds>(
                 std::chrono::system_clock::now().time_since_epoch())
          .count();
    };
  }
}

template <typename Fn>
auto SqliteBlobStore::with_connection(const char* operation, Fn&& fn) {
  try {
    ConnectionPool::Lease db = db_manager_.acquire();
    return fn(*db);
  } catch (const sqlite::sqlite_exception& e) {
    throw BlobStoreError(format_db_error(operation, e));
  } catch (const std::runtime_error& e) {
    // Pool shut down or connection could not be opened
    throw BlobStoreError(std::string(operation) + " failed: " + e.what());
  }
}

bool SqliteBlobStore::is_expired(std::int64_t created_at, std::int64_t now) const {
  return ttl_.count() > 0 && now - created_at >= ttl_.count();
}

std::optional<std::vector<char>> SqliteBlobStore::get(const std::string& key) {
  return with_connection("cache get", [&](sqlite::database& db) -> std::optional<std::vector<char>> {
    const std::int64_t now = now_seconds_();

    std::optional<std::vector<char>> value;
    std::int64_t created_at = 0;
    db << "SELECT value, created_at FROM cache_entries WHERE cache_key = ?;" << key >>
        [&](std::vector<char> blob, std::int64_t created) {
          value = std::move(blob);
          created_at = created;
        };

    if (!value) {
      return std::nullopt;
    }
    if (is_expired(created_at, now)) {
      db << "DELETE FROM cache_entries WHERE cache_key = ?;" << key;
      return std::nullopt;
    }

    db << "UPDATE cache_entries SET last_access = ? WHERE cache_key = ?;" << now << key;
    return value;
  });
}

/**
 * @brief Upserts one entry and evicts the least recently used rows beyond max_entries_.
 *
 * Insert and eviction run in one IMMEDIATE transaction so concurrent writers never see
 * the table above its bound. Any failure rolls the transaction back before the error
 * leaves this function.
 */
void SqliteBlobStore::put(const std::string& key, const std::vector<char>& value) {
  with_connection("cache put", [&](sqlite::database& db) {
    const std::int64_t now = now_seconds_();

    db << "BEGIN IMMEDIATE;";
    try {
      db << "INSERT INTO cache_entries (cache_key, value, created_at, last_access) "
            "VALUES (?, ?, ?, ?) "
            "ON CONFLICT(cache_key) DO UPDATE SET value = excluded.value, "
            "created_at = excluded.created_at, last_access = excluded.last_access;"
         << key << value << now << now;

      std::int64_t total = 0;
      db << "SELECT COUNT(*) FROM cache_entries;" >> total;
      if (total > static_cast<std::int64_t>(max_entries_)) {
        const std::int64_t excess = total - static_cast<std::int64_t>(max_entries_);
        db << "DELETE FROM cache_entries WHERE cache_key IN ("
              "SELECT cache_key FROM cache_entries ORDER BY last_access ASC, created_at ASC "
              "LIMIT ?);"
           << excess;
      }
      db << "COMMIT;";
    } catch (const sqlite::sqlite_exception&) {
      try {
        db << "ROLLBACK;";
      } catch (const sqlite::sqlite_exception& rollback_error) {
        std::cerr << "[SqliteBlobStore] Rollback failed: " << rollback_error.what() << std::endl;
      }
      throw;
    }
  });
}

size_t SqliteBlobStore::count() {
  return with_connection("cache count", [](sqlite::database& db) {
    std::int64_t total = 0;
    db << "SELECT COUNT(*) FROM cache_entries;" >> total;
    return static_cast<size_t>(total);
  });
}

size_t SqliteBlobStore::purge_expired() {
  if (ttl_.count() <= 0) {
    return 0;
  }
  return with_connection("cache purge", [&](sqlite::database& db) {
    const std::int64_t cutoff = now_seconds_() - ttl_.count();
    db << "DELETE FROM cache_entries WHERE created_at <= ?;" << cutoff;
    const auto removed = static_cast<size_t>(db.rows_modified());
    if (removed > 0) {
      std::cout << "[SqliteBlobStore] Purged " << removed << " expired cache entries" << std::endl;
    }
    return removed;
  });
}

}  // namespace docqa_core
