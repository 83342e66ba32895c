#include "docqa_core/db/database_manager.hpp"

#include <stdexcept>

namespace docqa_core {

DatabaseManager::DatabaseManager(const std::filesystem::path& db_path,
                                 const std::string& db_key,
                                 int pool_size)
    : db_path_(db_path) {
  if (db_path_.has_parent_path()) {
    std::filesystem::create_directories(db_path_.parent_path());
  }

  // Schema setup runs once on a private connection before the pool exists
  setup_schema(db_key);
  pool_ = std::make_unique<ConnectionPool>(db_path_.string(), db_key, pool_size);
  is_initialized_ = true;
}

DatabaseManager::~DatabaseManager() {
  shutdown();
}

void DatabaseManager::shutdown() {
  if (!is_initialized_) {
    return;
  }
  pool_->shutdown();
  is_initialized_ = false;
}

ConnectionPool::Lease DatabaseManager::acquire() {
  if (!is_initialized_) {
    throw std::runtime_error("DatabaseManager has been shut down.");
  }
  return pool_->acquire();
}

size_t DatabaseManager::idle_connections() {
  return is_initialized_ ? pool_->idle_connections() : 0;
}

void DatabaseManager::setup_schema(const std::string& db_key) {
  auto db = ConnectionPool::open_connection(db_path_.string(), db_key);

  // Content-addressed blobs: index snapshots, query expansions and answers
  *db << R"(
      CREATE TABLE IF NOT EXISTS cache_entries (
          cache_key TEXT PRIMARY KEY,
          value BLOB NOT NULL,
          created_at INTEGER NOT NULL,
          last_access INTEGER NOT NULL
      )
    )";
  *db << R"(
      CREATE INDEX IF NOT EXISTS idx_cache_entries_last_access
      ON cache_entries(last_access)
    )";
}

}  // namespace docqa_core
