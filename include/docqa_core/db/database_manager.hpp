#pragma once

#include "docqa_core/db/connection_pool.hpp"
#include <filesystem>
#include <memory>
#include <string>

namespace docqa_core {

/**
 * @brief Owns the cache database: schema creation and the connection pool.
 *
 * One instance per database file, created at process start and passed to the stores
 * that need it. Connections are borrowed as ConnectionPool leases.
 */
class DatabaseManager {
public:
    DatabaseManager(const std::filesystem::path& db_path, const std::string& db_key, int pool_size);
    ~DatabaseManager();

    // Borrows a pooled connection; throws std::runtime_error after shutdown()
    ConnectionPool::Lease acquire();
    size_t idle_connections();

    void shutdown();
    bool is_open() const { return is_initialized_; }
    const std::filesystem::path& path() const { return db_path_; }

    DatabaseManager(const DatabaseManager&) = delete;
    DatabaseManager& operator=(const DatabaseManager&) = delete;

private:
    void setup_schema(const std::string& db_key);

    std::filesystem::path db_path_;
    std::unique_ptr<ConnectionPool> pool_;
    bool is_initialized_ = false;
};

} // namespace docqa_core
