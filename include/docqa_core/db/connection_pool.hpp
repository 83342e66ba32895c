#pragma once
#include <sqlite_modern_cpp.h>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <queue>
#include <string>

namespace docqa_core {

// Fixed set of keyed connections to the cache database, handed out one caller at a time
class ConnectionPool {
public:
    /**
     * @brief A connection borrowed from the pool.
     *
     * Goes back to the pool when the lease is destroyed, or is dropped if the pool has
     * been shut down in the meantime. A lease must not outlive its pool.
     */
    class Lease {
    public:
        Lease(ConnectionPool& pool, std::unique_ptr<sqlite::database> conn);
        Lease(Lease&& other) noexcept;
        ~Lease();

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        Lease& operator=(Lease&&) = delete;

        sqlite::database& operator*() const { return *conn_; }
        sqlite::database* operator->() const { return conn_.get(); }

    private:
        ConnectionPool* pool_;
        std::unique_ptr<sqlite::database> conn_;
    };

    ConnectionPool(const std::string& db_path, const std::string& db_key, int pool_size);

    // Blocks until a connection is free. Throws once the pool is shut down.
    Lease acquire();

    std::unique_ptr<sqlite::database> get_connection();
    void return_connection(std::unique_ptr<sqlite::database> conn);
    void shutdown();
    size_t idle_connections();

    // Opens one connection, applies the key and the connection pragmas
    static std::unique_ptr<sqlite::database> open_connection(const std::string& db_path,
                                                             const std::string& db_key);

private:
    bool shutting_down_ = false;
    std::string db_path_;
    std::string db_key_;
    std::queue<std::unique_ptr<sqlite::database>> pool_;
    std::mutex mtx_;
    std::condition_variable cv_;
};

} // namespace docqa_core
