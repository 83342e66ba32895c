#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "../../common/utilities_test.hpp"

namespace docqa_tests {

class DatabaseManagerTest : public CacheDatabaseTestBase {};

TEST_F(DatabaseManagerTest, CreatesCacheSchema) {
  auto conn = db_manager_->acquire();
  int tables = 0;
  *conn << "SELECT COUNT(*) FROM sqlite_master WHERE type = 'table' AND name = 'cache_entries';" >>
      tables;
  EXPECT_EQ(tables, 1);
  EXPECT_TRUE(db_manager_->is_open());
  EXPECT_EQ(db_manager_->path(), temp_db_path_);
}

TEST_F(DatabaseManagerTest, CreatesMissingParentDirectories) {
  auto dir = TestUtilities::create_temp_path("_dir");
  auto nested = dir / "a" / "b" / "cache.db";
  {
    docqa_core::DatabaseManager manager(nested, "", 1);
    EXPECT_TRUE(std::filesystem::exists(nested));
  }
  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
}

TEST_F(DatabaseManagerTest, LeaseReturnsConnectionWhenItEnds) {
  EXPECT_EQ(db_manager_->idle_connections(), 4u);
  {
    auto first = db_manager_->acquire();
    auto second = db_manager_->acquire();
    EXPECT_EQ(db_manager_->idle_connections(), 2u);
  }
  EXPECT_EQ(db_manager_->idle_connections(), 4u);
}

TEST_F(DatabaseManagerTest, MovedLeaseReturnsConnectionOnce) {
  {
    auto original = db_manager_->acquire();
    docqa_core::ConnectionPool::Lease moved(std::move(original));
    int one = 0;
    *moved << "SELECT 1;" >> one;
    EXPECT_EQ(one, 1);
    EXPECT_EQ(db_manager_->idle_connections(), 3u);
  }
  EXPECT_EQ(db_manager_->idle_connections(), 4u);
}

TEST_F(DatabaseManagerTest, ShutdownRejectsNewBorrowers) {
  db_manager_->shutdown();
  EXPECT_FALSE(db_manager_->is_open());
  EXPECT_THROW(db_manager_->acquire(), std::runtime_error);
  EXPECT_EQ(db_manager_->idle_connections(), 0u);
  // Idempotent
  EXPECT_NO_THROW(db_manager_->shutdown());
}

TEST_F(DatabaseManagerTest, LeaseOutlivingShutdownIsDropped) {
  auto held = db_manager_->acquire();
  db_manager_->shutdown();
  int one = 0;
  *held << "SELECT 1;" >> one;
  EXPECT_EQ(one, 1);
}

TEST_F(DatabaseManagerTest, WrongKeyFailsToOpen) {
  db_manager_.reset();
  EXPECT_ANY_THROW(docqa_core::DatabaseManager(temp_db_path_, "a different key", 1));
}

}  // namespace docqa_tests
