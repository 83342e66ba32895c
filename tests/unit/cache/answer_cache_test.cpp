#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <set>

#include "docqa_core/cache/answer_cache.hpp"
#include "docqa_core/cache/memory_blob_store.hpp"

namespace docqa_core {

using ::testing::_;
using ::testing::Throw;

class FailingBlobStore : public BlobStore {
 public:
  MOCK_METHOD(std::optional<std::vector<char>>, get, (const std::string& key), (override));
  MOCK_METHOD(void, put, (const std::string& key, const std::vector<char>& value), (override));
};

TEST(AnswerCacheTest, StoresAndReturnsAnswers) {
  AnswerCache cache(std::make_shared<MemoryBlobStore>(10));
  const auto key = AnswerCache::make_key(AnswerPath::Rag, "fp", "q");

  EXPECT_FALSE(cache.get(key).has_value());
  cache.put(key, "The answer.");
  EXPECT_EQ(cache.get(key), std::optional<std::string>("The answer."));
}

TEST(AnswerCacheTest, KeysSeparatePathsDocumentsAndQuestions) {
  std::set<std::string> keys = {
      AnswerCache::make_key(AnswerPath::Rag, "doc1", "q"),
      AnswerCache::make_key(AnswerPath::Rag, "doc2", "q"),
      AnswerCache::make_key(AnswerPath::Rag, "doc1", "q2"),
      AnswerCache::make_key(AnswerPath::GeneralKnowledge, "", "q"),
      AnswerCache::make_key(AnswerPath::TimeoutFallback, "", "q"),
      AnswerCache::make_key(AnswerPath::ShortDocument, "doc1", "q"),
  };
  EXPECT_EQ(keys.size(), 6u);
  EXPECT_EQ(AnswerCache::make_key(AnswerPath::Rag, "doc1", "q"),
            AnswerCache::make_key(AnswerPath::Rag, "doc1", "q"));
  EXPECT_EQ(AnswerCache::make_key(AnswerPath::Rag, "d", "q").rfind("answer:", 0), 0u);
}

TEST(AnswerCacheTest, StoreFailuresAreSwallowedAsMisses) {
  auto store = std::make_shared<FailingBlobStore>();
  AnswerCache cache(store);
  EXPECT_CALL(*store, get(_)).WillOnce(Throw(BlobStoreError("corrupt")));
  EXPECT_CALL(*store, put(_, _)).WillOnce(Throw(BlobStoreError("full")));

  EXPECT_FALSE(cache.get("k").has_value());
  EXPECT_NO_THROW(cache.put("k", "v"));
}

TEST(AnswerCacheTest, RequiresStore) {
  EXPECT_THROW(AnswerCache(nullptr), std::invalid_argument);
}

TEST(AnswerPathTest, NamesAreStable) {
  EXPECT_EQ(to_string(AnswerPath::GeneralKnowledge), "general_knowledge");
  EXPECT_EQ(to_string(AnswerPath::Rag), "rag");
  EXPECT_EQ(to_string(AnswerPath::TimeoutFallback), "timeout_fallback");
  EXPECT_EQ(to_string(AnswerPath::ShortDocument), "short_document");
}

}  // namespace docqa_core
