#pragma once

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "docqa_core/cache/answer_cache.hpp"
#include "docqa_core/cache/memory_blob_store.hpp"
#include "docqa_core/db/database_manager.hpp"
#include "docqa_core/embedding/embedding_provider.hpp"
#include "docqa_core/extractors/block_extractor_factory.hpp"
#include "docqa_core/index/document_index_cache.hpp"
#include "docqa_core/index/vector_index.hpp"
#include "docqa_core/retrieval/answer_generator.hpp"
#include "docqa_core/retrieval/query_expander.hpp"
#include "docqa_core/retrieval/reranker.hpp"
#include "docqa_core/retrieval/retrieval_orchestrator.hpp"
#include "docqa_core/routing/question_router.hpp"
#include "docqa_core/segmentation/chunk_segmenter.hpp"
#include "docqa_core/segmentation/fixed_window_strategy.hpp"
#include "docqa_core/services/document_qa_service.hpp"
#include "docqa_core/services/interaction_log.hpp"
#include "docqa_core/services/service_provider.hpp"
#include "docqa_core/types/text_unit.hpp"
#include "mocks_test.hpp"

namespace docqa_tests {

/**
 * Utility class providing common functionality for all tests
 */
class TestUtilities {
 public:
  // Database utilities
  static std::filesystem::path create_temp_test_db();
  static void cleanup_temp_db(const std::filesystem::path& db_path);
  static std::filesystem::path create_temp_path(const std::string& suffix);

  // Test data creation
  static std::vector<docqa_core::RawBlock> create_paragraph_blocks(
      const std::vector<std::string>& paragraphs);

  static docqa_core::RawBlock create_table_block(int rows, int columns,
                                                 const std::string& prefix = "cell");

  static std::vector<docqa_core::TextUnit> create_units(const std::vector<std::string>& contents);

  // Policy with no real waiting, for generator and orchestrator tests
  static docqa_core::RetryPolicy fast_retry_policy(int max_attempts = 5);

  static std::chrono::steady_clock::time_point deadline_in(std::chrono::milliseconds budget);
};

/**
 * Base fixture for tests that need a fresh cache database
 */
class CacheDatabaseTestBase : public ::testing::Test {
 protected:
  void SetUp() override {
    temp_db_path_ = TestUtilities::create_temp_test_db();
    db_manager_ = std::make_unique<docqa_core::DatabaseManager>(temp_db_path_, test_db_key_,
                                                                /*pool_size*/ 4);
  }

  void TearDown() override {
    db_manager_.reset();
    TestUtilities::cleanup_temp_db(temp_db_path_);
  }

  std::filesystem::path temp_db_path_;
  std::string test_db_key_ = "docqa_test_key";
  std::unique_ptr<docqa_core::DatabaseManager> db_manager_;
};

/**
 * Base fixture wiring the answering pipeline to mocks and in-memory stores
 */
class QaPipelineTestBase : public ::testing::Test {
 protected:
  void SetUp() override {
    store_ = std::make_shared<docqa_core::MemoryBlobStore>(1000);
    embeddings_ = std::make_shared<docqa_core::EmbeddingProvider>(embedding_client_,
                                                                  kTestDimension);
    expander_ = std::make_unique<docqa_core::QueryExpander>(generation_client_, store_, 3);
    reranker_ = std::make_unique<docqa_core::Reranker>(scorer_);
    generator_ = std::make_unique<docqa_core::AnswerGenerator>(
        generation_client_, TestUtilities::fast_retry_policy(),
        [](std::chrono::milliseconds, const docqa_core::async::CancellationToken&) {});
    answer_cache_ = std::make_unique<docqa_core::AnswerCache>(store_);
    build_orchestrator();
  }

  void TearDown() override {
    orchestrator_.reset();
  }

  // Rebuilds the orchestrator, e.g. after changing router_ or options_
  void build_orchestrator() {
    orchestrator_.reset();
    orchestrator_ = std::make_shared<docqa_core::RetrievalOrchestrator>(
        *expander_, *reranker_, *generator_, *answer_cache_, router_, options_, /*workers*/ 4);
  }

  std::shared_ptr<docqa_core::VectorIndex> build_index(const std::vector<std::string>& contents) {
    auto index = std::make_shared<docqa_core::VectorIndex>(*embeddings_);
    index->build(TestUtilities::create_units(contents));
    return index;
  }

  // Expansion calls carry json_output; answer calls do not
  static bool is_expansion_request(const docqa_core::GenerationRequest& request) {
    return request.json_output;
  }

  testing::NiceMock<MockEmbeddingClient> embedding_client_;
  testing::NiceMock<MockTextGenerationClient> generation_client_;
  testing::NiceMock<MockRelevanceScorer> scorer_;

  std::shared_ptr<docqa_core::MemoryBlobStore> store_;
  std::shared_ptr<docqa_core::EmbeddingProvider> embeddings_;
  std::unique_ptr<docqa_core::QueryExpander> expander_;
  std::unique_ptr<docqa_core::Reranker> reranker_;
  std::unique_ptr<docqa_core::AnswerGenerator> generator_;
  std::unique_ptr<docqa_core::AnswerCache> answer_cache_;
  docqa_core::QuestionRouter router_;
  docqa_core::RetrievalOptions options_;
  std::shared_ptr<docqa_core::RetrievalOrchestrator> orchestrator_;
};

/**
 * Full DocumentQaService over the mocked pipeline, with a mocked document fetcher
 */
class DocumentQaServiceTestBase : public QaPipelineTestBase {
 protected:
  void SetUp() override {
    QaPipelineTestBase::SetUp();
    fetcher_ = std::make_shared<testing::NiceMock<MockDocumentFetcher>>();
    index_cache_ = std::make_shared<docqa_core::DocumentIndexCache>(store_, *embeddings_, 16,
                                                                    "test-index");
    log_path_ = TestUtilities::create_temp_path(".jsonl");
    build_service();
  }

  void TearDown() override {
    service_.reset();
    std::error_code ec;
    std::filesystem::remove(log_path_, ec);
    QaPipelineTestBase::TearDown();
  }

  // Rebuilds the service, e.g. after changing qa_options_ or segmenter_size_
  void build_service() {
    service_.reset();
    auto segmenter = std::make_shared<docqa_core::ChunkSegmenter>(
        std::make_unique<docqa_core::FixedWindowStrategy>(segmenter_size_, segmenter_size_ / 10));
    services_ = std::make_shared<docqa_core::ServiceProvider>(
        fetcher_, std::make_shared<docqa_core::BlockExtractorFactory>(), segmenter, embeddings_,
        index_cache_, orchestrator_, std::make_shared<docqa_core::InteractionLog>(log_path_));
    service_ = std::make_shared<docqa_core::DocumentQaService>(services_, qa_options_);
  }

  void serve_document(const std::string& body, const std::string& content_type = "text/plain") {
    ON_CALL(*fetcher_, fetch(testing::_))
        .WillByDefault([body, content_type](const std::string& url) {
          return docqa_core::FetchedDocument{url, content_type, body};
        });
  }

  std::shared_ptr<testing::NiceMock<MockDocumentFetcher>> fetcher_;
  std::shared_ptr<docqa_core::DocumentIndexCache> index_cache_;
  std::shared_ptr<docqa_core::ServiceProvider> services_;
  std::shared_ptr<docqa_core::DocumentQaService> service_;
  docqa_core::QaServiceOptions qa_options_;
  size_t segmenter_size_ = 2000;
  std::filesystem::path log_path_;
};

}  // namespace docqa_tests
