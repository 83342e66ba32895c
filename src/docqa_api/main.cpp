#include <atomic>
#include <condition_variable>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <memory>
#include <mutex>

#include "docqa_api/config.hpp"
#include "docqa_api/routes.hpp"
#include "docqa_api/server.hpp"
#include "docqa_core/cache/answer_cache.hpp"
#include "docqa_core/cache/memory_blob_store.hpp"
#include "docqa_core/cache/sqlite_blob_store.hpp"
#include "docqa_core/cache/tiered_blob_store.hpp"
#include "docqa_core/db/database_manager.hpp"
#include "docqa_core/embedding/embedding_provider.hpp"
#include "docqa_core/extractors/block_extractor_factory.hpp"
#include "docqa_core/index/document_index_cache.hpp"
#include "docqa_core/ingest/document_fetcher.hpp"
#include "docqa_core/llm/http_rerank_client.hpp"
#include "docqa_core/llm/ollama_client.hpp"
#include "docqa_core/retrieval/retrieval_orchestrator.hpp"
#include "docqa_core/segmentation/chunk_segmenter.hpp"
#include "docqa_core/segmentation/fixed_window_strategy.hpp"
#include "docqa_core/segmentation/semantic_strategy.hpp"
#include "docqa_core/services/document_qa_service.hpp"
#include "docqa_core/services/interaction_log.hpp"
#include "docqa_core/services/service_provider.hpp"

std::atomic<bool> shutdown_requested = false;
std::mutex shutdown_mutex;
std::condition_variable shutdown_cv;

// The signal handler function
void signal_handler(int signal) {
  std::cout << "\nShutdown signal (" << signal << ") received. Initiating graceful shutdown..."
            << std::endl;
  shutdown_requested = true;
  shutdown_cv.notify_one();  // Wake up the main thread
}

namespace {

docqa_core::SegmentationStrategyPtr make_strategy(const docqa_api::Config& config,
                                                  docqa_core::EmbeddingProvider& embeddings) {
  if (config.segmentation_strategy == "semantic") {
    return std::make_unique<docqa_core::SemanticStrategy>(
        embeddings, static_cast<size_t>(config.chunk_size), config.semantic_percentile);
  }
  return std::make_unique<docqa_core::FixedWindowStrategy>(static_cast<size_t>(config.chunk_size),
                                                           static_cast<size_t>(config.chunk_overlap));
}

}  // namespace

int main() {
  try {
    docqa_api::Config config = docqa_api::Config::from_file(docqa_api::Config::default_path());

    std::cout << "Starting DocQA API Server..." << std::endl;
    std::cout << "Server URL: " << config.api_base_url << std::endl;
    std::cout << "Ollama URL: " << config.ollama_url << std::endl;
    std::cout << "Embedding Model: " << config.embedding_model << std::endl;
    std::cout << "Generation Model: " << config.generation_model << std::endl;
    std::cout << "Reranker URL: " << config.reranker_url << std::endl;
    std::cout << "Segmentation: " << config.segmentation_strategy << std::endl;
    std::cout << "Cache DB Path: " << config.cache_db_path << std::endl;
    std::cout << "Bearer Auth: " << (config.bearer_token.empty() ? "disabled" : "enabled")
              << std::endl;

    // Model clients
    auto embedding_client =
        std::make_shared<docqa_core::OllamaClient>(config.ollama_url, config.embedding_model);
    auto expansion_client =
        std::make_shared<docqa_core::OllamaClient>(config.ollama_url, config.expansion_model);
    auto generation_client =
        std::make_shared<docqa_core::OllamaClient>(config.ollama_url, config.generation_model);
    auto rerank_client = std::make_shared<docqa_core::HttpRerankClient>(config.reranker_url);

    // Caches
    docqa_core::DatabaseManager db_manager(config.cache_db_path, config.cache_db_key,
                                           /*pool_size*/ config.num_workers);
    auto disk_store = std::make_shared<docqa_core::SqliteBlobStore>(
        db_manager, static_cast<size_t>(config.cache_max_entries),
        std::chrono::hours(config.cache_ttl_hours));
    disk_store->purge_expired();
    auto blob_store = std::make_shared<docqa_core::TieredBlobStore>(
        std::make_shared<docqa_core::MemoryBlobStore>(
            static_cast<size_t>(config.memory_cache_entries),
            std::chrono::hours(config.cache_ttl_hours)),
        disk_store);
    docqa_core::AnswerCache answer_cache(blob_store);

    // Retrieval pipeline
    auto embeddings = std::make_shared<docqa_core::EmbeddingProvider>(
        *embedding_client, static_cast<size_t>(config.embedding_dimension),
        static_cast<size_t>(config.embedding_batch_size));
    auto segmenter =
        std::make_shared<docqa_core::ChunkSegmenter>(make_strategy(config, *embeddings));
    const std::string index_namespace =
        config.embedding_model + "|" + segmenter->strategy().name() + "|" +
        std::to_string(config.chunk_size) + "|" + std::to_string(config.chunk_overlap);
    auto index_cache = std::make_shared<docqa_core::DocumentIndexCache>(
        disk_store, *embeddings, static_cast<size_t>(config.index_cache_entries), index_namespace);

    docqa_core::QueryExpander expander(*expansion_client, blob_store,
                                       static_cast<size_t>(config.expansion_count));
    docqa_core::Reranker reranker(*rerank_client);
    docqa_core::RetryPolicy retry_policy;
    retry_policy.max_attempts = config.generation_max_attempts;
    retry_policy.initial_backoff = std::chrono::milliseconds(config.generation_initial_backoff_ms);
    retry_policy.max_backoff = std::chrono::milliseconds(config.generation_max_backoff_ms);
    docqa_core::AnswerGenerator generator(*generation_client, retry_policy);
    docqa_core::QuestionRouter router = docqa_core::QuestionRouter::from_json(config.override_rules);

    docqa_core::RetrievalOptions retrieval_options;
    retrieval_options.expansion_limit = static_cast<size_t>(config.retrieval_query_limit);
    retrieval_options.retrieval_top_k = config.retrieval_top_k;
    retrieval_options.candidate_limit = static_cast<size_t>(config.candidate_limit);
    retrieval_options.rerank_top_k = config.rerank_top_k;
    auto orchestrator = std::make_shared<docqa_core::RetrievalOrchestrator>(
        expander, reranker, generator, answer_cache, router, retrieval_options,
        static_cast<size_t>(config.num_workers));

    auto services = std::make_shared<docqa_core::ServiceProvider>(
        std::make_shared<docqa_core::CurlDocumentFetcher>(),
        std::make_shared<docqa_core::BlockExtractorFactory>(), segmenter, embeddings, index_cache,
        orchestrator, std::make_shared<docqa_core::InteractionLog>(config.interaction_log_path));

    docqa_core::QaServiceOptions service_options;
    service_options.ingestion_timeout = std::chrono::milliseconds(config.ingestion_timeout_ms);
    service_options.request_deadline = std::chrono::milliseconds(config.request_deadline_ms);
    service_options.short_document_block_limit =
        static_cast<size_t>(config.short_document_block_limit);
    auto qa_service = std::make_shared<docqa_core::DocumentQaService>(services, service_options);

    docqa_api::ServerOptions server_options;
    server_options.host = config.host();
    server_options.port = static_cast<std::uint16_t>(config.port());
    server_options.threads = static_cast<unsigned int>(config.server_threads);
    server_options.timeout_seconds = static_cast<std::uint8_t>(config.server_timeout_seconds);
    docqa_api::Server server(server_options);
    docqa_api::Routes routes(qa_service, config.bearer_token);
    routes.register_routes(server);

    std::cout << "Disabling Crow's internal signal handling..." << std::endl;
    server.get_app().signal_clear();
    server.start();
    std::cout << "Server started successfully. Press Ctrl+C to exit." << std::endl;

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    {
      std::unique_lock<std::mutex> lock(shutdown_mutex);
      shutdown_cv.wait(lock, [] { return shutdown_requested.load(); });
    }

    std::cout << "[1/2] Stopping API server to refuse new requests..." << std::endl;
    server.stop();

    // Locals are destroyed in reverse order: the service pools are joined before the
    // clients and cache database they use are released
    std::cout << "[2/2] Draining answering and ingestion pools..." << std::endl;
  } catch (const std::exception& e) {
    std::cerr << "Error starting server: " << e.what() << std::endl;
    return 1;
  }

  std::cout << "Shutdown complete." << std::endl;
  return 0;
}
