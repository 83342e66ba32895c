#pragma once

#include <memory>
#include <stdexcept>

namespace docqa_core {
class DocumentFetcher;
class BlockExtractorFactory;
class ChunkSegmenter;
class EmbeddingProvider;
class DocumentIndexCache;
class RetrievalOrchestrator;
class InteractionLog;
}  // namespace docqa_core

namespace docqa_core {

// Collaborators of one DocumentQaService, shared with the tasks it starts
class ServiceProvider {
 public:
  ServiceProvider(std::shared_ptr<DocumentFetcher> fetcher,
                  std::shared_ptr<BlockExtractorFactory> extractors,
                  std::shared_ptr<ChunkSegmenter> segmenter,
                  std::shared_ptr<EmbeddingProvider> embeddings,
                  std::shared_ptr<DocumentIndexCache> index_cache,
                  std::shared_ptr<RetrievalOrchestrator> orchestrator,
                  std::shared_ptr<InteractionLog> interaction_log)
      : fetcher_(std::move(fetcher)),
        extractors_(std::move(extractors)),
        segmenter_(std::move(segmenter)),
        embeddings_(std::move(embeddings)),
        index_cache_(std::move(index_cache)),
        orchestrator_(std::move(orchestrator)),
        interaction_log_(std::move(interaction_log)) {
    if (!fetcher_ || !extractors_ || !segmenter_ || !embeddings_ || !index_cache_ ||
        !orchestrator_ || !interaction_log_) {
      throw std::invalid_argument("ServiceProvider requires every service");
    }
  }

  DocumentFetcher& get_fetcher() {
    return *fetcher_;
  }
  BlockExtractorFactory& get_extractor_factory() {
    return *extractors_;
  }
  RetrievalOrchestrator& get_orchestrator() {
    return *orchestrator_;
  }
  InteractionLog& get_interaction_log() {
    return *interaction_log_;
  }

  std::shared_ptr<ChunkSegmenter> segmenter() const {
    return segmenter_;
  }
  std::shared_ptr<EmbeddingProvider> embeddings() const {
    return embeddings_;
  }
  std::shared_ptr<DocumentIndexCache> index_cache() const {
    return index_cache_;
  }

 private:
  std::shared_ptr<DocumentFetcher> fetcher_;
  std::shared_ptr<BlockExtractorFactory> extractors_;
  std::shared_ptr<ChunkSegmenter> segmenter_;
  std::shared_ptr<EmbeddingProvider> embeddings_;
  std::shared_ptr<DocumentIndexCache> index_cache_;
  std::shared_ptr<RetrievalOrchestrator> orchestrator_;
  std::shared_ptr<InteractionLog> interaction_log_;
};

}  // namespace docqa_core
