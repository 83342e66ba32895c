#include "docqa_core/services/document_qa_service.hpp"

#include <algorithm>
#include <iostream>

#include "docqa_core/extractors/block_extractor_factory.hpp"
#include "docqa_core/index/document_index_cache.hpp"
#include "docqa_core/ingest/document_fetcher.hpp"
#include "docqa_core/retrieval/retrieval_orchestrator.hpp"
#include "docqa_core/segmentation/chunk_segmenter.hpp"
#include "docqa_core/services/interaction_log.hpp"

namespace docqa_core {

DocumentQaService::DocumentQaService(std::shared_ptr<ServiceProvider> services,
                                     QaServiceOptions options)
    : services_(std::move(services)),
      options_(options),
      ingestion_pool_(std::max<size_t>(options.ingestion_workers, 1), "IngestionPool") {
  if (!services_) {
    throw std::invalid_argument("DocumentQaService requires a service provider");
  }
}

std::vector<std::string> DocumentQaService::run(const std::string& document_url,
                                                const std::vector<std::string>& questions) {
  const auto started = std::chrono::steady_clock::now();
  if (questions.empty()) {
    return {};
  }

  std::vector<RawBlock> blocks;
  try {
    FetchedDocument document = services_->get_fetcher().fetch(document_url);
    blocks = services_->get_extractor_factory().extract(document.content_type, document_url,
                                                        document.body);
  } catch (const DocumentFetchError& e) {
    std::cerr << "[QaService] Fetch failed: " << e.what() << std::endl;
  } catch (const ExtractionError& e) {
    std::cerr << "[QaService] Extraction failed: " << e.what() << std::endl;
  }

  if (blocks.empty()) {
    std::cerr << "[QaService] No usable content in " << document_url << std::endl;
    return finish(document_url, questions,
                  std::vector<std::string>(questions.size(), INGESTION_ERROR_SENTINEL), started);
  }
  return run_blocks(document_url, blocks, questions, started);
}

std::vector<std::string> DocumentQaService::run_blocks(const std::string& source,
                                                       const std::vector<RawBlock>& blocks,
                                                       const std::vector<std::string>& questions,
                                                       std::chrono::steady_clock::time_point started) {
  const auto deadline = started + options_.request_deadline;
  RetrievalOrchestrator& orchestrator = services_->get_orchestrator();
  const std::string fingerprint = DocumentIndexCache::document_fingerprint(blocks);

  if (options_.short_document_block_limit > 0 &&
      blocks.size() < options_.short_document_block_limit) {
    std::cout << "[QaService] Short document (" << blocks.size()
              << " blocks), answering from full text" << std::endl;
    return finish(source, questions,
                  answer_short_document(blocks, fingerprint, questions, deadline), started);
  }

  std::shared_ptr<const VectorIndex> index = services_->index_cache()->find(fingerprint);
  if (!index) {
    auto segmenter = services_->segmenter();
    auto embeddings = services_->embeddings();
    auto index_cache = services_->index_cache();

    std::future<std::shared_ptr<const VectorIndex>> ingestion = ingestion_pool_.submit(
        [segmenter, embeddings, index_cache, blocks, fingerprint]() {
          auto built = std::make_shared<VectorIndex>(*embeddings);
          built->build(segmenter->segment(blocks));
          std::shared_ptr<const VectorIndex> result = built;
          index_cache->insert(fingerprint, result);
          return result;
        });

    const auto ingestion_deadline = std::min(started + options_.ingestion_timeout, deadline);
    if (ingestion.wait_until(ingestion_deadline) != std::future_status::ready) {
      std::cerr << "[QaService] Ingestion exceeded its budget, answering from general knowledge"
                << std::endl;
      QuestionHandler fallback = [&orchestrator](const std::string& question,
                                                 const async::CancellationToken& token) {
        return orchestrator.answer_general_knowledge(question, AnswerPath::TimeoutFallback, token);
      };
      return finish(source, questions, orchestrator.answer_all(questions, fallback, deadline),
                    started);
    }

    try {
      index = ingestion.get();
    } catch (const std::exception& e) {
      std::cerr << "[QaService] Ingestion failed: " << e.what() << std::endl;
      return finish(source, questions,
                    std::vector<std::string>(questions.size(), INGESTION_ERROR_SENTINEL), started);
    }
  }

  return finish(source, questions, orchestrator.answer_all(questions, index, deadline), started);
}

std::vector<std::string> DocumentQaService::answer_short_document(
    const std::vector<RawBlock>& blocks, const std::string& fingerprint,
    const std::vector<std::string>& questions, std::chrono::steady_clock::time_point deadline) {
  std::string context;
  for (const auto& block : blocks) {
    if (!context.empty()) {
      context += "\n\n";
    }
    context += block_text(block);
  }
  context = truncate_code_points(context, options_.short_document_max_chars);

  RetrievalOrchestrator& orchestrator = services_->get_orchestrator();
  QuestionHandler handler = [&orchestrator, context, fingerprint](
                                const std::string& question, const async::CancellationToken& token) {
    return orchestrator.answer_with_context(question, context, fingerprint, token);
  };
  return orchestrator.answer_all(questions, handler, deadline);
}

std::vector<std::string> DocumentQaService::finish(const std::string& source,
                                                   const std::vector<std::string>& questions,
                                                   std::vector<std::string> answers,
                                                   std::chrono::steady_clock::time_point started) {
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  std::cout << "[QaService] Answered " << answers.size() << " questions in " << elapsed.count()
            << " ms" << std::endl;
  services_->get_interaction_log().record(source, questions, answers, elapsed);
  return answers;
}

}  // namespace docqa_core
