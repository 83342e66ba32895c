#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "docqa_core/async/worker_pool.hpp"
#include "docqa_core/services/service_provider.hpp"
#include "docqa_core/types/text_unit.hpp"

namespace docqa_core {

inline constexpr const char* INGESTION_ERROR_SENTINEL = "Error: Could not process the document.";

struct QaServiceOptions {
  std::chrono::milliseconds ingestion_timeout{17000};
  std::chrono::milliseconds request_deadline{35000};
  // Documents with fewer blocks skip indexing; 0 disables the shortcut
  size_t short_document_block_limit = 0;
  size_t short_document_max_chars = 60000;
  size_t ingestion_workers = 2;
};

/**
 * @brief Answers a batch of questions about one document under a wall-clock budget.
 *
 * fetch -> extract -> fingerprint -> cached or freshly built index -> concurrent
 * answering -> interaction log. Ingestion that overruns its budget keeps running in the
 * background (its index is cached when it finishes) while this request falls back to
 * general-knowledge answers. A document that cannot be fetched or extracted yields
 * INGESTION_ERROR_SENTINEL for every question.
 */
class DocumentQaService {
 public:
  DocumentQaService(std::shared_ptr<ServiceProvider> services, QaServiceOptions options);

  std::vector<std::string> run(const std::string& document_url,
                               const std::vector<std::string>& questions);

  // Same as run() for content that has already been extracted
  std::vector<std::string> run_blocks(const std::string& source,
                                      const std::vector<RawBlock>& blocks,
                                      const std::vector<std::string>& questions,
                                      std::chrono::steady_clock::time_point started);

  const QaServiceOptions& options() const {
    return options_;
  }

 private:
  std::shared_ptr<ServiceProvider> services_;
  QaServiceOptions options_;
  async::WorkerPool ingestion_pool_;

  std::vector<std::string> answer_short_document(const std::vector<RawBlock>& blocks,
                                                 const std::string& fingerprint,
                                                 const std::vector<std::string>& questions,
                                                 std::chrono::steady_clock::time_point deadline);
  std::vector<std::string> finish(const std::string& source,
                                  const std::vector<std::string>& questions,
                                  std::vector<std::string> answers,
                                  std::chrono::steady_clock::time_point started);
};

}  // namespace docqa_core
