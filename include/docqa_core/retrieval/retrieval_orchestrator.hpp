#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "docqa_core/async/cancellation_token.hpp"
#include "docqa_core/async/worker_pool.hpp"
#include "docqa_core/cache/answer_cache.hpp"
#include "docqa_core/index/vector_index.hpp"
#include "docqa_core/retrieval/answer_generator.hpp"
#include "docqa_core/retrieval/query_expander.hpp"
#include "docqa_core/retrieval/reranker.hpp"
#include "docqa_core/routing/question_router.hpp"

namespace docqa_core {

inline constexpr const char* TIMEOUT_SENTINEL = "Processing timed out for this question.";
inline constexpr const char* UNEXPECTED_ERROR_PREFIX = "An error occurred: ";

struct RetrievalOptions {
  // How many entries of the expansion list (original question first) are searched
  size_t expansion_limit = 3;
  int retrieval_top_k = 7;
  // Ceiling on the deduplicated union handed to the reranker
  size_t candidate_limit = 10;
  int rerank_top_k = 7;
  std::string context_separator = "\n\n---\n\n";
};

using QuestionHandler =
    std::function<std::string(const std::string&, const async::CancellationToken&)>;

/**
 * @brief Per-question answering pipeline and the concurrent fan-out over a batch.
 *
 * For a document question: override rules, answer cache, expansion, multi-query search
 * with deduplication, rerank against the original question, context assembly and
 * generation. Every per-question failure ends up as a string in that question's slot.
 */
class RetrievalOrchestrator {
 public:
  RetrievalOrchestrator(QueryExpander& expander, Reranker& reranker, AnswerGenerator& generator,
                        AnswerCache& answer_cache, const QuestionRouter& router,
                        RetrievalOptions options, size_t num_workers);

  std::string answer_question(const std::string& question, const VectorIndex& index,
                              const async::CancellationToken& token);

  // Answers without any document context; `path` only affects the cache key
  std::string answer_general_knowledge(const std::string& question, AnswerPath path,
                                       const async::CancellationToken& token);

  // Answers against a caller-assembled context (short documents)
  std::string answer_with_context(const std::string& question, const std::string& context,
                                  const std::string& fingerprint,
                                  const async::CancellationToken& token);

  /**
   * @brief Runs `handler` for every question concurrently and collects the answers.
   *
   * Always returns questions.size() answers in question order. Questions whose task has
   * not finished by `deadline` get TIMEOUT_SENTINEL and their tasks are cancelled; a
   * task that throws gets "An error occurred: <what>".
   */
  std::vector<std::string> answer_all(const std::vector<std::string>& questions,
                                      const QuestionHandler& handler,
                                      std::chrono::steady_clock::time_point deadline);

  std::vector<std::string> answer_all(const std::vector<std::string>& questions,
                                      std::shared_ptr<const VectorIndex> index,
                                      std::chrono::steady_clock::time_point deadline);

  // Deduplicated union of per-expansion hits, in first-seen order, capped
  std::vector<TextUnit> retrieve_candidates(const std::vector<std::string>& queries,
                                            const VectorIndex& index,
                                            const async::CancellationToken& token) const;

  std::string assemble_context(const std::vector<TextUnit>& units) const;

  const RetrievalOptions& options() const {
    return options_;
  }

 private:
  QueryExpander& expander_;
  Reranker& reranker_;
  AnswerGenerator& generator_;
  AnswerCache& answer_cache_;
  const QuestionRouter& router_;
  RetrievalOptions options_;
  // Declared last so its threads are joined before anything they use goes away
  async::WorkerPool pool_;

  std::string generate_and_cache(const std::string& cache_key, const std::string& context,
                                 const std::string& question,
                                 const async::CancellationToken& token);
};

}  // namespace docqa_core
