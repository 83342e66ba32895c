#include "docqa_core/retrieval/retrieval_orchestrator.hpp"

#include <algorithm>
#include <future>
#include <iostream>
#include <unordered_set>

namespace docqa_core {

RetrievalOrchestrator::RetrievalOrchestrator(QueryExpander& expander, Reranker& reranker,
                                             AnswerGenerator& generator, AnswerCache& answer_cache,
                                             const QuestionRouter& router,
                                             RetrievalOptions options, size_t num_workers)
    : expander_(expander),
      reranker_(reranker),
      generator_(generator),
      answer_cache_(answer_cache),
      router_(router),
      options_(std::move(options)),
      pool_(num_workers, "AnswerPool") {}

std::string RetrievalOrchestrator::generate_and_cache(const std::string& cache_key,
                                                      const std::string& context,
                                                      const std::string& question,
                                                      const async::CancellationToken& token) {
  async::throw_if_cancelled(token);
  GenerationOutcome outcome = generator_.generate(context, question, token);
  // Error sentinels are returned but never cached, so a later request can retry
  if (outcome.succeeded) {
    answer_cache_.put(cache_key, outcome.answer);
  }
  return outcome.answer;
}

std::string RetrievalOrchestrator::answer_general_knowledge(const std::string& question,
                                                            AnswerPath path,
                                                            const async::CancellationToken& token) {
  const RouteDecision decision = router_.route(question);
  if (decision.action == RouteAction::FixedAnswer) {
    return decision.fixed_answer;
  }

  const std::string key = AnswerCache::make_key(path, "", question);
  if (auto cached = answer_cache_.get(key)) {
    return *cached;
  }
  return generate_and_cache(key, "", question, token);
}

std::string RetrievalOrchestrator::answer_with_context(const std::string& question,
                                                       const std::string& context,
                                                       const std::string& fingerprint,
                                                       const async::CancellationToken& token) {
  const RouteDecision decision = router_.route(question);
  if (decision.action == RouteAction::FixedAnswer) {
    return decision.fixed_answer;
  }
  if (decision.action == RouteAction::GeneralKnowledge) {
    return answer_general_knowledge(question, AnswerPath::GeneralKnowledge, token);
  }

  const std::string key = AnswerCache::make_key(AnswerPath::ShortDocument, fingerprint, question);
  if (auto cached = answer_cache_.get(key)) {
    return *cached;
  }
  return generate_and_cache(key, context, question, token);
}

std::string RetrievalOrchestrator::answer_question(const std::string& question,
                                                   const VectorIndex& index,
                                                   const async::CancellationToken& token) {
  const RouteDecision decision = router_.route(question);
  if (decision.action == RouteAction::FixedAnswer) {
    std::cout << "[Orchestrator] Rule '" << decision.rule_name << "' answered directly" << std::endl;
    return decision.fixed_answer;
  }
  if (decision.action == RouteAction::GeneralKnowledge) {
    std::cout << "[Orchestrator] Rule '" << decision.rule_name
              << "' routed question to general knowledge" << std::endl;
    return answer_general_knowledge(question, AnswerPath::GeneralKnowledge, token);
  }

  const std::string key = AnswerCache::make_key(AnswerPath::Rag, index.fingerprint(), question);
  if (auto cached = answer_cache_.get(key)) {
    return *cached;
  }

  async::throw_if_cancelled(token);
  std::vector<std::string> queries = expander_.expand(question);
  if (queries.size() > options_.expansion_limit) {
    queries.resize(std::max<size_t>(options_.expansion_limit, 1));
  }

  std::vector<TextUnit> candidates = retrieve_candidates(queries, index, token);

  async::throw_if_cancelled(token);
  std::vector<TextUnit> ranked;
  try {
    ranked = reranker_.rerank(question, candidates, options_.rerank_top_k);
  } catch (const std::exception& e) {
    std::cerr << "[Orchestrator] Rerank failed, keeping retrieval order: " << e.what() << std::endl;
    ranked = candidates;
    if (options_.rerank_top_k <= 0) {
      ranked.clear();
    } else if (ranked.size() > static_cast<size_t>(options_.rerank_top_k)) {
      ranked.resize(static_cast<size_t>(options_.rerank_top_k));
    }
  }

  return generate_and_cache(key, assemble_context(ranked), question, token);
}

std::vector<TextUnit> RetrievalOrchestrator::retrieve_candidates(
    const std::vector<std::string>& queries, const VectorIndex& index,
    const async::CancellationToken& token) const {
  std::vector<TextUnit> candidates;
  std::unordered_set<std::string> seen;

  for (const auto& query : queries) {
    async::throw_if_cancelled(token);
    for (auto& unit : index.search(query, options_.retrieval_top_k)) {
      if (candidates.size() >= options_.candidate_limit) {
        return candidates;
      }
      if (seen.insert(unit.content).second) {
        candidates.push_back(std::move(unit));
      }
    }
  }
  return candidates;
}

std::string RetrievalOrchestrator::assemble_context(const std::vector<TextUnit>& units) const {
  std::string context;
  for (size_t i = 0; i < units.size(); ++i) {
    if (i > 0) {
      context += options_.context_separator;
    }
    context += units[i].content;
  }
  return context;
}

std::vector<std::string> RetrievalOrchestrator::answer_all(
    const std::vector<std::string>& questions, const QuestionHandler& handler,
    std::chrono::steady_clock::time_point deadline) {
  std::vector<std::string> answers(questions.size(), TIMEOUT_SENTINEL);
  if (questions.empty()) {
    return answers;
  }
  if (std::chrono::steady_clock::now() >= deadline) {
    std::cerr << "[Orchestrator] No time left, all " << questions.size()
              << " questions timed out" << std::endl;
    return answers;
  }

  async::CancellationToken token;
  std::vector<std::future<std::string>> futures;
  futures.reserve(questions.size());
  for (const auto& question : questions) {
    futures.push_back(
        pool_.submit([handler, question, token]() { return handler(question, token); }));
  }

  size_t timed_out = 0;
  for (size_t i = 0; i < futures.size(); ++i) {
    if (futures[i].wait_until(deadline) != std::future_status::ready) {
      ++timed_out;
      continue;
    }
    try {
      answers[i] = futures[i].get();
    } catch (const async::TaskCancelled&) {
      ++timed_out;
    } catch (const std::exception& e) {
      std::cerr << "[Orchestrator] Question " << i << " failed: " << e.what() << std::endl;
      answers[i] = std::string(UNEXPECTED_ERROR_PREFIX) + e.what();
    }
  }

  // Late tasks stop at their next stage check or as soon as a retry backoff wakes
  token.cancel();
  if (timed_out > 0) {
    std::cerr << "[Orchestrator] " << timed_out << " of " << questions.size()
              << " questions timed out" << std::endl;
  }
  return answers;
}

std::vector<std::string> RetrievalOrchestrator::answer_all(
    const std::vector<std::string>& questions, std::shared_ptr<const VectorIndex> index,
    std::chrono::steady_clock::time_point deadline) {
  if (!index) {
    throw std::invalid_argument("answer_all requires an index");
  }
  QuestionHandler handler = [this, index](const std::string& question,
                                          const async::CancellationToken& token) {
    return answer_question(question, *index, token);
  };
  return answer_all(questions, handler, deadline);
}

}  // namespace docqa_core
