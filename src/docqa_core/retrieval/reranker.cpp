#include "docqa_core/retrieval/reranker.hpp"

#include <algorithm>
#include <numeric>

namespace docqa_core {

Reranker::Reranker(RelevanceScorer& scorer) : scorer_(scorer) {}

std::vector<TextUnit> Reranker::rerank(const std::string& question,
                                       const std::vector<TextUnit>& candidates, int top_k) const {
  if (candidates.empty() || top_k <= 0) {
    return {};
  }

  std::vector<std::string> documents;
  documents.reserve(candidates.size());
  for (const auto& candidate : candidates) {
    documents.push_back(candidate.content);
  }

  const std::vector<float> scores = scorer_.score_all(question, documents);
  if (scores.size() != candidates.size()) {
    throw RerankError("Scorer returned " + std::to_string(scores.size()) + " scores for " +
                      std::to_string(candidates.size()) + " candidates");
  }

  std::vector<size_t> order(candidates.size());
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(),
                   [&scores](size_t a, size_t b) { return scores[a] > scores[b]; });

  const size_t keep = std::min(order.size(), static_cast<size_t>(top_k));
  std::vector<TextUnit> result;
  result.reserve(keep);
  for (size_t i = 0; i < keep; ++i) {
    result.push_back(candidates[order[i]]);
  }
  return result;
}

}  // namespace docqa_core
