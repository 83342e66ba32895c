#pragma once

#include <string>
#include <vector>

#include "docqa_core/llm/model_clients.hpp"
#include "docqa_core/types/text_unit.hpp"

namespace docqa_core {

/**
 * @brief Second-pass relevance ordering against the original question.
 *
 * Returns at most min(top_k, candidates.size()) units, best first; equal scores keep
 * candidate order. Scorer failures propagate as exceptions.
 */
class Reranker {
 public:
  explicit Reranker(RelevanceScorer& scorer);

  std::vector<TextUnit> rerank(const std::string& question, const std::vector<TextUnit>& candidates,
                               int top_k) const;

 private:
  RelevanceScorer& scorer_;
};

}  // namespace docqa_core
