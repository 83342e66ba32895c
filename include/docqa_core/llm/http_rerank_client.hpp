#pragma once

#include <string>
#include <vector>

#include "docqa_core/llm/model_clients.hpp"

namespace docqa_core {

/**
 * @brief Relevance scorer backed by a cross-encoder served over HTTP.
 *
 * Speaks the text-embeddings-inference rerank protocol: POST {"query", "texts"} and
 * receive [{"index", "score"}, ...]. A fresh curl handle is used per call so one
 * client can be shared by every answering thread.
 */
class HttpRerankClient : public RelevanceScorer {
 public:
  explicit HttpRerankClient(const std::string &rerank_url, long timeout_seconds = 10);

  float score(const std::string &question, const std::string &document) override;
  std::vector<float> score_all(const std::string &question,
                               const std::vector<std::string> &documents) override;

  // Parses a rerank response body into scores aligned with the submitted texts
  static std::vector<float> parse_scores(const std::string &body, size_t expected);

 private:
  std::string rerank_url_;
  long timeout_seconds_;

  std::string post_json(const std::string &payload);
  static size_t write_callback(void *contents, size_t size, size_t nmemb, std::string *userp);
};

}  // namespace docqa_core
