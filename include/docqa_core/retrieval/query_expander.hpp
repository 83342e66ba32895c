#pragma once

#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "docqa_core/cache/blob_store.hpp"
#include "docqa_core/llm/model_clients.hpp"

namespace docqa_core {

/**
 * @brief Produces paraphrases of a question to widen retrieval recall.
 *
 * expand() never fails: the result is always non-empty and starts with the original
 * question. Successful expansions are cached by a hash of the question alone, so they
 * are shared across documents. Fallback results are not cached.
 */
class QueryExpander {
 public:
  QueryExpander(TextGenerationClient& client, std::shared_ptr<BlobStore> cache,
                size_t expansion_count = 3);

  std::vector<std::string> expand(const std::string& question);

  static std::string cache_key(const std::string& question);

  // Pulls the paraphrase list out of a model response; empty when nothing usable is found
  static std::vector<std::string> parse_paraphrases(const std::string& response);

 private:
  TextGenerationClient& client_;
  std::shared_ptr<BlobStore> cache_;
  size_t expansion_count_;

  std::vector<std::string> assemble(const std::string& question,
                                    const std::vector<std::string>& paraphrases) const;
  std::string build_prompt(const std::string& question) const;
  static std::vector<std::string> strings_from_array(const nlohmann::json& array);
};

}  // namespace docqa_core
