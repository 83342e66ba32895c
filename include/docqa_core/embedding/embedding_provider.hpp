#pragma once

#include <string>
#include <vector>

#include "docqa_core/llm/model_clients.hpp"
#include "docqa_core/types/text_unit.hpp"

namespace docqa_core {

/**
 * @brief Length-preserving embedding of text lists.
 *
 * embed() always returns exactly one vector per input, in input order. Blank inputs are
 * never sent to the model and receive a zero vector. A failed batch, or a batch that
 * comes back malformed, is replaced by zero vectors so callers can keep units and
 * vectors aligned by position.
 */
class EmbeddingProvider {
 public:
  EmbeddingProvider(EmbeddingClient &client, size_t dimension, size_t batch_size = 100);

  std::vector<EmbeddingVector> embed(const std::vector<std::string> &texts);

  // Single text convenience used for queries; a failure yields the zero vector
  EmbeddingVector embed_one(const std::string &text);

  size_t dimension() const {
    return dimension_;
  }
  size_t batch_size() const {
    return batch_size_;
  }

  EmbeddingVector zero_vector() const {
    return EmbeddingVector(dimension_, 0.0f);
  }

 private:
  EmbeddingClient &client_;
  size_t dimension_;
  size_t batch_size_;

  void embed_batch(const std::vector<std::string> &texts, const std::vector<size_t> &slots,
                   size_t begin, size_t end, std::vector<EmbeddingVector> &out);
};

bool is_blank(const std::string &text);

}  // namespace docqa_core
