#include "docqa_core/embedding/embedding_provider.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>

namespace docqa_core {

bool is_blank(const std::string &text) {
  return std::all_of(text.begin(), text.end(),
                     [](unsigned char c) { return std::isspace(c) != 0; });
}

EmbeddingProvider::EmbeddingProvider(EmbeddingClient &client, size_t dimension, size_t batch_size)
    : client_(client), dimension_(dimension), batch_size_(batch_size) {
  if (dimension_ == 0) {
    throw std::invalid_argument("Embedding dimension must be positive");
  }
  if (batch_size_ == 0) {
    throw std::invalid_argument("Embedding batch size must be positive");
  }
}

std::vector<EmbeddingVector> EmbeddingProvider::embed(const std::vector<std::string> &texts) {
  std::vector<EmbeddingVector> out(texts.size(), zero_vector());

  // Positions of the inputs that actually go to the model
  std::vector<size_t> slots;
  slots.reserve(texts.size());
  for (size_t i = 0; i < texts.size(); ++i) {
    if (!is_blank(texts[i])) {
      slots.push_back(i);
    }
  }

  for (size_t begin = 0; begin < slots.size(); begin += batch_size_) {
    const size_t end = std::min(begin + batch_size_, slots.size());
    embed_batch(texts, slots, begin, end, out);
  }
  return out;
}

void EmbeddingProvider::embed_batch(const std::vector<std::string> &texts,
                                    const std::vector<size_t> &slots, size_t begin, size_t end,
                                    std::vector<EmbeddingVector> &out) {
  std::vector<std::string> batch;
  batch.reserve(end - begin);
  for (size_t i = begin; i < end; ++i) {
    batch.push_back(texts[slots[i]]);
  }

  std::vector<std::vector<float>> vectors;
  try {
    vectors = client_.get_embeddings(batch);
  } catch (const std::exception &e) {
    std::cerr << "[EmbeddingProvider] Batch of " << batch.size()
              << " texts failed, using zero vectors: " << e.what() << std::endl;
    return;
  }

  if (vectors.size() != batch.size()) {
    std::cerr << "[EmbeddingProvider] Batch returned " << vectors.size() << " vectors for "
              << batch.size() << " texts, using zero vectors" << std::endl;
    return;
  }

  for (size_t i = 0; i < vectors.size(); ++i) {
    if (vectors[i].size() != dimension_) {
      std::cerr << "[EmbeddingProvider] Vector of dimension " << vectors[i].size()
                << " (expected " << dimension_ << "), using zero vector" << std::endl;
      continue;
    }
    out[slots[begin + i]] = std::move(vectors[i]);
  }
}

EmbeddingVector EmbeddingProvider::embed_one(const std::string &text) {
  return embed({text}).front();
}

}  // namespace docqa_core
