#pragma once

#include <memory>
#include <string>
#include <vector>

#include "docqa_core/embedding/embedding_provider.hpp"
#include "docqa_core/types/text_unit.hpp"

namespace faiss {
struct IndexFlatIP;
}

namespace docqa_core {

class VectorIndexError : public std::exception {
 public:
  explicit VectorIndexError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

struct ScoredUnit {
  TextUnit unit;
  float score = 0.0f;
  // Position of the unit in the list passed to build()
  size_t position = 0;
};

/**
 * @brief Cosine-similarity index over the units of one document snapshot.
 *
 * Units and their embeddings are held as parallel arrays of equal length. The index is
 * read-only once built and may be searched from several threads at once; build() is the
 * only mutator and replaces everything.
 */
class VectorIndex {
 public:
  explicit VectorIndex(EmbeddingProvider& provider);
  ~VectorIndex();

  VectorIndex(const VectorIndex&) = delete;
  VectorIndex& operator=(const VectorIndex&) = delete;

  /**
   * @brief Embeds the units and builds the similarity index.
   *
   * Never throws because of embedding failures: failed batches are stored as zero
   * vectors and simply rank last.
   */
  void build(const std::vector<TextUnit>& units);

  // Top-k units by cosine similarity to the query, best first, ties in document order
  std::vector<TextUnit> search(const std::string& query, int top_k) const;
  std::vector<ScoredUnit> search_scored(const std::string& query, int top_k) const;
  std::vector<ScoredUnit> search_vector(const EmbeddingVector& query_vector, int top_k) const;

  const std::vector<TextUnit>& units() const {
    return units_;
  }
  const std::vector<EmbeddingVector>& embeddings() const {
    return embeddings_;
  }
  size_t size() const {
    return units_.size();
  }
  bool empty() const {
    return units_.empty();
  }
  size_t dimension() const {
    return dimension_;
  }

  // Content hash of the indexed units; equal for any two builds over the same units
  const std::string& fingerprint() const {
    return fingerprint_;
  }

  // MessagePack + zstd snapshot of units and vectors
  std::vector<char> serialize() const;

  /**
   * @brief Restores an index from serialize() output without calling the embedding model.
   * @throws VectorIndexError if the blob is corrupt or was written for another dimension.
   */
  static std::shared_ptr<VectorIndex> deserialize(const std::vector<char>& blob,
                                                  EmbeddingProvider& provider);

  static std::string compute_fingerprint(const std::vector<TextUnit>& units);

 private:
  EmbeddingProvider& provider_;
  size_t dimension_;
  std::vector<TextUnit> units_;
  std::vector<EmbeddingVector> embeddings_;
  std::unique_ptr<faiss::IndexFlatIP> faiss_index_;
  std::string fingerprint_;

  void load(std::vector<TextUnit> units, std::vector<EmbeddingVector> embeddings);
};

}  // namespace docqa_core
