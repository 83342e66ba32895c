#pragma once

#include <memory>
#include <string>
#include <vector>

#include "docqa_core/cache/blob_store.hpp"
#include "docqa_core/cache/lru_cache.hpp"
#include "docqa_core/index/vector_index.hpp"

namespace docqa_core {

/**
 * @brief Built indices by document fingerprint, in memory and in a persistent store.
 *
 * find() checks memory, then the persistent store (restoring without re-embedding).
 * insert() is last-writer-wins: two requests that race to build the same document
 * both insert, and either result is equivalent. `index_namespace` is folded into the
 * persistent key so indices built under different segmentation or embedding settings
 * are kept apart.
 */
class DocumentIndexCache {
 public:
  DocumentIndexCache(std::shared_ptr<BlobStore> persistent, EmbeddingProvider& provider,
                     size_t memory_entries, std::string index_namespace);

  std::shared_ptr<const VectorIndex> find(const std::string& fingerprint);
  void insert(const std::string& fingerprint, std::shared_ptr<const VectorIndex> index);

  // SHA-256 over the ordered block kinds and contents
  static std::string document_fingerprint(const std::vector<RawBlock>& blocks);

  std::string storage_key(const std::string& fingerprint) const;

 private:
  std::shared_ptr<BlobStore> persistent_;
  EmbeddingProvider& provider_;
  LRUCache<std::string, std::shared_ptr<const VectorIndex>> memory_;
  std::string index_namespace_;
};

}  // namespace docqa_core
