#include "docqa_core/index/document_index_cache.hpp"

#include <iostream>

#include "docqa_core/services/hashing_service.hpp"

namespace docqa_core {

DocumentIndexCache::DocumentIndexCache(std::shared_ptr<BlobStore> persistent,
                                       EmbeddingProvider& provider, size_t memory_entries,
                                       std::string index_namespace)
    : persistent_(std::move(persistent)),
      provider_(provider),
      memory_(memory_entries),
      index_namespace_(std::move(index_namespace)) {}

std::string DocumentIndexCache::document_fingerprint(const std::vector<RawBlock>& blocks) {
  std::vector<std::string> fields;
  fields.reserve(blocks.size() * 2);
  for (const auto& block : blocks) {
    fields.push_back(to_string(block.kind));
    fields.push_back(block_text(block));
  }
  return HashingService::sha256_hex(fields);
}

std::string DocumentIndexCache::storage_key(const std::string& fingerprint) const {
  return "index:" + HashingService::sha256_hex({index_namespace_, fingerprint});
}

std::shared_ptr<const VectorIndex> DocumentIndexCache::find(const std::string& fingerprint) {
  if (auto hit = memory_.get(fingerprint)) {
    return *hit;
  }
  if (!persistent_) {
    return nullptr;
  }

  try {
    auto blob = persistent_->get(storage_key(fingerprint));
    if (!blob) {
      return nullptr;
    }
    std::shared_ptr<const VectorIndex> index = VectorIndex::deserialize(*blob, provider_);
    memory_.put(fingerprint, index);
    std::cout << "[IndexCache] Restored index for " << fingerprint.substr(0, 12) << " ("
              << index->size() << " units)" << std::endl;
    return index;
  } catch (const BlobStoreError& e) {
    std::cerr << "[IndexCache] Persistent lookup failed: " << e.what() << std::endl;
  } catch (const VectorIndexError& e) {
    std::cerr << "[IndexCache] Discarding unreadable snapshot: " << e.what() << std::endl;
  }
  return nullptr;
}

void DocumentIndexCache::insert(const std::string& fingerprint,
                                std::shared_ptr<const VectorIndex> index) {
  if (!index) {
    return;
  }
  memory_.put(fingerprint, index);
  if (!persistent_) {
    return;
  }
  try {
    persistent_->put(storage_key(fingerprint), index->serialize());
  } catch (const BlobStoreError& e) {
    std::cerr << "[IndexCache] Could not persist index: " << e.what() << std::endl;
  }
}

}  // namespace docqa_core
