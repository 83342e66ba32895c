#include "docqa_core/cache/tiered_blob_store.hpp"

#include <iostream>
#include <stdexcept>

namespace docqa_core {

TieredBlobStore::TieredBlobStore(std::shared_ptr<BlobStore> front, std::shared_ptr<BlobStore> back)
    : front_(std::move(front)), back_(std::move(back)) {
  if (!front_ || !back_) {
    throw std::invalid_argument("TieredBlobStore requires both tiers");
  }
}

std::optional<std::vector<char>> TieredBlobStore::get(const std::string& key) {
  if (auto hit = front_->get(key)) {
    return hit;
  }
  try {
    auto hit = back_->get(key);
    if (hit) {
      front_->put(key, *hit);
    }
    return hit;
  } catch (const BlobStoreError& e) {
    std::cerr << "[TieredBlobStore] Persistent tier read failed: " << e.what() << std::endl;
    return std::nullopt;
  }
}

void TieredBlobStore::put(const std::string& key, const std::vector<char>& value) {
  front_->put(key, value);
  try {
    back_->put(key, value);
  } catch (const BlobStoreError& e) {
    std::cerr << "[TieredBlobStore] Persistent tier write failed: " << e.what() << std::endl;
  }
}

}  // namespace docqa_core
