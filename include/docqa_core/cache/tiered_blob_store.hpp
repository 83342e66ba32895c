#pragma once

#include <memory>

#include "docqa_core/cache/blob_store.hpp"

namespace docqa_core {

/**
 * @brief Memory tier in front of a persistent tier.
 *
 * Reads fill the front tier on a back-tier hit; writes go to both. Back-tier failures
 * are logged and treated as misses so a broken disk cache only costs recomputation.
 */
class TieredBlobStore : public BlobStore {
 public:
  TieredBlobStore(std::shared_ptr<BlobStore> front, std::shared_ptr<BlobStore> back);

  std::optional<std::vector<char>> get(const std::string& key) override;
  void put(const std::string& key, const std::vector<char>& value) override;

 private:
  std::shared_ptr<BlobStore> front_;
  std::shared_ptr<BlobStore> back_;
};

}  // namespace docqa_core
