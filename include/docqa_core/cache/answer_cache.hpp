#pragma once

#include <memory>
#include <optional>
#include <string>

#include "docqa_core/cache/blob_store.hpp"

namespace docqa_core {

// Which code path produced an answer; part of the cache key
enum class AnswerPath { GeneralKnowledge, Rag, TimeoutFallback, ShortDocument };

std::string to_string(AnswerPath path);

/**
 * @brief Final answers keyed by (path, document fingerprint, question).
 *
 * Keys are SHA-256 digests, so answers for different documents never share an entry.
 * General-knowledge answers are stored with an empty fingerprint and are shared
 * between documents.
 */
class AnswerCache {
 public:
  explicit AnswerCache(std::shared_ptr<BlobStore> store);

  std::optional<std::string> get(const std::string& key);
  void put(const std::string& key, const std::string& answer);

  static std::string make_key(AnswerPath path, const std::string& fingerprint,
                              const std::string& question);

 private:
  std::shared_ptr<BlobStore> store_;
};

}  // namespace docqa_core
