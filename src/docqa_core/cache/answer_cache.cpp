#include "docqa_core/cache/answer_cache.hpp"

#include <iostream>
#include <stdexcept>

#include "docqa_core/services/hashing_service.hpp"

namespace docqa_core {

std::string to_string(AnswerPath path) {
  switch (path) {
    case AnswerPath::GeneralKnowledge:
      return "general_knowledge";
    case AnswerPath::Rag:
      return "rag";
    case AnswerPath::TimeoutFallback:
      return "timeout_fallback";
    case AnswerPath::ShortDocument:
      return "short_document";
    default:
      return "unknown";
  }
}

AnswerCache::AnswerCache(std::shared_ptr<BlobStore> store) : store_(std::move(store)) {
  if (!store_) {
    throw std::invalid_argument("AnswerCache requires a blob store");
  }
}

std::string AnswerCache::make_key(AnswerPath path, const std::string& fingerprint,
                                  const std::string& question) {
  return "answer:" + HashingService::sha256_hex({to_string(path), fingerprint, question});
}

std::optional<std::string> AnswerCache::get(const std::string& key) {
  try {
    return store_->get_text(key);
  } catch (const BlobStoreError& e) {
    std::cerr << "[AnswerCache] Lookup failed, treating as miss: " << e.what() << std::endl;
    return std::nullopt;
  }
}

void AnswerCache::put(const std::string& key, const std::string& answer) {
  try {
    store_->put_text(key, answer);
  } catch (const BlobStoreError& e) {
    std::cerr << "[AnswerCache] Store failed: " << e.what() << std::endl;
  }
}

}  // namespace docqa_core
