#pragma once

#include <vector>

#include "docqa_core/extractors/block_extractor.hpp"

namespace docqa_core {

class BlockExtractorFactory {
 public:
  BlockExtractorFactory();

  /**
   * @brief Picks the extractor for a fetched document.
   *
   * Binary formats (PDF, Office documents, images) are rejected with ExtractionError.
   * Other text content without a more specific match falls back to plain text.
   */
  const BlockExtractor& get_extractor_for(const std::string& content_type,
                                          const std::string& source) const;

  std::vector<RawBlock> extract(const std::string& content_type, const std::string& source,
                                const std::string& content) const;

 private:
  std::vector<BlockExtractorPtr> extractors_;
  // Last-resort extractor for unrecognised text
  BlockExtractorPtr fallback_;
};

}  // namespace docqa_core
