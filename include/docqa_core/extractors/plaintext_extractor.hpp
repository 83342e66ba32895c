#pragma once

#include "docqa_core/extractors/block_extractor.hpp"

namespace docqa_core {

class PlainTextExtractor : public BlockExtractor {
 public:
  bool can_handle(const std::string& content_type, const std::string& source) const override;
  std::vector<RawBlock> extract(const std::string& content) const override;
  std::string name() const override {
    return "plaintext";
  }
};

}  // namespace docqa_core
