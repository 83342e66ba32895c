#pragma once

#include "docqa_core/extractors/block_extractor.hpp"

namespace docqa_core {

class MarkdownExtractor : public BlockExtractor {
 public:
  bool can_handle(const std::string& content_type, const std::string& source) const override;
  std::vector<RawBlock> extract(const std::string& content) const override;
  std::string name() const override {
    return "markdown";
  }

  // Cells of one pipe-table line, trimmed; leading and trailing pipes are optional
  static std::vector<std::string> parse_table_row(const std::string& line);
  static bool is_separator_row(const std::vector<std::string>& cells);

 private:
  void flush_text(std::string& buffer, std::vector<RawBlock>& blocks) const;
};

}  // namespace docqa_core
