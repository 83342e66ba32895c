#include "docqa_core/extractors/plaintext_extractor.hpp"

namespace docqa_core {

bool PlainTextExtractor::can_handle(const std::string& content_type,
                                    const std::string& source) const {
  const std::string type = lowercase(content_type);
  return type.rfind("text/plain", 0) == 0 || has_extension(source, ".txt");
}

/**
 * @brief Splits a plain text document into paragraph blocks.
 *
 * Paragraphs are separated by one or more blank lines. Plain text has no table syntax,
 * so every block is a Text block.
 */
std::vector<RawBlock> PlainTextExtractor::extract(const std::string& content) const {
  std::vector<RawBlock> blocks;
  for (auto& paragraph : split_paragraphs(content)) {
    blocks.push_back(RawBlock::paragraph(std::move(paragraph)));
  }
  return blocks;
}

}  // namespace docqa_core
