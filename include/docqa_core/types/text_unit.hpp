#pragma once

#include <string>
#include <vector>

namespace docqa_core {

// Kind of block handed over by a document extractor
enum class BlockKind { Text, Table };

// Kind of retrievable unit produced by the segmenter
enum class UnitKind { Narrative, Table };

std::string to_string(BlockKind kind);
std::string to_string(UnitKind kind);
UnitKind unit_kind_from_string(const std::string& str);

/**
 * @brief One block of extracted document content.
 *
 * Text blocks carry a paragraph in `text`. Table blocks carry a row-major grid of
 * cells in `rows`; `text` may hold a pre-rendered form when the extractor had one.
 */
struct RawBlock {
  BlockKind kind = BlockKind::Text;
  std::string text;
  std::vector<std::vector<std::string>> rows;

  static RawBlock paragraph(std::string text);
  static RawBlock table(std::vector<std::vector<std::string>> rows);
};

struct TextUnit {
  std::string content;
  UnitKind kind = UnitKind::Narrative;
  int unit_index = 0;
};

// Units are identified by their text; kind and position are bookkeeping
inline bool operator==(const TextUnit& lhs, const TextUnit& rhs) {
  return lhs.content == rhs.content;
}

using EmbeddingVector = std::vector<float>;

// Renders a grid as a Markdown pipe table with a header separator row
std::string render_table_markdown(const std::vector<std::vector<std::string>>& rows);

// Text a block contributes to fingerprints and short-document contexts
std::string block_text(const RawBlock& block);

}  // namespace docqa_core
