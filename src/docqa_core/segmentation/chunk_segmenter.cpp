#include "docqa_core/segmentation/chunk_segmenter.hpp"

#include <stdexcept>

#include "docqa_core/embedding/embedding_provider.hpp"

namespace docqa_core {

ChunkSegmenter::ChunkSegmenter(SegmentationStrategyPtr strategy) : strategy_(std::move(strategy)) {
  if (!strategy_) {
    throw std::invalid_argument("ChunkSegmenter requires a segmentation strategy");
  }
}

std::vector<TextUnit> ChunkSegmenter::segment(const std::vector<RawBlock>& blocks) const {
  std::vector<TextUnit> units;
  int next_index = 0;

  auto push = [&](std::string content, UnitKind kind) {
    units.push_back({.content = std::move(content), .kind = kind, .unit_index = next_index++});
  };

  for (const auto& block : blocks) {
    if (block.kind == BlockKind::Table) {
      std::string rendered = block_text(block);
      if (!is_blank(rendered)) {
        push(std::move(rendered), UnitKind::Table);
      }
      continue;
    }

    if (is_blank(block.text)) {
      continue;
    }
    if (code_point_length(block.text) <= strategy_->max_unit_size()) {
      push(block.text, UnitKind::Narrative);
      continue;
    }
    for (auto& piece : strategy_->split(block.text)) {
      if (!is_blank(piece)) {
        push(std::move(piece), UnitKind::Narrative);
      }
    }
  }
  return units;
}

}  // namespace docqa_core
