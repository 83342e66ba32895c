#pragma once

#include <vector>

#include "docqa_core/segmentation/segmentation_strategy.hpp"
#include "docqa_core/types/text_unit.hpp"

namespace docqa_core {

/**
 * @brief Turns extracted blocks into the flat list of units that gets indexed.
 *
 * Tables always become exactly one unit. Text blocks within the strategy's size limit
 * pass through whole; larger ones are split by the strategy. Blank blocks and blank
 * pieces are dropped. Output order follows block order.
 */
class ChunkSegmenter {
 public:
  explicit ChunkSegmenter(SegmentationStrategyPtr strategy);

  std::vector<TextUnit> segment(const std::vector<RawBlock>& blocks) const;

  SegmentationStrategy& strategy() const {
    return *strategy_;
  }

 private:
  SegmentationStrategyPtr strategy_;
};

}  // namespace docqa_core
