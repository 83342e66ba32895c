#pragma once

#include "docqa_core/segmentation/segmentation_strategy.hpp"

namespace docqa_core {

// Sliding window of chunk_size code points, consecutive windows sharing `overlap`
class FixedWindowStrategy : public SegmentationStrategy {
 public:
  static constexpr size_t DEFAULT_CHUNK_SIZE = 2000;
  static constexpr size_t DEFAULT_OVERLAP = 200;

  explicit FixedWindowStrategy(size_t chunk_size = DEFAULT_CHUNK_SIZE,
                               size_t overlap = DEFAULT_OVERLAP);

  std::vector<std::string> split(const std::string& text) override;
  size_t max_unit_size() const override {
    return chunk_size_;
  }
  std::string name() const override {
    return "fixed";
  }

  size_t overlap() const {
    return overlap_;
  }

 private:
  size_t chunk_size_;
  size_t overlap_;
};

}  // namespace docqa_core
