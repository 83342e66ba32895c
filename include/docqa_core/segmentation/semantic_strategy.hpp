#pragma once

#include "docqa_core/embedding/embedding_provider.hpp"
#include "docqa_core/segmentation/segmentation_strategy.hpp"

namespace docqa_core {

/**
 * @brief Groups sentences into topically coherent units.
 *
 * Each sentence is embedded and a unit boundary is placed between adjacent sentences
 * whose cosine similarity falls below the (100 - breakpoint_percentile)th percentile of
 * the paragraph's own adjacent-similarity distribution. Groups that still exceed
 * max_unit_size are cut with a fixed window.
 */
class SemanticStrategy : public SegmentationStrategy {
 public:
  SemanticStrategy(EmbeddingProvider& provider, size_t max_unit_size,
                   double breakpoint_percentile = 95.0);

  std::vector<std::string> split(const std::string& text) override;
  size_t max_unit_size() const override {
    return max_unit_size_;
  }
  std::string name() const override {
    return "semantic";
  }

  static std::vector<std::string> split_sentences(const std::string& text);

  // Linear-interpolated percentile, p in [0, 100]
  static double percentile(std::vector<double> values, double p);

  static double cosine_similarity(const EmbeddingVector& a, const EmbeddingVector& b);

 private:
  EmbeddingProvider& provider_;
  size_t max_unit_size_;
  double breakpoint_percentile_;

  void emit_group(const std::string& group, std::vector<std::string>& out);
};

}  // namespace docqa_core
