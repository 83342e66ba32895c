#pragma once

#include <memory>
#include <string>
#include <vector>

namespace docqa_core {

/**
 * @brief Splits one oversized paragraph into retrievable pieces.
 *
 * Sizes are counted in Unicode code points, not bytes.
 */
class SegmentationStrategy {
 public:
  virtual ~SegmentationStrategy() = default;

  virtual std::vector<std::string> split(const std::string& text) = 0;

  // Paragraphs at or under this length are never handed to split()
  virtual size_t max_unit_size() const = 0;

  virtual std::string name() const = 0;
};

using SegmentationStrategyPtr = std::unique_ptr<SegmentationStrategy>;

// Number of code points in a UTF-8 string; invalid sequences count as one each
size_t code_point_length(const std::string& text);

// Replaces invalid UTF-8 sequences so code point iteration cannot throw
std::string sanitize_utf8(const std::string& text);

std::string trim_whitespace(const std::string& text);

// First `max_code_points` code points of the string
std::string truncate_code_points(const std::string& text, size_t max_code_points);

}  // namespace docqa_core
