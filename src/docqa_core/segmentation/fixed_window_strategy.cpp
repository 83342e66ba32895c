#include "docqa_core/segmentation/fixed_window_strategy.hpp"

#include <utf8.h>

#include <algorithm>
#include <stdexcept>

namespace docqa_core {

FixedWindowStrategy::FixedWindowStrategy(size_t chunk_size, size_t overlap)
    : chunk_size_(chunk_size), overlap_(overlap) {
  if (chunk_size_ == 0) {
    throw std::invalid_argument("chunk_size must be positive");
  }
  if (overlap_ >= chunk_size_) {
    throw std::invalid_argument("overlap must be smaller than chunk_size");
  }
}

std::vector<std::string> FixedWindowStrategy::split(const std::string& raw) {
  std::vector<std::string> out;
  if (raw.empty()) {
    return out;
  }
  const std::string text = sanitize_utf8(raw);

  // Byte offset of every code point, plus the end of the string
  std::vector<size_t> offsets;
  offsets.reserve(text.size() + 1);
  for (auto it = text.begin(); it != text.end(); utf8::next(it, text.end())) {
    offsets.push_back(static_cast<size_t>(it - text.begin()));
  }
  const size_t total = offsets.size();
  offsets.push_back(text.size());

  const size_t step = chunk_size_ - overlap_;
  for (size_t start = 0; start < total; start += step) {
    const size_t end = std::min(start + chunk_size_, total);
    out.emplace_back(text, offsets[start], offsets[end] - offsets[start]);
    if (end == total) {
      break;
    }
  }
  return out;
}

}  // namespace docqa_core
