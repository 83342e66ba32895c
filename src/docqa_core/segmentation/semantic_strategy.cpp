#include "docqa_core/segmentation/semantic_strategy.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

#include "docqa_core/segmentation/fixed_window_strategy.hpp"

namespace docqa_core {

SemanticStrategy::SemanticStrategy(EmbeddingProvider& provider, size_t max_unit_size,
                                   double breakpoint_percentile)
    : provider_(provider),
      max_unit_size_(max_unit_size),
      breakpoint_percentile_(breakpoint_percentile) {
  if (max_unit_size_ == 0) {
    throw std::invalid_argument("max_unit_size must be positive");
  }
  if (breakpoint_percentile_ < 0.0 || breakpoint_percentile_ > 100.0) {
    throw std::invalid_argument("breakpoint_percentile must be within [0, 100]");
  }
}

std::vector<std::string> SemanticStrategy::split_sentences(const std::string& text) {
  std::vector<std::string> sentences;
  std::string current;

  auto flush = [&]() {
    std::string sentence = trim_whitespace(current);
    if (!sentence.empty()) {
      sentences.push_back(std::move(sentence));
    }
    current.clear();
  };

  for (size_t i = 0; i < text.size(); ++i) {
    const char c = text[i];
    if (c == '\n') {
      flush();
      continue;
    }
    current += c;
    const bool terminal = c == '.' || c == '!' || c == '?';
    const bool at_break =
        i + 1 == text.size() || std::isspace(static_cast<unsigned char>(text[i + 1])) != 0;
    if (terminal && at_break) {
      flush();
    }
  }
  flush();
  return sentences;
}

double SemanticStrategy::percentile(std::vector<double> values, double p) {
  if (values.empty()) {
    return 0.0;
  }
  std::sort(values.begin(), values.end());
  const double rank = (std::clamp(p, 0.0, 100.0) / 100.0) * static_cast<double>(values.size() - 1);
  const auto lower = static_cast<size_t>(std::floor(rank));
  const auto upper = static_cast<size_t>(std::ceil(rank));
  const double fraction = rank - static_cast<double>(lower);
  return values[lower] + (values[upper] - values[lower]) * fraction;
}

double SemanticStrategy::cosine_similarity(const EmbeddingVector& a, const EmbeddingVector& b) {
  if (a.size() != b.size() || a.empty()) {
    return 0.0;
  }
  double dot = 0.0;
  double norm_a = 0.0;
  double norm_b = 0.0;
  for (size_t i = 0; i < a.size(); ++i) {
    dot += static_cast<double>(a[i]) * b[i];
    norm_a += static_cast<double>(a[i]) * a[i];
    norm_b += static_cast<double>(b[i]) * b[i];
  }
  if (norm_a == 0.0 || norm_b == 0.0) {
    return 0.0;
  }
  return dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
}

void SemanticStrategy::emit_group(const std::string& group, std::vector<std::string>& out) {
  if (code_point_length(group) <= max_unit_size_) {
    out.push_back(group);
    return;
  }
  FixedWindowStrategy fallback(max_unit_size_, std::min<size_t>(FixedWindowStrategy::DEFAULT_OVERLAP,
                                                                max_unit_size_ / 10));
  for (auto& piece : fallback.split(group)) {
    out.push_back(std::move(piece));
  }
}

std::vector<std::string> SemanticStrategy::split(const std::string& text) {
  std::vector<std::string> out;
  const std::vector<std::string> sentences = split_sentences(sanitize_utf8(text));
  if (sentences.empty()) {
    return out;
  }
  if (sentences.size() == 1) {
    emit_group(sentences.front(), out);
    return out;
  }

  const std::vector<EmbeddingVector> vectors = provider_.embed(sentences);
  std::vector<double> similarities;
  similarities.reserve(sentences.size() - 1);
  for (size_t i = 0; i + 1 < sentences.size(); ++i) {
    similarities.push_back(cosine_similarity(vectors[i], vectors[i + 1]));
  }
  const double threshold = percentile(similarities, 100.0 - breakpoint_percentile_);

  std::string group = sentences.front();
  for (size_t i = 1; i < sentences.size(); ++i) {
    if (similarities[i - 1] < threshold) {
      emit_group(group, out);
      group = sentences[i];
    } else {
      group += " ";
      group += sentences[i];
    }
  }
  emit_group(group, out);
  return out;
}

}  // namespace docqa_core
