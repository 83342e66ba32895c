#include "docqa_core/segmentation/segmentation_strategy.hpp"

#include <utf8.h>

#include <algorithm>
#include <cctype>
#include <iterator>

namespace docqa_core {

std::string sanitize_utf8(const std::string& text) {
  if (utf8::is_valid(text.begin(), text.end())) {
    return text;
  }
  std::string clean;
  utf8::replace_invalid(text.begin(), text.end(), std::back_inserter(clean));
  return clean;
}

size_t code_point_length(const std::string& text) {
  if (!utf8::is_valid(text.begin(), text.end())) {
    return code_point_length(sanitize_utf8(text));
  }
  return static_cast<size_t>(utf8::distance(text.begin(), text.end()));
}

std::string trim_whitespace(const std::string& text) {
  auto not_space = [](unsigned char c) { return std::isspace(c) == 0; };
  auto first = std::find_if(text.begin(), text.end(), not_space);
  auto last = std::find_if(text.rbegin(), text.rend(), not_space).base();
  if (first >= last) {
    return "";
  }
  return std::string(first, last);
}

std::string truncate_code_points(const std::string& raw, size_t max_code_points) {
  const std::string text = sanitize_utf8(raw);
  auto it = text.begin();
  for (size_t i = 0; i < max_code_points && it != text.end(); ++i) {
    utf8::next(it, text.end());
  }
  return std::string(text.begin(), it);
}

}  // namespace docqa_core
