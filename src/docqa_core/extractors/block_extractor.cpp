#include "docqa_core/extractors/block_extractor.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

#include "docqa_core/segmentation/segmentation_strategy.hpp"

namespace docqa_core {

std::vector<std::string> BlockExtractor::split_paragraphs(const std::string& content) {
  std::vector<std::string> paragraphs;
  if (content.empty()) {
    return paragraphs;
  }

  // One or more blank lines act as paragraph separators
  const std::regex paragraph_regex(R"(\n[ \t\r]*\n)");

  std::sregex_token_iterator it(content.begin(), content.end(), paragraph_regex, -1);
  std::sregex_token_iterator end;
  for (; it != end; ++it) {
    std::string paragraph = trim_whitespace(it->str());
    if (!paragraph.empty()) {
      paragraphs.push_back(std::move(paragraph));
    }
  }
  return paragraphs;
}

std::string BlockExtractor::lowercase(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool BlockExtractor::has_extension(const std::string& source, const std::string& extension) {
  // Ignore query strings and fragments on URLs
  std::string path = source.substr(0, source.find_first_of("?#"));
  path = lowercase(path);
  return path.size() >= extension.size() &&
         path.compare(path.size() - extension.size(), extension.size(), extension) == 0;
}

}  // namespace docqa_core
