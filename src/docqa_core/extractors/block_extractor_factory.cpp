#include "docqa_core/extractors/block_extractor_factory.hpp"

#include <algorithm>
#include <array>
#include <cctype>

#include "docqa_core/extractors/markdown_extractor.hpp"
#include "docqa_core/extractors/plaintext_extractor.hpp"

namespace docqa_core {

namespace {

bool is_binary_document(const std::string& content_type, const std::string& source) {
  std::string type = content_type;
  std::transform(type.begin(), type.end(), type.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  static const std::array<const char*, 5> binary_types = {
      "application/pdf", "application/msword", "application/vnd.openxmlformats", "image/",
      "application/vnd.ms-"};
  for (const char* prefix : binary_types) {
    if (type.rfind(prefix, 0) == 0) {
      return true;
    }
  }

  std::string path = source.substr(0, source.find_first_of("?#"));
  std::transform(path.begin(), path.end(), path.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  static const std::array<const char*, 8> binary_extensions = {
      ".pdf", ".docx", ".doc", ".xlsx", ".pptx", ".png", ".jpg", ".jpeg"};
  for (const char* ext : binary_extensions) {
    const std::string extension(ext);
    if (path.size() >= extension.size() &&
        path.compare(path.size() - extension.size(), extension.size(), extension) == 0) {
      return true;
    }
  }
  return false;
}

}  // namespace

BlockExtractorFactory::BlockExtractorFactory() {
  extractors_.push_back(std::make_unique<MarkdownExtractor>());
  extractors_.push_back(std::make_unique<PlainTextExtractor>());
  fallback_ = std::make_unique<PlainTextExtractor>();
}

const BlockExtractor& BlockExtractorFactory::get_extractor_for(const std::string& content_type,
                                                               const std::string& source) const {
  if (is_binary_document(content_type, source)) {
    throw ExtractionError("No extractor for binary document " + source + " (" + content_type +
                          ")");
  }
  for (const auto& extractor : extractors_) {
    if (extractor->can_handle(content_type, source)) {
      return *extractor;
    }
  }
  return *fallback_;
}

std::vector<RawBlock> BlockExtractorFactory::extract(const std::string& content_type,
                                                     const std::string& source,
                                                     const std::string& content) const {
  return get_extractor_for(content_type, source).extract(content);
}

}  // namespace docqa_core
