#pragma once

#include <memory>
#include <string>
#include <vector>

#include "docqa_core/types/text_unit.hpp"

namespace docqa_core {

class ExtractionError : public std::exception {
 public:
  explicit ExtractionError(const std::string& message) : message_(message) {}
  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

class BlockExtractor {
 public:
  virtual ~BlockExtractor() = default;

  // Checks if this extractor understands a document with this content type / location
  virtual bool can_handle(const std::string& content_type, const std::string& source) const = 0;

  // Splits the document body into ordered paragraph and table blocks
  virtual std::vector<RawBlock> extract(const std::string& content) const = 0;

  virtual std::string name() const = 0;

 protected:
  // Splits on runs of blank lines, keeping each paragraph's inner line breaks
  static std::vector<std::string> split_paragraphs(const std::string& content);
  static std::string lowercase(std::string value);
  static bool has_extension(const std::string& source, const std::string& extension);
};

using BlockExtractorPtr = std::unique_ptr<BlockExtractor>;

}  // namespace docqa_core
