#include "docqa_core/extractors/markdown_extractor.hpp"

#include <regex>
#include <sstream>

#include "docqa_core/segmentation/segmentation_strategy.hpp"

namespace docqa_core {

bool MarkdownExtractor::can_handle(const std::string& content_type,
                                   const std::string& source) const {
  const std::string type = lowercase(content_type);
  return type.rfind("text/markdown", 0) == 0 || type.rfind("text/x-markdown", 0) == 0 ||
         has_extension(source, ".md") || has_extension(source, ".markdown");
}

std::vector<std::string> MarkdownExtractor::parse_table_row(const std::string& line) {
  std::string row = trim_whitespace(line);
  if (!row.empty() && row.front() == '|') {
    row.erase(0, 1);
  }
  if (!row.empty() && row.back() == '|') {
    row.pop_back();
  }

  std::vector<std::string> cells;
  std::string cell;
  for (size_t i = 0; i < row.size(); ++i) {
    if (row[i] == '\\' && i + 1 < row.size() && row[i + 1] == '|') {
      cell += '|';
      ++i;
    } else if (row[i] == '|') {
      cells.push_back(trim_whitespace(cell));
      cell.clear();
    } else {
      cell += row[i];
    }
  }
  cells.push_back(trim_whitespace(cell));
  return cells;
}

bool MarkdownExtractor::is_separator_row(const std::vector<std::string>& cells) {
  static const std::regex separator_cell(R"(^:?-+:?$)");
  for (const auto& cell : cells) {
    if (!std::regex_match(cell, separator_cell)) {
      return false;
    }
  }
  return !cells.empty();
}

void MarkdownExtractor::flush_text(std::string& buffer, std::vector<RawBlock>& blocks) const {
  for (auto& paragraph : split_paragraphs(buffer)) {
    blocks.push_back(RawBlock::paragraph(std::move(paragraph)));
  }
  buffer.clear();
}

/**
 * @brief Splits a Markdown document into paragraph and table blocks.
 *
 * Consecutive lines starting with '|' form one table; the header separator row is
 * dropped since tables are re-rendered later. Headings start a new paragraph so a
 * section title stays with the text that follows it.
 */
std::vector<RawBlock> MarkdownExtractor::extract(const std::string& content) const {
  std::vector<RawBlock> blocks;
  if (content.empty()) {
    return blocks;
  }

  const std::regex heading_regex(R"(^#{1,6}\s.*)");

  std::istringstream stream(content);
  std::string line;
  std::string text_buffer;
  std::vector<std::vector<std::string>> table_rows;

  auto flush_table = [&]() {
    if (!table_rows.empty()) {
      blocks.push_back(RawBlock::table(std::move(table_rows)));
      table_rows.clear();
    }
  };

  while (std::getline(stream, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    const std::string trimmed = trim_whitespace(line);

    if (!trimmed.empty() && trimmed.front() == '|') {
      flush_text(text_buffer, blocks);
      auto cells = parse_table_row(trimmed);
      // Only the row under the header is a delimiter; "-" elsewhere is data
      if (table_rows.size() != 1 || !is_separator_row(cells)) {
        table_rows.push_back(std::move(cells));
      }
      continue;
    }

    flush_table();
    if (std::regex_match(trimmed, heading_regex)) {
      flush_text(text_buffer, blocks);
    }
    text_buffer += line;
    text_buffer += '\n';
  }

  flush_table();
  flush_text(text_buffer, blocks);
  return blocks;
}

}  // namespace docqa_core
