#include "docqa_core/types/text_unit.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace docqa_core {

std::string to_string(BlockKind kind) {
  switch (kind) {
    case BlockKind::Text:
      return "Text";
    case BlockKind::Table:
      return "Table";
    default:
      return "Unknown";
  }
}

std::string to_string(UnitKind kind) {
  switch (kind) {
    case UnitKind::Narrative:
      return "Narrative";
    case UnitKind::Table:
      return "Table";
    default:
      return "Unknown";
  }
}

UnitKind unit_kind_from_string(const std::string& str) {
  if (str == "Narrative")
    return UnitKind::Narrative;
  if (str == "Table")
    return UnitKind::Table;
  throw std::invalid_argument("Unknown UnitKind: " + str);
}

RawBlock RawBlock::paragraph(std::string text) {
  RawBlock block;
  block.kind = BlockKind::Text;
  block.text = std::move(text);
  return block;
}

RawBlock RawBlock::table(std::vector<std::vector<std::string>> rows) {
  RawBlock block;
  block.kind = BlockKind::Table;
  block.rows = std::move(rows);
  return block;
}

std::string render_table_markdown(const std::vector<std::vector<std::string>>& rows) {
  if (rows.empty()) {
    return "";
  }
  size_t columns = 0;
  for (const auto& row : rows) {
    columns = std::max(columns, row.size());
  }

  auto render_row = [columns](std::ostringstream& out, const std::vector<std::string>& row) {
    out << "|";
    for (size_t i = 0; i < columns; ++i) {
      out << " " << (i < row.size() ? row[i] : std::string()) << " |";
    }
    out << "\n";
  };

  std::ostringstream out;
  render_row(out, rows.front());
  out << "|";
  for (size_t i = 0; i < columns; ++i) {
    out << " --- |";
  }
  out << "\n";
  for (size_t r = 1; r < rows.size(); ++r) {
    render_row(out, rows[r]);
  }
  return out.str();
}

std::string block_text(const RawBlock& block) {
  if (block.kind == BlockKind::Table && !block.rows.empty()) {
    return render_table_markdown(block.rows);
  }
  return block.text;
}

}  // namespace docqa_core
