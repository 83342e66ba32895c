#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "../../common/utilities_test.hpp"
#include "docqa_core/segmentation/chunk_segmenter.hpp"
#include "docqa_core/segmentation/fixed_window_strategy.hpp"

namespace docqa_tests {

using docqa_core::ChunkSegmenter;
using docqa_core::FixedWindowStrategy;
using docqa_core::RawBlock;
using docqa_core::UnitKind;

class ChunkSegmenterTest : public ::testing::Test {
 protected:
  ChunkSegmenter make_segmenter(size_t chunk_size, size_t overlap) {
    return ChunkSegmenter(std::make_unique<FixedWindowStrategy>(chunk_size, overlap));
  }
};

TEST_F(ChunkSegmenterTest, RequiresStrategy) {
  EXPECT_THROW(ChunkSegmenter(nullptr), std::invalid_argument);
}

TEST_F(ChunkSegmenterTest, ParagraphsAndTableBecomeFourUnits) {
  auto segmenter = make_segmenter(2000, 200);
  auto blocks = TestUtilities::create_paragraph_blocks(
      {"The insured is covered from the start date.", "Claims must be filed within 30 days.",
       "Premiums are payable annually."});
  blocks.push_back(TestUtilities::create_table_block(3, 2, "plan"));

  auto units = segmenter.segment(blocks);

  ASSERT_EQ(units.size(), 4u);
  EXPECT_EQ(units[0].content, "The insured is covered from the start date.");
  EXPECT_EQ(units[1].content, "Claims must be filed within 30 days.");
  EXPECT_EQ(units[2].content, "Premiums are payable annually.");
  EXPECT_EQ(units[3].kind, UnitKind::Table);
  for (int i = 0; i < 3; ++i) {
    EXPECT_EQ(units[i].kind, UnitKind::Narrative);
  }
  for (size_t i = 0; i < units.size(); ++i) {
    EXPECT_EQ(units[i].unit_index, static_cast<int>(i));
  }
}

TEST_F(ChunkSegmenterTest, LargeTableStaysOneUnit) {
  auto segmenter = make_segmenter(50, 5);
  RawBlock table = TestUtilities::create_table_block(40, 4, "benefit");

  auto units = segmenter.segment({table});

  ASSERT_EQ(units.size(), 1u);
  EXPECT_EQ(units[0].kind, UnitKind::Table);
  EXPECT_GT(units[0].content.size(), 50u);
  EXPECT_NE(units[0].content.find("benefit_39_3"), std::string::npos);
  EXPECT_EQ(units[0].content, docqa_core::block_text(table));
}

TEST_F(ChunkSegmenterTest, OversizedParagraphIsSplitWithinTheLimit) {
  auto segmenter = make_segmenter(100, 10);
  std::string long_text;
  for (int i = 0; i < 60; ++i) {
    long_text += "clause" + std::to_string(i) + " ";
  }

  auto units = segmenter.segment(TestUtilities::create_paragraph_blocks({long_text}));

  ASSERT_GT(units.size(), 1u);
  for (const auto& unit : units) {
    EXPECT_LE(docqa_core::code_point_length(unit.content), 100u);
    EXPECT_EQ(unit.kind, UnitKind::Narrative);
  }
  // Every clause appears in some unit
  for (int i = 0; i < 60; ++i) {
    const std::string clause = "clause" + std::to_string(i) + " ";
    bool found = false;
    for (const auto& unit : units) {
      found = found || unit.content.find(clause) != std::string::npos;
    }
    EXPECT_TRUE(found) << clause;
  }
}

TEST_F(ChunkSegmenterTest, ParagraphAtTheLimitIsKeptWhole) {
  auto segmenter = make_segmenter(20, 2);
  const std::string exact(20, 'a');
  auto units = segmenter.segment(TestUtilities::create_paragraph_blocks({exact}));
  ASSERT_EQ(units.size(), 1u);
  EXPECT_EQ(units[0].content, exact);
}

TEST_F(ChunkSegmenterTest, BlankBlocksAreDropped) {
  auto segmenter = make_segmenter(100, 10);
  std::vector<RawBlock> blocks = TestUtilities::create_paragraph_blocks({"  ", "real text", "\n\t"});
  blocks.push_back(RawBlock::table({}));

  auto units = segmenter.segment(blocks);
  ASSERT_EQ(units.size(), 1u);
  EXPECT_EQ(units[0].content, "real text");
  EXPECT_EQ(units[0].unit_index, 0);
}

TEST_F(ChunkSegmenterTest, EmptyInputGivesNoUnits) {
  auto segmenter = make_segmenter(100, 10);
  EXPECT_TRUE(segmenter.segment({}).empty());
}

}  // namespace docqa_tests
