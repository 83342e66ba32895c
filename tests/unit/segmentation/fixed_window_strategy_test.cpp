#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "docqa_core/segmentation/fixed_window_strategy.hpp"

namespace docqa_core {

TEST(FixedWindowStrategyTest, RejectsInvalidParameters) {
  EXPECT_THROW(FixedWindowStrategy(0, 0), std::invalid_argument);
  EXPECT_THROW(FixedWindowStrategy(100, 100), std::invalid_argument);
  EXPECT_THROW(FixedWindowStrategy(100, 150), std::invalid_argument);
  EXPECT_NO_THROW(FixedWindowStrategy(100, 99));
}

TEST(FixedWindowStrategyTest, DefaultsMatchDocumentedSizes) {
  FixedWindowStrategy strategy;
  EXPECT_EQ(strategy.max_unit_size(), 2000u);
  EXPECT_EQ(strategy.overlap(), 200u);
  EXPECT_EQ(strategy.name(), "fixed");
}

TEST(FixedWindowStrategyTest, WindowsOverlapByConfiguredAmount) {
  FixedWindowStrategy strategy(10, 3);
  const std::string text = "abcdefghijklmnopqrstuvwxyz";  // 26 code points

  auto pieces = strategy.split(text);
  // Starts at 0, 7, 14, 21; the window at 21 reaches the end
  ASSERT_EQ(pieces.size(), 4u);
  EXPECT_EQ(pieces[0], "abcdefghij");
  EXPECT_EQ(pieces[1], "hijklmnopq");
  EXPECT_EQ(pieces[2], "opqrstuvwx");
  EXPECT_EQ(pieces[3], "vwxyz");
  for (size_t i = 0; i + 1 < pieces.size(); ++i) {
    EXPECT_EQ(pieces[i].substr(pieces[i].size() - 3), pieces[i + 1].substr(0, 3));
  }
}

TEST(FixedWindowStrategyTest, ShortTextIsOneWindow) {
  FixedWindowStrategy strategy(100, 10);
  auto pieces = strategy.split("short paragraph");
  ASSERT_EQ(pieces.size(), 1u);
  EXPECT_EQ(pieces[0], "short paragraph");
}

TEST(FixedWindowStrategyTest, EmptyTextGivesNoWindows) {
  FixedWindowStrategy strategy(10, 2);
  EXPECT_TRUE(strategy.split("").empty());
}

TEST(FixedWindowStrategyTest, CountsCodePointsNotBytes) {
  FixedWindowStrategy strategy(4, 0);
  // Each character is two bytes in UTF-8
  const std::string text = "\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9\xC3\xA9";  // 6 x e-acute

  auto pieces = strategy.split(text);
  ASSERT_EQ(pieces.size(), 2u);
  EXPECT_EQ(pieces[0].size(), 8u);
  EXPECT_EQ(pieces[1].size(), 4u);
  EXPECT_EQ(code_point_length(pieces[0]), 4u);
}

TEST(FixedWindowStrategyTest, EveryWindowRespectsTheLimitAndCoversTheText) {
  FixedWindowStrategy strategy(50, 5);
  std::string text;
  for (int i = 0; i < 40; ++i) {
    text += "word" + std::to_string(i) + " ";
  }

  auto pieces = strategy.split(text);
  std::string rebuilt = pieces.front();
  for (size_t i = 0; i < pieces.size(); ++i) {
    EXPECT_LE(code_point_length(pieces[i]), 50u);
    if (i > 0) {
      rebuilt += pieces[i].substr(5);
    }
  }
  EXPECT_EQ(rebuilt, text);
}

TEST(SegmentationHelpersTest, TrimAndTruncate) {
  EXPECT_EQ(trim_whitespace("  \n hello world \t"), "hello world");
  EXPECT_EQ(trim_whitespace(" \n\t "), "");
  EXPECT_EQ(truncate_code_points("\xC3\xA9t\xC3\xA9", 2), "\xC3\xA9t");
  EXPECT_EQ(truncate_code_points("abc", 10), "abc");
}

TEST(SegmentationHelpersTest, InvalidUtf8IsSanitized) {
  const std::string broken = std::string("ab") + static_cast<char>(0xFF) + "cd";
  const std::string clean = sanitize_utf8(broken);
  EXPECT_NE(clean, broken);
  EXPECT_EQ(code_point_length(broken), 5u);
}

}  // namespace docqa_core
