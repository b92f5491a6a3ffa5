#include "../include/text_table.hpp"

#include <arrow/api.h>
#include <gtest/gtest.h>

#include "test_utils.hpp"

namespace pqlens {

TEST(TextTableTest, DisplayWidthCountsCodePoints) {
  EXPECT_EQ(display_width("hello"), 5u);
  EXPECT_EQ(display_width("héllo"), 5u);
  EXPECT_EQ(display_width(""), 0u);
}

TEST(TextTableTest, TruncateAddsEllipsis) {
  EXPECT_EQ(truncate_cell("short", 10), "short");
  EXPECT_EQ(truncate_cell("exactly-10", 10), "exactly-10");
  EXPECT_EQ(truncate_cell("abcdefghijkl", 10), "abcdefg...");
  EXPECT_EQ(truncate_cell("ééééééééééé", 5), "éé...");
  EXPECT_EQ(truncate_cell("anything", 0), "anything");
}

TEST(TextTableTest, FormatsCellsByType) {
  auto table = test::make_people_table();
  EXPECT_EQ(format_column(*table->column(0)),
            (std::vector<std::string>{"1", "2", "3"}));
  EXPECT_EQ(format_column(*table->column(2)),
            (std::vector<std::string>{"10.5", "20.0", "30.5"}));
  EXPECT_EQ(format_column(*table->column(1), 2),
            (std::vector<std::string>{"Alice", "Bob"}));
}

TEST(TextTableTest, NullsAndBooleans) {
  arrow::BooleanBuilder flags;
  ASSERT_TRUE(flags.Append(true).ok());
  ASSERT_TRUE(flags.AppendNull().ok());
  ASSERT_TRUE(flags.Append(false).ok());
  auto array = flags.Finish().ValueOrDie();

  EXPECT_EQ(format_cell(*array, 0), "True");
  EXPECT_EQ(format_cell(*array, 1), kNullCell);
  EXPECT_EQ(format_cell(*array, 2), "False");
}

TEST(TextTableTest, OtherTypesUseScalarText) {
  arrow::Date32Builder dates;
  ASSERT_TRUE(dates.Append(0).ok());
  auto array = dates.Finish().ValueOrDie();
  const auto text = format_cell(*array, 0);
  EXPECT_FALSE(text.empty());
  EXPECT_NE(text, kNullCell);
}

TEST(TextTableTest, FormatColumnCrossesChunks) {
  arrow::Int64Builder first;
  arrow::Int64Builder second;
  ASSERT_TRUE(first.AppendValues(std::vector<int64_t>{1, 2}).ok());
  ASSERT_TRUE(second.AppendValues(std::vector<int64_t>{3}).ok());
  arrow::ChunkedArray column(
      {first.Finish().ValueOrDie(), second.Finish().ValueOrDie()});
  EXPECT_EQ(format_column(column),
            (std::vector<std::string>{"1", "2", "3"}));
  EXPECT_EQ(format_column(column, 3),
            (std::vector<std::string>{"1", "2", "3"}));
}

TEST(TextTableTest, MakeTextTableSelectsAndTruncates) {
  auto table = test::make_people_table();
  auto text = make_text_table(*table, {2, 1}, 7, 4);
  EXPECT_EQ(text.headers, (std::vector<std::string>{"v...", "name"}));
  EXPECT_EQ(text.right_align, (std::vector<bool>{true, false}));
  EXPECT_EQ(text.first_row, 7);
  ASSERT_EQ(text.num_rows(), 3u);
  EXPECT_EQ(text.rows[0], (std::vector<std::string>{"10.5", "A..."}));
  EXPECT_EQ(text.rows[2], (std::vector<std::string>{"30.5", "C..."}));
}

TEST(TextTableTest, GroupDigits) {
  EXPECT_EQ(group_digits(0), "0");
  EXPECT_EQ(group_digits(999), "999");
  EXPECT_EQ(group_digits(1000), "1,000");
  EXPECT_EQ(group_digits(1234567), "1,234,567");
  EXPECT_EQ(group_digits(-20000), "-20,000");
}

}  // namespace pqlens
