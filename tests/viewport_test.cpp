#include "../include/viewport.hpp"

#include <gtest/gtest.h>

#include <limits>
#include <random>
#include <sstream>

#include "../include/errors.hpp"
#include "test_utils.hpp"

namespace pqlens {

TEST(ViewportTransitionTest, PageDownStopsAtLastFullPage) {
  ViewportState state;
  state = apply(state, Command::PageDown, 250, 3, 100);
  EXPECT_EQ(state.top_row, 100);
  state = apply(state, Command::PageDown, 250, 3, 100);
  EXPECT_EQ(state.top_row, 150);
  // 150 + 100 is not below 250: no further movement
  state = apply(state, Command::PageDown, 250, 3, 100);
  EXPECT_EQ(state.top_row, 150);
}

TEST(ViewportTransitionTest, PageDownNeedsMoreThanOnePage) {
  ViewportState state;
  EXPECT_EQ(apply(state, Command::PageDown, 80, 3, 100).top_row, 0);
  EXPECT_EQ(apply(state, Command::PageDown, 100, 3, 100).top_row, 0);
}

TEST(ViewportTransitionTest, PageUpClampsAtZero) {
  ViewportState state{150, 0};
  state = apply(state, Command::PageUp, 250, 3, 100);
  EXPECT_EQ(state.top_row, 50);
  state = apply(state, Command::PageUp, 250, 3, 100);
  EXPECT_EQ(state.top_row, 0);
}

TEST(ViewportTransitionTest, RowAndColumnMovesAreClamped) {
  ViewportState state{9, 2};
  EXPECT_EQ(apply(state, Command::RowDown, 10, 3, 5).top_row, 9);
  EXPECT_EQ(apply(state, Command::ColumnRight, 10, 3, 5).left_column, 2);
  ViewportState origin;
  EXPECT_EQ(apply(origin, Command::RowUp, 10, 3, 5).top_row, 0);
  EXPECT_EQ(apply(origin, Command::ColumnLeft, 10, 3, 5).left_column, 0);
  EXPECT_EQ(apply(origin, Command::Quit, 10, 3, 5), origin);
}

TEST(ViewportTransitionTest, EmptyDatasetStaysAtOrigin) {
  ViewportState origin;
  for (auto command : {Command::RowDown, Command::PageDown,
                       Command::ColumnRight, Command::PageUp}) {
    EXPECT_EQ(apply(origin, command, 0, 0, 10), origin);
  }
}

TEST(ViewportTransitionTest, HugePageSizeDoesNotOverflow) {
  constexpr int64_t kHuge = std::numeric_limits<int64_t>::max();
  ViewportState state{1, 0};
  EXPECT_EQ(apply(state, Command::PageDown, 250, 3, kHuge).top_row, 1);
  EXPECT_EQ(apply(state, Command::PageUp, 250, 3, kHuge).top_row, 0);
}

TEST(ViewportTransitionTest, RandomCommandsStayInBounds) {
  std::mt19937 rng(1234);
  const Command commands[] = {Command::RowDown,    Command::RowUp,
                              Command::PageDown,   Command::PageUp,
                              Command::ColumnRight, Command::ColumnLeft};
  std::uniform_int_distribution<int> pick(0, 5);

  for (int64_t total_rows : {int64_t{1}, int64_t{7}, int64_t{250},
                             int64_t{1001}}) {
    for (int total_columns : {1, 4, 30}) {
      for (int64_t page : {int64_t{1}, int64_t{10}, int64_t{100}}) {
        ViewportState state;
        for (int step = 0; step < 500; ++step) {
          state = apply(state, commands[pick(rng)], total_rows,
                        total_columns, page);
          ASSERT_GE(state.top_row, 0);
          ASSERT_LT(state.top_row, total_rows);
          ASSERT_GE(state.left_column, 0);
          ASSERT_LT(state.left_column, total_columns);
        }
      }
    }
  }
}

TEST(KeyBindingTest, LiveKeys) {
  EXPECT_EQ(command_for_key({Key::Down}), Command::RowDown);
  EXPECT_EQ(command_for_key({Key::Char, 'j'}), Command::RowDown);
  EXPECT_EQ(command_for_key({Key::Char, 'n'}), Command::RowDown);
  EXPECT_EQ(command_for_key({Key::Up}), Command::RowUp);
  EXPECT_EQ(command_for_key({Key::Char, 'k'}), Command::RowUp);
  EXPECT_EQ(command_for_key({Key::PageDown}), Command::PageDown);
  EXPECT_EQ(command_for_key({Key::PageUp}), Command::PageUp);
  EXPECT_EQ(command_for_key({Key::Char, ' '}), Command::ColumnRight);
  EXPECT_EQ(command_for_key({Key::Char, 'b'}), Command::ColumnLeft);
  EXPECT_EQ(command_for_key({Key::Char, 'Q'}), Command::Quit);
  EXPECT_EQ(command_for_key({Key::Interrupt}), Command::Quit);
  EXPECT_EQ(command_for_key({Key::Char, 'z'}), std::nullopt);
  EXPECT_EQ(command_for_key({Key::None}), std::nullopt);
}

TEST(KeyBindingTest, LineCommands) {
  EXPECT_EQ(command_for_line("n"), Command::RowDown);
  EXPECT_EQ(command_for_line(" P "), Command::RowUp);
  EXPECT_EQ(command_for_line("f"), Command::PageDown);
  EXPECT_EQ(command_for_line("b"), Command::PageUp);
  EXPECT_EQ(command_for_line("r"), Command::ColumnRight);
  EXPECT_EQ(command_for_line("l"), Command::ColumnLeft);
  EXPECT_EQ(command_for_line("q"), Command::Quit);
  EXPECT_EQ(command_for_line("next"), std::nullopt);
  EXPECT_EQ(command_for_line(""), std::nullopt);
}

class ViewportControllerTest : public ::testing::Test {
 protected:
  std::unique_ptr<ViewportController> make_controller(
      std::shared_ptr<arrow::Table> table, std::vector<int64_t> groups,
      int64_t page_size, bool live_keys = true,
      std::vector<KeyEvent> keys = {}) {
    auto dataset = test::make_dataset(std::move(table), std::move(groups),
                                      &source_);
    terminal_ = std::make_unique<test::ScriptedTerminal>(std::move(keys));
    ViewOptions options;
    options.page_size = page_size;
    options.table_format = "grid";
    return std::make_unique<ViewportController>(
        std::make_unique<ChunkFetcher>(dataset, LoadStrategy::Lazy),
        renderer_, *terminal_, TerminalCapabilities{live_keys, false},
        memory_, options, out_);
  }

  GridRenderer renderer_{false};
  FixedMemoryProbe memory_{kUnknownMemory, kUnknownMemory};
  std::unique_ptr<test::ScriptedTerminal> terminal_;
  test::InMemoryDataSource* source_ = nullptr;
  std::ostringstream out_;
};

TEST_F(ViewportControllerTest, TwoPageDownsFromTop) {
  auto controller =
      make_controller(test::make_sequence_table(250), {100, 100, 50}, 100);
  ASSERT_TRUE(controller->render().ok());
  EXPECT_TRUE(controller->dispatch(Command::PageDown));
  EXPECT_TRUE(controller->dispatch(Command::PageDown));
  EXPECT_EQ(controller->state().top_row, 150);
  EXPECT_NE(out_.str().find("--- Showing rows 151-250 of 250 (Page 2/3) ---"),
            std::string::npos);
}

TEST_F(ViewportControllerTest, RenderShowsHeaderAndVisibleColumns) {
  auto controller = make_controller(test::make_sequence_table(25), {25}, 10);
  ASSERT_TRUE(controller->render().ok());
  const auto text = out_.str();
  EXPECT_NE(text.find("--- Showing rows 1-10 of 25 (Page 1/3) ---"),
            std::string::npos);
  EXPECT_NE(text.find("Columns 1-3 of 3"), std::string::npos);
  EXPECT_NE(text.find("row-9"), std::string::npos);
  EXPECT_EQ(text.find("row-10"), std::string::npos);
  EXPECT_EQ(text.find("Memory:"), std::string::npos);
  EXPECT_EQ(terminal_->clears, 1);
}

TEST_F(ViewportControllerTest, ZeroColumnsExplainsWithoutFetching) {
  auto table = arrow::Table::Make(arrow::schema(arrow::FieldVector{}),
                                  arrow::ChunkedArrayVector{}, 500);
  auto controller = make_controller(table, {500}, 10);
  ASSERT_TRUE(controller->render().ok());

  const auto text = out_.str();
  EXPECT_NE(text.find("no columns"), std::string::npos);
  EXPECT_NE(text.find("Number of rows: 500"), std::string::npos);
  const auto& stats = controller->fetcher().cache().stats();
  EXPECT_EQ(stats.hits + stats.misses, 0u);
  EXPECT_EQ(controller->fetcher().decode_calls(), 0u);
}

TEST_F(ViewportControllerTest, NarrowTerminalExplainsInsteadOfBlankTable) {
  auto controller = make_controller(test::make_sequence_table(25), {25}, 10);
  terminal_->set_width(30);
  ASSERT_TRUE(controller->render().ok());
  const auto text = out_.str();
  EXPECT_NE(text.find("does not fit"), std::string::npos);
  EXPECT_NE(text.find("Columns 1-1 of 3 (too wide)"), std::string::npos);
  EXPECT_EQ(text.find("Columns 1-0"), std::string::npos);
  EXPECT_EQ(text.find("+---"), std::string::npos);
}

TEST_F(ViewportControllerTest, PageSizeLargerThanFileIsClamped) {
  auto controller =
      make_controller(test::make_sequence_table(250), {100, 100, 50},
                      std::numeric_limits<int64_t>::max());
  EXPECT_EQ(controller->page_size(), 250);
  EXPECT_EQ(controller->total_pages(), 1);

  EXPECT_TRUE(controller->dispatch(Command::RowDown));
  EXPECT_TRUE(controller->dispatch(Command::PageDown));
  EXPECT_EQ(controller->state().top_row, 1);
  EXPECT_NE(out_.str().find("--- Showing rows 2-250 of 250 (Page 1/1) ---"),
            std::string::npos);
}

TEST_F(ViewportControllerTest, FetchFailureKeepsPosition) {
  auto controller = make_controller(test::make_sequence_table(250),
                                    {100, 100, 50}, 100);
  ASSERT_TRUE(controller->render().ok());

  source_->failure = make_error(ErrorKind::NotFound, "file moved");
  EXPECT_TRUE(controller->dispatch(Command::RowDown));
  EXPECT_EQ(controller->state().top_row, 0);
  EXPECT_NE(out_.str().find("Error: File not found"), std::string::npos);

  source_->failure.reset();
  EXPECT_TRUE(controller->dispatch(Command::RowDown));
  EXPECT_EQ(controller->state().top_row, 1);
}

TEST_F(ViewportControllerTest, QuitEndsDispatch) {
  auto controller = make_controller(test::make_sequence_table(5), {5}, 2);
  EXPECT_FALSE(controller->dispatch(Command::Quit));
}

TEST_F(ViewportControllerTest, LiveKeyLoopRunsUntilQuit) {
  auto controller = make_controller(
      test::make_sequence_table(50), {20, 20, 10}, 10, true,
      {{Key::Down}, {Key::Down}, {Key::Right}, {Key::Char, 'x'},
       {Key::Char, 'q'}, {Key::Down}});
  test::ScriptedLineReader unused({});
  controller->run(unused);

  EXPECT_EQ(controller->state().top_row, 2);
  EXPECT_EQ(controller->state().left_column, 1);
  EXPECT_NE(out_.str().find("Exiting interactive mode."), std::string::npos);
  // Initial page plus three moves
  EXPECT_EQ(terminal_->clears, 4);
}

TEST_F(ViewportControllerTest, LiveKeyLoopStopsAtEndOfInput) {
  auto controller = make_controller(test::make_sequence_table(50), {50}, 10,
                                    true, {{Key::PageDown}});
  test::ScriptedLineReader unused({});
  controller->run(unused);
  EXPECT_EQ(controller->state().top_row, 10);
}

TEST_F(ViewportControllerTest, LineModeWhenLiveKeysUnavailable) {
  auto controller =
      make_controller(test::make_sequence_table(250), {100, 100, 50}, 100,
                      false);
  test::ScriptedLineReader lines({"f", "r", "what", "q", "n"});
  controller->run(lines);

  EXPECT_EQ(controller->state().top_row, 100);
  EXPECT_EQ(controller->state().left_column, 1);
  const auto text = out_.str();
  EXPECT_NE(text.find("[f]orward page"), std::string::npos);
  EXPECT_NE(text.find("Exiting interactive mode."), std::string::npos);
}

TEST_F(ViewportControllerTest, LineModeEndOfInputStops) {
  auto controller =
      make_controller(test::make_sequence_table(30), {30}, 10, false);
  test::ScriptedLineReader lines({"n"});
  controller->run(lines);
  EXPECT_EQ(controller->state().top_row, 1);
  EXPECT_NE(out_.str().find("Display stopped."), std::string::npos);
}

TEST_F(ViewportControllerTest, NoRowsSkipsTheLoop) {
  auto controller = make_controller(test::make_sequence_table(0), {}, 10,
                                    true, {{Key::Down}});
  test::ScriptedLineReader unused({});
  controller->run(unused);
  EXPECT_NE(out_.str().find("no data rows"), std::string::npos);
  EXPECT_EQ(terminal_->clears, 0);
}

}  // namespace pqlens
