#include "../include/terminal.hpp"

#include <gtest/gtest.h>

#include <string>

namespace pqlens {

TEST(DecodeKeyTest, PlainBytes) {
  EXPECT_EQ(decode_key("q"), (KeyEvent{Key::Char, 'q'}));
  EXPECT_EQ(decode_key(" "), (KeyEvent{Key::Char, ' '}));
  EXPECT_EQ(decode_key(std::string(1, '\x03')), (KeyEvent{Key::Interrupt}));
  EXPECT_EQ(decode_key(std::string(1, '\x04')), (KeyEvent{Key::EndOfInput}));
  EXPECT_EQ(decode_key(""), (KeyEvent{Key::EndOfInput}));
}

TEST(DecodeKeyTest, ArrowSequences) {
  EXPECT_EQ(decode_key("\x1B[A"), (KeyEvent{Key::Up}));
  EXPECT_EQ(decode_key("\x1B[B"), (KeyEvent{Key::Down}));
  EXPECT_EQ(decode_key("\x1B[C"), (KeyEvent{Key::Right}));
  EXPECT_EQ(decode_key("\x1B[D"), (KeyEvent{Key::Left}));
  // application cursor mode
  EXPECT_EQ(decode_key("\x1BOA"), (KeyEvent{Key::Up}));
}

TEST(DecodeKeyTest, PageKeys) {
  EXPECT_EQ(decode_key("\x1B[5~"), (KeyEvent{Key::PageUp}));
  EXPECT_EQ(decode_key("\x1B[6~"), (KeyEvent{Key::PageDown}));
  EXPECT_EQ(decode_key("\x1B[5"), (KeyEvent{Key::None}));
}

TEST(DecodeKeyTest, UnknownSequences) {
  EXPECT_EQ(decode_key("\x1B"), (KeyEvent{Key::None}));
  EXPECT_EQ(decode_key("\x1B[Z"), (KeyEvent{Key::None}));
  EXPECT_EQ(decode_key("\x1Bx1"), (KeyEvent{Key::None}));
}

}  // namespace pqlens
