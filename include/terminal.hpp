#ifndef TERMINAL_HPP
#define TERMINAL_HPP

#include <termios.h>

#include <string_view>

namespace pqlens {

enum class Key {
  None,
  Up,
  Down,
  Left,
  Right,
  PageUp,
  PageDown,
  Char,
  Interrupt,  // Ctrl-C in raw mode
  EndOfInput
};

struct KeyEvent {
  Key key = Key::None;
  char ch = 0;  // set for Key::Char

  bool operator==(const KeyEvent& other) const = default;
};

/**
 * Decodes one read(2) worth of raw terminal input: a plain byte or an
 * ESC [ sequence (arrows A-D, 5~ / 6~ for page up/down). Unrecognized
 * sequences decode to Key::None.
 */
KeyEvent decode_key(std::string_view bytes);

struct TerminalSize {
  int width = 80;
  int height = 24;
};

// Detected once at startup and handed to whoever needs it.
struct TerminalCapabilities {
  // stdin and stdout are terminals, so single key presses can be read
  bool supports_live_keys = false;
  // the locale is UTF-8, box drawing characters are safe
  bool supports_unicode = false;
};

TerminalCapabilities detect_capabilities();

class Terminal {
 public:
  virtual ~Terminal() = default;

  virtual TerminalSize size() const = 0;

  virtual void clear() = 0;

  // Blocks until a key is pressed.
  virtual KeyEvent read_key() = 0;
};

// Puts stdin in non-canonical, no-echo mode for its lifetime.
class RawTermGuard {
 public:
  RawTermGuard();
  ~RawTermGuard();

  RawTermGuard(const RawTermGuard&) = delete;
  RawTermGuard& operator=(const RawTermGuard&) = delete;

  bool active() const { return active_; }

 private:
  bool active_ = false;
  termios old_{};
};

class PosixTerminal : public Terminal {
 public:
  // Size reported when stdout is not a terminal and COLUMNS/LINES are unset
  static constexpr TerminalSize kFallbackSize{80, 24};

  TerminalSize size() const override;
  void clear() override;
  KeyEvent read_key() override;
};

}  // namespace pqlens

#endif  // TERMINAL_HPP
