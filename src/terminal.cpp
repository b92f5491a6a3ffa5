#include "terminal.hpp"

#include <sys/ioctl.h>
#include <unistd.h>

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <string>

#include "logger.hpp"

namespace pqlens {

namespace {

constexpr char kEscape = 0x1B;
constexpr char kCtrlC = 0x03;
constexpr char kCtrlD = 0x04;

int env_int(const char* name) {
  const char* value = std::getenv(name);
  if (value == nullptr) return 0;
  return std::atoi(value);
}

bool env_mentions_utf8(const char* name) {
  const char* value = std::getenv(name);
  if (value == nullptr) return false;
  std::string text(value);
  for (auto& c : text) c = static_cast<char>(std::toupper(c));
  return text.find("UTF-8") != std::string::npos ||
         text.find("UTF8") != std::string::npos;
}

}  // namespace

KeyEvent decode_key(std::string_view bytes) {
  if (bytes.empty()) {
    return {Key::EndOfInput};
  }
  const char first = bytes[0];
  if (first == kCtrlC) {
    return {Key::Interrupt};
  }
  if (first == kCtrlD) {
    return {Key::EndOfInput};
  }
  if (first != kEscape) {
    return {Key::Char, first};
  }
  if (bytes.size() < 3 || (bytes[1] != '[' && bytes[1] != 'O')) {
    return {Key::None};
  }
  switch (bytes[2]) {
    case 'A':
      return {Key::Up};
    case 'B':
      return {Key::Down};
    case 'C':
      return {Key::Right};
    case 'D':
      return {Key::Left};
    case '5':
      return bytes.size() >= 4 && bytes[3] == '~' ? KeyEvent{Key::PageUp}
                                                  : KeyEvent{Key::None};
    case '6':
      return bytes.size() >= 4 && bytes[3] == '~' ? KeyEvent{Key::PageDown}
                                                  : KeyEvent{Key::None};
    default:
      return {Key::None};
  }
}

TerminalCapabilities detect_capabilities() {
  TerminalCapabilities caps;
  caps.supports_live_keys =
      ::isatty(STDIN_FILENO) == 1 && ::isatty(STDOUT_FILENO) == 1;
  caps.supports_unicode = env_mentions_utf8("LC_ALL") ||
                          env_mentions_utf8("LC_CTYPE") ||
                          env_mentions_utf8("LANG");
  log_debug("Terminal capabilities: live_keys={}, unicode={}",
            caps.supports_live_keys, caps.supports_unicode);
  return caps;
}

RawTermGuard::RawTermGuard() {
  if (::isatty(STDIN_FILENO) != 1) return;
  if (tcgetattr(STDIN_FILENO, &old_) != 0) {
    log_warn("tcgetattr failed (errno {})", errno);
    return;
  }
  termios raw = old_;
  // ISIG off so Ctrl-C arrives as a byte and quits the viewer cleanly
  raw.c_lflag &= ~(ICANON | ECHO | ISIG);
  raw.c_cc[VMIN] = 1;
  raw.c_cc[VTIME] = 0;
  if (tcsetattr(STDIN_FILENO, TCSANOW, &raw) != 0) {
    log_warn("tcsetattr failed (errno {})", errno);
    return;
  }
  active_ = true;
}

RawTermGuard::~RawTermGuard() {
  if (active_) {
    tcsetattr(STDIN_FILENO, TCSANOW, &old_);
  }
}

TerminalSize PosixTerminal::size() const {
  struct winsize ws{};
  TerminalSize result = kFallbackSize;
  if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0) {
    result.width = ws.ws_col;
    if (ws.ws_row > 0) result.height = ws.ws_row;
    return result;
  }
  if (const int columns = env_int("COLUMNS"); columns > 0) {
    result.width = columns;
  }
  if (const int lines = env_int("LINES"); lines > 0) {
    result.height = lines;
  }
  return result;
}

void PosixTerminal::clear() {
  if (::isatty(STDOUT_FILENO) != 1) return;
  std::fputs("\x1B[2J\x1B[H", stdout);
  std::fflush(stdout);
}

KeyEvent PosixTerminal::read_key() {
  std::fflush(stdout);
  RawTermGuard raw;
  char buf[8];
  for (;;) {
    const ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
    if (n < 0 && errno == EINTR) continue;
    if (n <= 0) {
      return {Key::EndOfInput};
    }
    return decode_key(std::string_view(buf, static_cast<size_t>(n)));
  }
}

}  // namespace pqlens
