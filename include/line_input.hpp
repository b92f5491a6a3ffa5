#ifndef LINE_INPUT_HPP
#define LINE_INPUT_HPP

#include <optional>
#include <string>

namespace pqlens {

// Source of typed commands when single key presses cannot be read.
class LineReader {
 public:
  virtual ~LineReader() = default;

  // nullopt at end of input
  virtual std::optional<std::string> read_line(const std::string& prompt) = 0;
};

// Prompt with editing and history through linenoise.
class LinenoiseReader : public LineReader {
 public:
  explicit LinenoiseReader(int history_len = 100);

  std::optional<std::string> read_line(const std::string& prompt) override;
};

}  // namespace pqlens

#endif  // LINE_INPUT_HPP
