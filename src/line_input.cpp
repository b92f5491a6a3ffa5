#include "line_input.hpp"

#include <cstdlib>
#include <cstring>

#include "linenoise.h"

namespace pqlens {

LinenoiseReader::LinenoiseReader(const int history_len) {
  linenoiseHistorySetMaxLen(history_len);
}

std::optional<std::string> LinenoiseReader::read_line(
    const std::string& prompt) {
  char* line = linenoise(prompt.c_str());
  if (line == nullptr) {
    return std::nullopt;
  }
  std::string text(line);
  if (std::strlen(line) > 0) {
    linenoiseHistoryAdd(line);
  }
  free(line);
  return text;
}

}  // namespace pqlens
