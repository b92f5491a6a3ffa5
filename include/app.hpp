#ifndef APP_HPP
#define APP_HPP

#include <memory>
#include <ostream>

#include "config.hpp"
#include "line_input.hpp"
#include "memory_probe.hpp"
#include "terminal.hpp"

namespace pqlens {

// Exit status when the dataset cannot be opened or displayed
constexpr int kStartupFailureExitCode = 1;

/**
 * One viewer session: opens the file, picks the load strategy and renderer
 * once, then runs either the one-shot display or the interactive pager.
 */
class Application {
 public:
  explicit Application(ViewerConfig config);

  // Replaces the system probe, terminal and line reader (used by tests).
  Application(ViewerConfig config, std::unique_ptr<MemoryProbe> memory,
              std::unique_ptr<Terminal> terminal,
              std::unique_ptr<LineReader> lines, TerminalCapabilities caps);

  // @return process exit status
  int run(std::ostream& out, std::ostream& err);

 private:
  void configure_logging() const;

  ViewerConfig config_;
  std::unique_ptr<MemoryProbe> memory_;
  std::unique_ptr<Terminal> terminal_;
  std::unique_ptr<LineReader> lines_;
  TerminalCapabilities caps_;
};

}  // namespace pqlens

#endif  // APP_HPP
