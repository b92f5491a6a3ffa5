#ifndef CLI_HPP
#define CLI_HPP

#include <arrow/result.h>

#include <string>
#include <vector>

#include "config.hpp"

namespace pqlens {

inline constexpr const char* kVersion = "0.2.0";

// Exit status for command line mistakes
constexpr int kUsageExitCode = 2;

enum class CliAction { Run, Help, Version };

struct CliCommand {
  CliAction action = CliAction::Run;
  ViewerConfig config;
};

std::string usage();

/**
 * @brief Parses the command line (without the program name).
 *
 * A --config file is applied first wherever it appears; every other option
 * then overrides it. Returns InvalidArgument for unknown options, missing
 * or malformed values and settings that fail validate_config.
 */
arrow::Result<CliCommand> parse_args(const std::vector<std::string>& args);

arrow::Result<CliCommand> parse_args(int argc, char* argv[]);

}  // namespace pqlens

#endif  // CLI_HPP
