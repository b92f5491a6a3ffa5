#include "cli.hpp"

#include <charconv>
#include <optional>
#include <stdexcept>

#include "config_file.hpp"
#include "errors.hpp"

namespace pqlens {

namespace {

arrow::Status invalid(const std::string& message) {
  return make_error(ErrorKind::InvalidArgument, message);
}

arrow::Result<int64_t> parse_int(const std::string& option,
                                 const std::string& text) {
  int64_t value = 0;
  const char* end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (text.empty() || ec != std::errc() || ptr != end) {
    return invalid("argument " + option + ": invalid int value: '" + text +
                   "'");
  }
  return value;
}

arrow::Result<double> parse_double(const std::string& option,
                                   const std::string& text) {
  try {
    size_t used = 0;
    const double value = std::stod(text, &used);
    if (used == text.size()) {
      return value;
    }
  } catch (const std::logic_error&) {
    // reported below
  }
  return invalid("argument " + option + ": invalid float value: '" + text +
                 "'");
}

}  // namespace

std::string usage() {
  return "Usage: pqlens [OPTIONS] [FILE]\n"
         "View and explore Parquet files in the terminal.\n"
         "\n"
         "Arguments:\n"
         "  FILE                      Parquet file (default: " +
         std::string(defaults::FILE_PATH) +
         ")\n"
         "\n"
         "Options:\n"
         "  -n, --rows N              Rows to display / page size (default: "
         "10)\n"
         "  -i, --interactive         Page through the file with the keyboard\n"
         "  -t, --table-format FMT    plain, simple, github, grid, fancy_grid,\n"
         "                            pipe, orgtbl or jira (default: grid)\n"
         "  -c, --columns NAMES       Columns to read; repeatable or comma "
         "separated\n"
         "  -r, --row-range S:E       Show rows [S, E) instead of the first "
         "rows\n"
         "      --no-lazy-loading     Always read the whole file up front\n"
         "      --memory-threshold MB File size above which rows are read "
         "lazily\n"
         "                            (default: 100)\n"
         "      --cache-size N        Chunks kept in memory (default: 10)\n"
         "      --plain               Plain text tables without decoration\n"
         "      --config PATH         JSON file with default settings\n"
         "      --log-file PATH       Write diagnostics to PATH\n"
         "      --verbose             Debug logging\n"
         "  -V, --version             Print the version and exit\n"
         "  -h, --help                Show this help message\n";
}

arrow::Result<CliCommand> parse_args(const std::vector<std::string>& args) {
  CliCommand command;

  // --config first so that everything else overrides it
  for (size_t i = 0; i < args.size(); ++i) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        return invalid("argument --config: expected one argument");
      }
      ARROW_ASSIGN_OR_RAISE(command.config,
                            load_config_file(args[i + 1], command.config));
    }
  }

  ViewerConfigBuilder builder(command.config);
  std::vector<std::string> columns;
  std::optional<std::string> file_path;

  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];
    auto value = [&]() -> arrow::Result<std::string> {
      if (i + 1 >= args.size()) {
        return invalid("argument " + arg + ": expected one argument");
      }
      return args[++i];
    };

    if (arg == "--help" || arg == "-h") {
      command.action = CliAction::Help;
      return command;
    } else if (arg == "--version" || arg == "-V") {
      command.action = CliAction::Version;
      return command;
    } else if (arg == "--rows" || arg == "-n") {
      ARROW_ASSIGN_OR_RAISE(auto text, value());
      ARROW_ASSIGN_OR_RAISE(auto rows, parse_int(arg, text));
      builder.with_rows(rows);
    } else if (arg == "--interactive" || arg == "-i") {
      builder.with_interactive(true);
    } else if (arg == "--table-format" || arg == "-t") {
      ARROW_ASSIGN_OR_RAISE(auto format, value());
      builder.with_table_format(format);
    } else if (arg == "--columns" || arg == "-c") {
      ARROW_ASSIGN_OR_RAISE(auto text, value());
      for (auto& name : split_column_list(text)) {
        columns.push_back(std::move(name));
      }
    } else if (arg == "--row-range" || arg == "-r") {
      ARROW_ASSIGN_OR_RAISE(auto text, value());
      ARROW_ASSIGN_OR_RAISE(auto range, parse_row_range(text));
      builder.with_row_range(range);
    } else if (arg == "--no-lazy-loading") {
      builder.with_lazy_loading(false);
    } else if (arg == "--memory-threshold") {
      ARROW_ASSIGN_OR_RAISE(auto text, value());
      ARROW_ASSIGN_OR_RAISE(auto threshold, parse_double(arg, text));
      builder.with_memory_threshold_mb(threshold);
    } else if (arg == "--cache-size") {
      ARROW_ASSIGN_OR_RAISE(auto text, value());
      ARROW_ASSIGN_OR_RAISE(auto size, parse_int(arg, text));
      if (size < 1) {
        return invalid("argument --cache-size: must be at least 1");
      }
      builder.with_cache_capacity(static_cast<size_t>(size));
    } else if (arg == "--plain") {
      builder.with_plain_output(true);
    } else if (arg == "--config") {
      ++i;  // applied above
    } else if (arg == "--log-file") {
      ARROW_ASSIGN_OR_RAISE(auto path, value());
      builder.with_log_file(path);
    } else if (arg == "--verbose") {
      builder.with_log_level(LogLevel::DEBUG);
    } else if (arg.size() > 1 && arg[0] == '-') {
      return invalid("unrecognized arguments: " + arg);
    } else if (!file_path) {
      file_path = arg;
    } else {
      return invalid("unrecognized arguments: " + arg);
    }
  }

  if (!columns.empty()) {
    builder.with_columns(std::move(columns));
  }
  if (file_path) {
    builder.with_file_path(*file_path);
  }
  command.config = builder.build();
  ARROW_RETURN_NOT_OK(validate_config(command.config));
  return command;
}

arrow::Result<CliCommand> parse_args(const int argc, char* argv[]) {
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    args.emplace_back(argv[i]);
  }
  return parse_args(args);
}

}  // namespace pqlens
