#include "app.hpp"

#include <spdlog/common.h>

#include "chunk_fetcher.hpp"
#include "dataset.hpp"
#include "display.hpp"
#include "errors.hpp"
#include "load_strategy.hpp"
#include "logger.hpp"
#include "renderer.hpp"
#include "viewport.hpp"

namespace pqlens {

namespace {

int report(std::ostream& err, const arrow::Status& status,
           const std::string& path, const int64_t file_size_bytes = -1) {
  for (const auto& line : describe_error(status, path, file_size_bytes)) {
    err << line << "\n";
  }
  return kStartupFailureExitCode;
}

}  // namespace

Application::Application(ViewerConfig config)
    : Application(std::move(config), std::make_unique<SystemMemoryProbe>(),
                  std::make_unique<PosixTerminal>(),
                  std::make_unique<LinenoiseReader>(), detect_capabilities()) {}

Application::Application(ViewerConfig config,
                         std::unique_ptr<MemoryProbe> memory,
                         std::unique_ptr<Terminal> terminal,
                         std::unique_ptr<LineReader> lines,
                         const TerminalCapabilities caps)
    : config_(std::move(config)),
      memory_(std::move(memory)),
      terminal_(std::move(terminal)),
      lines_(std::move(lines)),
      caps_(caps) {}

void Application::configure_logging() const {
  auto& logger = Logger::getInstance();
  if (!config_.get_log_file().empty() &&
      !logger.setLogToFile(config_.get_log_file())) {
    log_warn("Could not open log file '{}', logging to stderr",
             config_.get_log_file());
  }
  logger.setLevel(config_.get_log_level());
}

int Application::run(std::ostream& out, std::ostream& err) {
  configure_logging();
  const std::string& path = config_.get_file_path();

  auto inspected = FileMetadataInspector::inspect(path);
  if (!inspected.ok()) {
    return report(err, inspected.status(), path);
  }
  std::shared_ptr<DatasetHandle> dataset = inspected.MoveValueUnsafe();

  auto columns = dataset->select_columns(config_.get_columns());
  if (!columns.ok()) {
    return report(err, columns.status(), path);
  }

  const double available_mb = memory_->available_mb();
  const LoadStrategy strategy =
      LoadStrategySelector(config_.is_lazy_loading_enabled())
          .select(dataset->file_size_bytes(),
                  config_.get_memory_threshold_mb(), available_mb);
  log_info("Load strategy {} (file {} bytes, threshold {} MB, available {} MB)",
           to_string(strategy), dataset->file_size_bytes(),
           config_.get_memory_threshold_mb(), available_mb);

  const auto renderer =
      make_renderer(config_.is_plain_output(), caps_.supports_unicode);
  auto fetcher = std::make_unique<ChunkFetcher>(
      dataset, strategy, columns.MoveValueUnsafe(),
      config_.get_cache_capacity());

  if (!config_.is_interactive()) {
    DisplayOptions options;
    options.rows = config_.get_rows();
    options.row_range = config_.get_row_range();
    options.table_format = config_.get_table_format();
    options.layout = config_.get_layout();
    if (auto status = display_once(*fetcher, *renderer, options, out);
        !status.ok()) {
      return report(err, status, path, dataset->file_size_bytes());
    }
    return 0;
  }

  print_summary(*fetcher, out);
  if (const double resident = memory_->resident_mb(); resident > 0) {
    out << spdlog::fmt_lib::format("Memory usage: {:.1f} MB\n", resident);
  }

  ViewOptions view;
  view.page_size = config_.get_rows();
  view.table_format = config_.get_table_format();
  view.layout = config_.get_layout();
  ViewportController controller(std::move(fetcher), *renderer, *terminal_,
                                caps_, *memory_, std::move(view), out);
  controller.run(*lines_);
  return 0;
}

}  // namespace pqlens
