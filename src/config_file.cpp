#include "config_file.hpp"

#include <algorithm>
#include <cctype>

#include "errors.hpp"
#include "file_utils.hpp"
#include "logger.hpp"
#include "renderer.hpp"

namespace pqlens {

namespace {

std::string trim(const std::string& text) {
  const auto first = text.find_first_not_of(" \t");
  if (first == std::string::npos) return "";
  const auto last = text.find_last_not_of(" \t");
  return text.substr(first, last - first + 1);
}

arrow::Status invalid(const std::string& message) {
  return make_error(ErrorKind::InvalidArgument, message);
}

}  // namespace

arrow::Result<LogLevel> parse_log_level(const std::string& name) {
  std::string level = name;
  std::transform(level.begin(), level.end(), level.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (level == "debug") return LogLevel::DEBUG;
  if (level == "info") return LogLevel::INFO;
  if (level == "warn" || level == "warning") return LogLevel::WARN;
  if (level == "error") return LogLevel::ERROR;
  if (level == "off") return LogLevel::OFF;
  return invalid("unknown log level '" + name + "'");
}

std::vector<std::string> split_column_list(const std::string& text) {
  std::vector<std::string> names;
  size_t begin = 0;
  while (begin <= text.size()) {
    size_t end = text.find(',', begin);
    if (end == std::string::npos) end = text.size();
    auto name = trim(text.substr(begin, end - begin));
    if (!name.empty()) names.push_back(std::move(name));
    begin = end + 1;
  }
  return names;
}

arrow::Status validate_config(const ViewerConfig& config) {
  if (config.get_rows() < 0) {
    return invalid("rows must be a non-negative integer, got " +
                   std::to_string(config.get_rows()));
  }
  if (config.get_memory_threshold_mb() < 0) {
    return invalid("memory threshold must be non-negative");
  }
  if (!is_table_format(config.get_table_format())) {
    std::string choices;
    for (const auto& name : table_formats()) {
      choices += (choices.empty() ? "" : ", ") + name;
    }
    return invalid("invalid table format '" + config.get_table_format() +
                   "' (choose from " + choices + ")");
  }
  if (config.get_cache_capacity() == 0) {
    return invalid("cache size must be at least 1");
  }
  const auto& layout = config.get_layout();
  if (layout.min_column_width < 1 ||
      layout.max_column_width < layout.min_column_width) {
    return invalid("column widths must satisfy 1 <= min <= max");
  }
  if (const auto& range = config.get_row_range()) {
    if (range->start < 0 || range->start > range->end) {
      return invalid("row range must satisfy 0 <= START <= END, got " +
                     range->to_string());
    }
  }
  return arrow::Status::OK();
}

arrow::Result<ViewerConfig> apply_config_json(const nlohmann::json& json,
                                              const ViewerConfig& base) {
  if (!json.is_object()) {
    return invalid("configuration must be a JSON object");
  }
  ViewerConfigBuilder builder(base);
  try {
    for (const auto& [key, value] : json.items()) {
      if (key == "rows") {
        builder.with_rows(value.get<int64_t>());
      } else if (key == "interactive") {
        builder.with_interactive(value.get<bool>());
      } else if (key == "table_format") {
        builder.with_table_format(value.get<std::string>());
      } else if (key == "columns") {
        builder.with_columns(value.is_string()
                                 ? split_column_list(value.get<std::string>())
                                 : value.get<std::vector<std::string>>());
      } else if (key == "row_range") {
        ARROW_ASSIGN_OR_RAISE(auto range,
                              parse_row_range(value.get<std::string>()));
        builder.with_row_range(range);
      } else if (key == "memory_threshold_mb") {
        builder.with_memory_threshold_mb(value.get<double>());
      } else if (key == "lazy_loading") {
        builder.with_lazy_loading(value.get<bool>());
      } else if (key == "cache_size") {
        const auto size = value.get<int64_t>();
        if (size < 1) return invalid("cache_size must be at least 1");
        builder.with_cache_capacity(static_cast<size_t>(size));
      } else if (key == "min_column_width") {
        builder.with_min_column_width(value.get<int>());
      } else if (key == "max_column_width") {
        builder.with_max_column_width(value.get<int>());
      } else if (key == "plain") {
        builder.with_plain_output(value.get<bool>());
      } else if (key == "log_file") {
        builder.with_log_file(value.get<std::string>());
      } else if (key == "log_level") {
        ARROW_ASSIGN_OR_RAISE(auto level,
                              parse_log_level(value.get<std::string>()));
        builder.with_log_level(level);
      } else {
        log_warn("Ignoring unknown configuration key '{}'", key);
      }
    }
  } catch (const nlohmann::json::exception& e) {
    return invalid(std::string("bad configuration value: ") + e.what());
  }
  auto config = builder.build();
  ARROW_RETURN_NOT_OK(validate_config(config));
  return config;
}

arrow::Result<ViewerConfig> load_config_file(const std::string& path,
                                             const ViewerConfig& base) {
  ARROW_ASSIGN_OR_RAISE(auto json, read_json_file<nlohmann::json>(path));
  log_info("Loaded configuration from '{}'", path);
  return apply_config_json(json, base);
}

}  // namespace pqlens
