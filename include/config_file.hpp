#ifndef CONFIG_FILE_HPP
#define CONFIG_FILE_HPP

#include <arrow/result.h>
#include <arrow/status.h>

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "config.hpp"

namespace pqlens {

arrow::Result<LogLevel> parse_log_level(const std::string& name);

// "a,b, c" -> {"a", "b", "c"}; empty items are dropped.
std::vector<std::string> split_column_list(const std::string& text);

/**
 * @brief Range and format checks shared by the config file and the command
 * line.
 *
 * @return InvalidArgument describing the first offending setting
 */
arrow::Status validate_config(const ViewerConfig& config);

/**
 * @brief Overlays the settings present in @p json on @p base.
 *
 * Recognized keys: rows, interactive, table_format, columns (array or comma
 * separated string), row_range ("START:END"), memory_threshold_mb,
 * lazy_loading, cache_size, min_column_width, max_column_width, plain,
 * log_file, log_level. Unknown keys are logged and ignored.
 */
arrow::Result<ViewerConfig> apply_config_json(const nlohmann::json& json,
                                              const ViewerConfig& base);

// Reads a JSON object from @p path and applies it to @p base.
arrow::Result<ViewerConfig> load_config_file(const std::string& path,
                                             const ViewerConfig& base);

}  // namespace pqlens

#endif  // CONFIG_FILE_HPP
