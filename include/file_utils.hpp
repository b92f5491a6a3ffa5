#ifndef FILE_UTILS_HPP
#define FILE_UTILS_HPP

#include <arrow/result.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <string>

#include "errors.hpp"

namespace pqlens {

/**
 * @brief OK when @p file_path names a readable regular file; otherwise a
 * NotFound or PermissionDenied error.
 */
arrow::Status check_readable(const std::string& file_path);

arrow::Result<int64_t> file_size(const std::string& file_path);

// .parquet or .pqt, case-insensitive
bool has_parquet_extension(const std::string& file_path);

template <typename T>
arrow::Result<T> read_json_file(const std::string& file_path) {
  ARROW_RETURN_NOT_OK(check_readable(file_path));
  try {
    std::ifstream file(file_path);
    if (!file.is_open()) {
      return make_error(ErrorKind::PermissionDenied,
                        "Failed to open file for reading: " + file_path);
    }
    nlohmann::json j = nlohmann::json::parse(file);
    return j.get<T>();
  } catch (const nlohmann::json::exception& e) {
    return make_error(ErrorKind::InvalidArgument,
                      "Failed to parse JSON file " + file_path + ": " +
                          e.what());
  }
}

}  // namespace pqlens

#endif  // FILE_UTILS_HPP
