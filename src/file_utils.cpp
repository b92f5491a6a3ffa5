#include "file_utils.hpp"

#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <system_error>

namespace pqlens {

arrow::Status check_readable(const std::string& file_path) {
  if (file_path.empty()) {
    return make_error(ErrorKind::InvalidArgument, "No file path provided");
  }
  std::error_code ec;
  const auto status = std::filesystem::status(file_path, ec);
  if (ec == std::errc::permission_denied) {
    return make_error(ErrorKind::PermissionDenied,
                      "Permission denied: " + file_path);
  }
  if (ec || !std::filesystem::exists(status)) {
    return make_error(ErrorKind::NotFound, "File not found: " + file_path);
  }
  if (std::filesystem::is_directory(status)) {
    return make_error(ErrorKind::InvalidFormat,
                      "Path is a directory, not a Parquet file: " + file_path);
  }
  if (::access(file_path.c_str(), R_OK) != 0) {
    return make_error(ErrorKind::PermissionDenied,
                      "Permission denied: " + file_path);
  }
  return arrow::Status::OK();
}

arrow::Result<int64_t> file_size(const std::string& file_path) {
  std::error_code ec;
  const auto size = std::filesystem::file_size(file_path, ec);
  if (ec) {
    if (ec == std::errc::no_such_file_or_directory) {
      return make_error(ErrorKind::NotFound, "File not found: " + file_path);
    }
    return make_error(ErrorKind::Unknown, "Failed to stat " + file_path +
                                              ": " + ec.message());
  }
  return static_cast<int64_t>(size);
}

bool has_parquet_extension(const std::string& file_path) {
  std::string ext = std::filesystem::path(file_path).extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return ext == ".parquet" || ext == ".pqt";
}

}  // namespace pqlens
