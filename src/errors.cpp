#include "errors.hpp"

#include <algorithm>
#include <cctype>

#include <spdlog/common.h>

namespace pqlens {

namespace {

std::string lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return text;
}

bool contains(const std::string& haystack, const char* needle) {
  return haystack.find(needle) != std::string::npos;
}

arrow::StatusCode code_for(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::NotFound:
    case ErrorKind::PermissionDenied:
      return arrow::StatusCode::IOError;
    case ErrorKind::InvalidFormat:
    case ErrorKind::InvalidArgument:
      return arrow::StatusCode::Invalid;
    case ErrorKind::UnsupportedSchema:
      return arrow::StatusCode::NotImplemented;
    case ErrorKind::OutOfMemory:
      return arrow::StatusCode::OutOfMemory;
    case ErrorKind::Unknown:
      return arrow::StatusCode::UnknownError;
  }
  return arrow::StatusCode::UnknownError;
}

// Parquet reports format problems as IOError or Invalid with a message; the
// wording below is what the C++ reader emits for a missing magic number, a
// truncated footer and a footer that fails to deserialize.
bool looks_like_format_error(const std::string& msg) {
  return contains(msg, "parquet magic bytes") ||
         contains(msg, "not a parquet file") ||
         contains(msg, "parquet file size is 0") ||
         contains(msg, "couldn't deserialize thrift") ||
         contains(msg, "corrupt") || contains(msg, "footer") ||
         contains(msg, "invalid parquet");
}

}  // namespace

std::string to_string(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::NotFound:
      return "NotFound";
    case ErrorKind::PermissionDenied:
      return "PermissionDenied";
    case ErrorKind::InvalidFormat:
      return "InvalidFormat";
    case ErrorKind::UnsupportedSchema:
      return "UnsupportedSchema";
    case ErrorKind::OutOfMemory:
      return "OutOfMemory";
    case ErrorKind::InvalidArgument:
      return "InvalidArgument";
    case ErrorKind::Unknown:
      return "Unknown";
  }
  return "Unknown";
}

arrow::Status make_error(ErrorKind kind, const std::string& message) {
  return arrow::Status(code_for(kind), message,
                       std::make_shared<ViewerErrorDetail>(kind));
}

ErrorKind error_kind(const arrow::Status& status) {
  if (status.ok()) {
    return ErrorKind::Unknown;
  }
  if (const auto& detail = status.detail();
      detail && std::string(detail->type_id()) == ViewerErrorDetail::kTypeId) {
    return static_cast<const ViewerErrorDetail&>(*detail).kind();
  }

  const std::string msg = lower(status.message());
  if (status.IsOutOfMemory() || contains(msg, "bad_alloc") ||
      contains(msg, "out of memory")) {
    return ErrorKind::OutOfMemory;
  }
  // Before the not-found check: "magic bytes not found in footer"
  if (looks_like_format_error(msg)) {
    return ErrorKind::InvalidFormat;
  }
  if (contains(msg, "no such file") || contains(msg, "not found") ||
      contains(msg, "does not exist")) {
    return ErrorKind::NotFound;
  }
  if (contains(msg, "permission denied")) {
    return ErrorKind::PermissionDenied;
  }
  if (status.IsNotImplemented() || status.IsTypeError() ||
      contains(msg, "schema")) {
    return ErrorKind::UnsupportedSchema;
  }
  if (status.IsInvalid()) {
    return ErrorKind::InvalidFormat;
  }
  return ErrorKind::Unknown;
}

arrow::Status classify(const arrow::Status& status) {
  if (status.ok()) {
    return status;
  }
  return make_error(error_kind(status), status.message());
}

std::vector<std::string> describe_error(const arrow::Status& status,
                                        const std::string& path,
                                        int64_t file_size_bytes) {
  const std::string msg = status.message();
  switch (error_kind(status)) {
    case ErrorKind::NotFound:
      return {spdlog::fmt_lib::format("Error: File not found - '{}'", path),
              "Please check the file path and try again."};
    case ErrorKind::PermissionDenied:
      return {spdlog::fmt_lib::format(
                  "Error: Permission denied - cannot read file '{}'", path),
              "Please check file permissions and try again."};
    case ErrorKind::InvalidFormat: {
      const std::string low = lower(msg);
      if (contains(low, "magic bytes") || contains(low, "file size is 0") ||
          contains(low, "not a parquet file")) {
        return {spdlog::fmt_lib::format(
                    "Error: '{}' is not a valid Parquet file", path),
                "The file may be corrupted, empty, or in a different format."};
      }
      return {spdlog::fmt_lib::format(
                  "Error: Invalid Parquet file format - '{}'", path),
              spdlog::fmt_lib::format("Parser error: {}", msg),
              "The file may be corrupted or not a valid Parquet file."};
    }
    case ErrorKind::UnsupportedSchema:
      return {spdlog::fmt_lib::format(
                  "Error: Invalid Parquet schema in file '{}'", path),
              spdlog::fmt_lib::format("Schema error: {}", msg)};
    case ErrorKind::OutOfMemory: {
      std::vector<std::string> lines{
          spdlog::fmt_lib::format(
              "Error: Insufficient memory to load file '{}'", path),
          "The file may be too large for available memory."};
      if (file_size_bytes >= 0) {
        lines.push_back(spdlog::fmt_lib::format(
            "File size: {:.1f} MB",
            static_cast<double>(file_size_bytes) / (1024.0 * 1024.0)));
      }
      lines.emplace_back(
          "Try lowering --memory-threshold or selecting fewer columns.");
      return lines;
    }
    case ErrorKind::InvalidArgument:
      return {spdlog::fmt_lib::format("Error: {}", msg)};
    case ErrorKind::Unknown:
      break;
  }
  return {spdlog::fmt_lib::format(
              "Error: Unexpected error reading Parquet file '{}'", path),
          spdlog::fmt_lib::format("Error message: {}", msg)};
}

}  // namespace pqlens
