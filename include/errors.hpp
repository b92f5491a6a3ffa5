#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <arrow/status.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace pqlens {

enum class ErrorKind {
  NotFound,
  PermissionDenied,
  InvalidFormat,
  UnsupportedSchema,
  OutOfMemory,
  InvalidArgument,
  Unknown
};

std::string to_string(ErrorKind kind);

/**
 * @brief Status detail carrying the viewer's error classification.
 *
 * Attached to every arrow::Status produced by the inspector and the decode
 * path so the presentation layer can pick a message without parsing text.
 */
class ViewerErrorDetail : public arrow::StatusDetail {
 public:
  static constexpr const char* kTypeId = "pqlens::ViewerErrorDetail";

  explicit ViewerErrorDetail(ErrorKind kind) : kind_(kind) {}

  const char* type_id() const override { return kTypeId; }
  std::string ToString() const override { return to_string(kind_); }

  ErrorKind kind() const { return kind_; }

 private:
  ErrorKind kind_;
};

/**
 * @brief Builds a failed status tagged with @p kind.
 *
 * The Arrow status code follows the kind (NotFound and PermissionDenied are
 * IOError, InvalidFormat is Invalid, UnsupportedSchema is NotImplemented...).
 */
arrow::Status make_error(ErrorKind kind, const std::string& message);

/**
 * @brief Classification of @p status.
 *
 * Uses the attached ViewerErrorDetail when present, otherwise falls back to
 * the Arrow status code and the decoder's message text.
 */
ErrorKind error_kind(const arrow::Status& status);

/**
 * @brief Re-tags an arbitrary decoder status with its classification,
 * keeping the original message.
 */
arrow::Status classify(const arrow::Status& status);

/**
 * @brief Human readable explanation, one line per element.
 *
 * @param file_size_bytes used by the out-of-memory message, -1 when unknown
 */
std::vector<std::string> describe_error(const arrow::Status& status,
                                        const std::string& path,
                                        int64_t file_size_bytes = -1);

}  // namespace pqlens

#endif  // ERRORS_HPP
