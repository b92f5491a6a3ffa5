#include "text_table.hpp"

#include <spdlog/common.h>

#include <algorithm>

namespace pqlens {

namespace {

bool is_continuation_byte(unsigned char c) { return (c & 0xC0) == 0x80; }

std::string format_double(double value) {
  std::string text = spdlog::fmt_lib::format("{}", value);
  if (text.find_first_of(".eE") == std::string::npos &&
      text.find_first_of("ni") == std::string::npos) {
    text += ".0";
  }
  return text;
}

bool is_numeric(const arrow::DataType& type) {
  return arrow::is_integer(type.id()) || arrow::is_floating(type.id()) ||
         arrow::is_decimal(type.id());
}

}  // namespace

size_t display_width(std::string_view text) {
  return static_cast<size_t>(std::count_if(
      text.begin(), text.end(),
      [](char c) { return !is_continuation_byte(static_cast<unsigned char>(c)); }));
}

std::string truncate_cell(const std::string& text, const int max_width) {
  if (max_width <= 0 ||
      display_width(text) <= static_cast<size_t>(max_width)) {
    return text;
  }
  const size_t ellipsis = display_width(kEllipsis);
  const size_t keep =
      static_cast<size_t>(max_width) > ellipsis ? max_width - ellipsis : 0;

  // Byte offset just past the keep-th code point.
  size_t cells = 0;
  size_t pos = 0;
  while (pos < text.size()) {
    if (!is_continuation_byte(static_cast<unsigned char>(text[pos]))) {
      if (cells == keep) break;
      ++cells;
    }
    ++pos;
  }
  return text.substr(0, pos) + kEllipsis;
}

std::string format_cell(const arrow::Array& array, const int64_t index) {
  if (array.IsNull(index)) {
    return kNullCell;
  }
  switch (array.type_id()) {
    case arrow::Type::INT64:
      return std::to_string(
          static_cast<const arrow::Int64Array&>(array).Value(index));
    case arrow::Type::INT32:
      return std::to_string(
          static_cast<const arrow::Int32Array&>(array).Value(index));
    case arrow::Type::DOUBLE:
      return format_double(
          static_cast<const arrow::DoubleArray&>(array).Value(index));
    case arrow::Type::FLOAT:
      return format_double(
          static_cast<const arrow::FloatArray&>(array).Value(index));
    case arrow::Type::BOOL:
      return static_cast<const arrow::BooleanArray&>(array).Value(index)
                 ? "True"
                 : "False";
    case arrow::Type::STRING:
      return static_cast<const arrow::StringArray&>(array).GetString(index);
    case arrow::Type::LARGE_STRING:
      return static_cast<const arrow::LargeStringArray&>(array).GetString(
          index);
    default:
      break;
  }
  auto scalar = array.GetScalar(index);
  if (!scalar.ok()) {
    return "<" + scalar.status().ToString() + ">";
  }
  return (*scalar)->ToString();
}

std::vector<std::string> format_column(const arrow::ChunkedArray& column,
                                       const int64_t limit) {
  const int64_t wanted =
      limit < 0 ? column.length() : std::min(limit, column.length());
  std::vector<std::string> values;
  values.reserve(wanted);
  for (const auto& chunk : column.chunks()) {
    for (int64_t i = 0; i < chunk->length(); ++i) {
      if (static_cast<int64_t>(values.size()) >= wanted) {
        return values;
      }
      values.push_back(format_cell(*chunk, i));
    }
  }
  return values;
}

TextTable make_text_table(const arrow::Table& table,
                          const std::vector<int>& columns,
                          const int64_t first_row, const int max_width) {
  TextTable text;
  text.first_row = first_row;
  text.rows.resize(table.num_rows());

  for (int col : columns) {
    const auto& field = table.schema()->field(col);
    text.headers.push_back(truncate_cell(field->name(), max_width));
    text.right_align.push_back(is_numeric(*field->type()));

    auto values = format_column(*table.column(col));
    for (size_t row = 0; row < values.size(); ++row) {
      text.rows[row].push_back(truncate_cell(values[row], max_width));
    }
  }
  return text;
}

std::string group_digits(const int64_t value) {
  std::string digits = std::to_string(value < 0 ? -value : value);
  for (int pos = static_cast<int>(digits.size()) - 3; pos > 0; pos -= 3) {
    digits.insert(static_cast<size_t>(pos), ",");
  }
  return value < 0 ? "-" + digits : digits;
}

}  // namespace pqlens
