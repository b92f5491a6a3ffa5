#include "row_range.hpp"

#include <algorithm>
#include <charconv>
#include <string_view>

#include "errors.hpp"

namespace pqlens {

std::string RowRange::to_string() const {
  return "[" + std::to_string(start) + "," + std::to_string(end) + ")";
}

std::vector<RowGroupDescriptor> make_descriptors(
    const std::vector<int64_t>& row_counts) {
  std::vector<RowGroupDescriptor> descriptors;
  descriptors.reserve(row_counts.size());

  int64_t cumulative = 0;
  for (size_t i = 0; i < row_counts.size(); ++i) {
    descriptors.push_back(
        RowGroupDescriptor{static_cast<int>(i), row_counts[i], cumulative});
    cumulative += row_counts[i];
  }
  return descriptors;
}

arrow::Result<RowRange> validate_range(const RowRange& range,
                                       const int64_t total_rows) {
  if (range.start < 0) {
    return make_error(ErrorKind::InvalidArgument,
                      "Invalid row range " + range.to_string() +
                          ": start must be non-negative");
  }
  if (range.start > range.end) {
    return make_error(ErrorKind::InvalidArgument,
                      "Invalid row range " + range.to_string() +
                          ": start is greater than end");
  }
  return RowRange{range.start, std::min(range.end, total_rows)};
}

arrow::Result<RowRange> parse_row_range(const std::string& text,
                                        const int64_t open_end) {
  const auto colon = text.find(':');
  if (colon == std::string::npos) {
    return make_error(ErrorKind::InvalidArgument,
                      "Invalid row range '" + text + "', expected START:END");
  }

  auto parse_bound = [&](std::string_view part,
                         int64_t fallback) -> arrow::Result<int64_t> {
    if (part.empty()) {
      return fallback;
    }
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(),
                                     value);
    if (ec != std::errc() || ptr != part.data() + part.size()) {
      return make_error(ErrorKind::InvalidArgument,
                        "Invalid row range '" + text +
                            "', bounds must be integers");
    }
    return value;
  };

  const std::string_view view(text);
  ARROW_ASSIGN_OR_RAISE(auto start, parse_bound(view.substr(0, colon), 0));
  ARROW_ASSIGN_OR_RAISE(auto end,
                        parse_bound(view.substr(colon + 1), open_end));
  return validate_range(RowRange{start, end}, open_end);
}

ResolvedRange RowRangeResolver::resolve(
    const std::vector<RowGroupDescriptor>& descriptors,
    const RowRange& range) {
  ResolvedRange result;
  if (descriptors.empty() || range.empty()) {
    return result;
  }

  const int64_t total_rows = descriptors.back().end();
  if (range.start >= total_rows) {
    return result;
  }
  const int64_t end = std::min(range.end, total_rows);

  // First group whose span ends after range.start. Empty groups share their
  // predecessor's end, so this always lands on a non-empty group.
  const auto first = std::ranges::upper_bound(
      descriptors, range.start, {},
      [](const RowGroupDescriptor& d) { return d.end(); });

  for (auto it = first; it != descriptors.end(); ++it) {
    result.group_indices.push_back(it->index);
    if (it->end() >= end) {
      break;
    }
  }

  result.trim.start = range.start - first->cumulative_start;
  result.trim.end = result.trim.start + (end - range.start);
  return result;
}

}  // namespace pqlens
