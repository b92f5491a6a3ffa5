#ifndef ROW_RANGE_HPP
#define ROW_RANGE_HPP

#include <arrow/result.h>

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace pqlens {

/**
 * Half-open logical row interval [start, end).
 *
 * Used both as a fetch request and as the chunk cache key.
 */
struct RowRange {
  int64_t start = 0;
  int64_t end = 0;

  int64_t length() const { return end - start; }
  bool empty() const { return end <= start; }

  bool operator==(const RowRange& other) const = default;

  std::string to_string() const;
};

struct RowRangeHash {
  size_t operator()(const RowRange& range) const {
    return std::hash<int64_t>()(range.start) * 31 +
           std::hash<int64_t>()(range.end);
  }
};

/**
 * One physical row group of a file; cumulative_start is the number of
 * logical rows stored in the groups before it.
 */
struct RowGroupDescriptor {
  int index = 0;
  int64_t row_count = 0;
  int64_t cumulative_start = 0;

  int64_t end() const { return cumulative_start + row_count; }
};

/**
 * Builds contiguous descriptors from per-group row counts.
 */
std::vector<RowGroupDescriptor> make_descriptors(
    const std::vector<int64_t>& row_counts);

/**
 * Rejects negative starts and inverted ranges, then clamps end to
 * total_rows. A start at or past total_rows is returned unchanged and
 * resolves to nothing.
 */
arrow::Result<RowRange> validate_range(const RowRange& range,
                                       int64_t total_rows);

/**
 * Parses "START:END" (either side may be omitted: ":50", "100:").
 */
arrow::Result<RowRange> parse_row_range(const std::string& text,
                                        int64_t open_end = INT64_MAX);

/**
 * The row groups to decode for a request and the slice of their
 * concatenation that holds exactly the requested rows.
 */
struct ResolvedRange {
  std::vector<int> group_indices;
  RowRange trim;

  bool empty() const { return group_indices.empty(); }
};

class RowRangeResolver {
 public:
  /**
   * @brief Maps a logical range onto the minimal contiguous run of row
   * groups.
   *
   * @param descriptors ordered, contiguous row group descriptors
   * @param range already clamped to the file's row count
   * @return empty result when the range starts at or past the last row
   */
  static ResolvedRange resolve(
      const std::vector<RowGroupDescriptor>& descriptors,
      const RowRange& range);
};

}  // namespace pqlens

#endif  // ROW_RANGE_HPP
