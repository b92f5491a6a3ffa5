#ifndef LOAD_STRATEGY_HPP
#define LOAD_STRATEGY_HPP

#include <cstdint>
#include <string>

namespace pqlens {

enum class LoadStrategy { Eager, Lazy };

std::string to_string(LoadStrategy strategy);

// Share of available memory a file may take before it is read lazily.
constexpr double kAvailableMemoryFraction = 0.5;

class LoadStrategySelector {
 public:
  explicit LoadStrategySelector(bool lazy_loading_enabled = true)
      : lazy_loading_enabled_(lazy_loading_enabled) {}

  /**
   * @brief Decides whether a file is materialized up front or read by row
   * group on demand.
   *
   * Rules, first match wins: lazy loading disabled -> Eager; file larger than
   * threshold_mb -> Lazy; available_mb known (> 0) and the file exceeds half
   * of it -> Lazy; otherwise Eager. A zero threshold makes every non-empty
   * file lazy.
   *
   * @param available_mb current available memory, or a negative value when
   * unknown
   */
  [[nodiscard]] LoadStrategy select(int64_t file_size_bytes,
                                    double threshold_mb,
                                    double available_mb) const;

 private:
  bool lazy_loading_enabled_;
};

}  // namespace pqlens

#endif  // LOAD_STRATEGY_HPP
