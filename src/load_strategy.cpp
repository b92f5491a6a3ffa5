#include "load_strategy.hpp"

namespace pqlens {

std::string to_string(const LoadStrategy strategy) {
  switch (strategy) {
    case LoadStrategy::Eager:
      return "eager";
    case LoadStrategy::Lazy:
      return "lazy";
  }
  return "eager";
}

LoadStrategy LoadStrategySelector::select(const int64_t file_size_bytes,
                                          const double threshold_mb,
                                          const double available_mb) const {
  if (!lazy_loading_enabled_) {
    return LoadStrategy::Eager;
  }

  const double file_size_mb =
      static_cast<double>(file_size_bytes) / (1024.0 * 1024.0);
  if (file_size_mb > threshold_mb) {
    return LoadStrategy::Lazy;
  }
  if (available_mb > 0 &&
      file_size_mb > kAvailableMemoryFraction * available_mb) {
    return LoadStrategy::Lazy;
  }
  return LoadStrategy::Eager;
}

}  // namespace pqlens
