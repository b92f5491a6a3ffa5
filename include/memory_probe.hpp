#ifndef MEMORY_PROBE_HPP
#define MEMORY_PROBE_HPP

#include <string>
#include <utility>

namespace pqlens {

// Reported by the probe when the operating system query fails.
constexpr double kUnknownMemory = -1.0;

/**
 * Best-effort memory statistics in megabytes.
 *
 * Never fails: a reading that cannot be obtained is kUnknownMemory and the
 * caller skips whatever decision depended on it.
 */
class MemoryProbe {
 public:
  virtual ~MemoryProbe() = default;

  // Memory the system can hand out without swapping.
  virtual double available_mb() const = 0;

  // Resident set size of this process.
  virtual double resident_mb() const = 0;
};

// Reads /proc on Linux, with sysinfo(2) and getrusage(2) as fallbacks.
class SystemMemoryProbe : public MemoryProbe {
 public:
  explicit SystemMemoryProbe(std::string proc_root = "/proc")
      : proc_root_(std::move(proc_root)) {}

  double available_mb() const override;
  double resident_mb() const override;

 private:
  std::string proc_root_;
};

// Fixed readings, used when memory-based decisions must be reproducible.
class FixedMemoryProbe : public MemoryProbe {
 public:
  FixedMemoryProbe(double available_mb, double resident_mb)
      : available_(available_mb), resident_(resident_mb) {}

  double available_mb() const override { return available_; }
  double resident_mb() const override { return resident_; }

 private:
  double available_;
  double resident_;
};

}  // namespace pqlens

#endif  // MEMORY_PROBE_HPP
