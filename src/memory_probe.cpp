#include "memory_probe.hpp"

#include <sys/resource.h>
#include <sys/sysinfo.h>

#include <fstream>
#include <optional>
#include <sstream>

#include "logger.hpp"

namespace pqlens {

namespace {

constexpr double kKbPerMb = 1024.0;

// Value in kB of a "Key:   12345 kB" line of a /proc status file.
std::optional<double> read_kb_field(const std::string& path,
                                    const std::string& key) {
  std::ifstream file(path);
  if (!file.is_open()) {
    log_debug("memory probe: cannot open {}", path);
    return std::nullopt;
  }
  std::string line;
  while (std::getline(file, line)) {
    if (line.compare(0, key.size(), key) != 0 || line.size() <= key.size() ||
        line[key.size()] != ':') {
      continue;
    }
    std::istringstream fields(line.substr(key.size() + 1));
    double value = 0;
    if (fields >> value) {
      return value;
    }
    break;
  }
  log_debug("memory probe: field {} missing in {}", key, path);
  return std::nullopt;
}

}  // namespace

double SystemMemoryProbe::available_mb() const {
  if (auto kb = read_kb_field(proc_root_ + "/meminfo", "MemAvailable")) {
    return *kb / kKbPerMb;
  }

  struct sysinfo info{};
  if (sysinfo(&info) == 0) {
    const double bytes = static_cast<double>(info.freeram) * info.mem_unit;
    return bytes / (1024.0 * 1024.0);
  }
  log_debug("memory probe: available memory unknown");
  return kUnknownMemory;
}

double SystemMemoryProbe::resident_mb() const {
  if (auto kb = read_kb_field(proc_root_ + "/self/status", "VmRSS")) {
    return *kb / kKbPerMb;
  }

  // ru_maxrss is the peak, in kB on Linux; better than nothing.
  struct rusage usage{};
  if (getrusage(RUSAGE_SELF, &usage) == 0 && usage.ru_maxrss > 0) {
    return static_cast<double>(usage.ru_maxrss) / kKbPerMb;
  }
  log_debug("memory probe: resident memory unknown");
  return kUnknownMemory;
}

}  // namespace pqlens
