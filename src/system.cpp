/**
 * @file system.cpp
 * @brief System utilities implementation
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection
 *
 *          - Cgroup-aware available memory detection
 *
 *          - Clock parsing / formatting utilities
 */

#include "multicam/system.hpp"

#include <cctype>
#include <fstream>
#include <sstream>
#include <string>
#include <thread>

#include <fmt/core.h>

namespace multicam {

// **---- Internal Helpers ----**

namespace {

/// Helper to read a number from a file
long long read_long_from_file(const char *path) {
  std::ifstream f(path);
  if (!f)
    return -1;
  long long val;
  f >> val;
  return f.fail() ? -1 : val;
}

/// Helper to count CPUs from cpuset string
int count_cpuset(const char *path) {
  std::ifstream f(path);
  if (!f)
    return -1;
  std::string line;
  std::getline(f, line);
  auto cpus = parse_cpuset_string(line);
  return cpus.empty() ? -1 : static_cast<int>(cpus.size());
}

bool all_digits(const std::string &s) {
  if (s.empty())
    return false;
  for (unsigned char c : s) {
    if (!std::isdigit(c))
      return false;
  }
  return true;
}

} // anonymous namespace

std::vector<int> parse_cpuset_string(const std::string &line) {
  std::vector<int> cpus;
  std::stringstream ss(line);
  std::string part;
  while (std::getline(ss, part, ',')) {
    /// Trim trailing newline / spaces
    while (!part.empty() && std::isspace(static_cast<unsigned char>(part.back())))
      part.pop_back();
    if (part.empty())
      continue;

    auto dash = part.find('-');
    if (dash == std::string::npos) {
      if (!all_digits(part))
        return {};
      cpus.push_back(std::stoi(part));
    } else {
      /// Range like "0-3"
      std::string lo = part.substr(0, dash);
      std::string hi = part.substr(dash + 1);
      if (!all_digits(lo) || !all_digits(hi))
        return {};
      for (int cpu = std::stoi(lo); cpu <= std::stoi(hi); ++cpu) {
        cpus.push_back(cpu);
      }
    }
  }
  return cpus;
}

// **---- CPU Detection ----**

int detect_cpu_limit() {
  int limit = -1;

  /// Try cgroup v2 first (unified hierarchy)
  {
    std::ifstream f("/sys/fs/cgroup/cpu.max");
    if (f) {
      std::string quota_str, period_str;
      f >> quota_str >> period_str;
      if (quota_str != "max" && all_digits(quota_str) &&
          all_digits(period_str)) {
        long quota = std::stol(quota_str);
        long period = std::stol(period_str);
        if (quota > 0 && period > 0) {
          limit = static_cast<int>((quota + period - 1) / period);
        }
      }
    }
  }

  /// Try cgroup v1 CPU quota
  if (limit <= 0) {
    long long quota = read_long_from_file("/sys/fs/cgroup/cpu/cpu.cfs_quota_us");
    long long period =
        read_long_from_file("/sys/fs/cgroup/cpu/cpu.cfs_period_us");
    if (quota > 0 && period > 0) {
      limit = static_cast<int>((quota + period - 1) / period);
    }
  }

  /// Try cpuset (counts actual allowed cores)
  if (limit <= 0) {
    limit = count_cpuset("/sys/fs/cgroup/cpuset.cpus.effective");
    if (limit <= 0) {
      limit = count_cpuset("/sys/fs/cgroup/cpuset/cpuset.cpus");
    }
  }

  /// Fallback to hardware_concurrency (0 when unknown)
  if (limit <= 0) {
    limit = static_cast<int>(std::thread::hardware_concurrency());
  }

  return limit > 0 ? limit : -1;
}

// **---- Memory Detection ----**

long long detect_available_memory_bytes() {
  long long available = -1;

  std::ifstream meminfo("/proc/meminfo");
  std::string key;
  long long value_kb = 0;
  std::string unit;
  while (meminfo >> key >> value_kb >> unit) {
    if (key == "MemAvailable:") {
      available = value_kb * 1024;
      break;
    }
  }
  if (available < 0)
    return -1;

  /// Cgroup v2 limit ("max" when unlimited, which fails the numeric read)
  long long limit = read_long_from_file("/sys/fs/cgroup/memory.max");
  long long used = read_long_from_file("/sys/fs/cgroup/memory.current");

  /// Cgroup v1 fallback
  if (limit <= 0) {
    limit = read_long_from_file("/sys/fs/cgroup/memory/memory.limit_in_bytes");
    used = read_long_from_file("/sys/fs/cgroup/memory/memory.usage_in_bytes");
  }

  if (limit > 0 && used >= 0 && limit > used && limit - used < available) {
    available = limit - used;
  }
  return available;
}

// **---- Utilities ----**

std::string format_time(double seconds) {
  int h = static_cast<int>(seconds) / 3600;
  int m = (static_cast<int>(seconds) % 3600) / 60;
  int s = static_cast<int>(seconds) % 60;
  return fmt::format("{:02d}:{:02d}:{:02d}", h, m, s);
}

bool parse_clock(const std::string &text, double &seconds) {
  /// Exactly three colon-separated numeric fields
  std::stringstream ss(text);
  std::string field;
  std::vector<std::string> fields;
  while (std::getline(ss, field, ':')) {
    fields.push_back(field);
  }
  if (fields.size() != 3)
    return false;
  for (const auto &f : fields) {
    if (f.empty() || f.size() > 2 || !all_digits(f))
      return false;
  }

  int h = std::stoi(fields[0]);
  int m = std::stoi(fields[1]);
  int s = std::stoi(fields[2]);
  if (m > 59 || s > 59)
    return false;

  seconds = h * 3600.0 + m * 60.0 + s;
  return true;
}

std::string format_bytes(long long bytes) {
  const char *units[] = {"B", "KB", "MB", "GB", "TB"};
  double size = static_cast<double>(bytes);
  int unit = 0;
  while (size >= 1024.0 && unit < 4) {
    size /= 1024.0;
    ++unit;
  }
  return fmt::format("{:.1f} {}", size, units[unit]);
}

} // namespace multicam
