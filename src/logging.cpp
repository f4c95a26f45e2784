/**
 * @file logging.cpp
 * @brief Logging and timing utilities implementation
 *
 * @details Provides the leveled line writer and the TimingCollector,
 *          whose summary groups per-angle stage timings by stage.
 */

#include "multicam/logging.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <map>

#include <fmt/color.h>
#include <fmt/core.h>

#include "multicam/config.hpp"

namespace multicam {

std::mutex log_mutex;

namespace {

int rank(LogLevel level) {
  switch (level) {
  case LogLevel::Warn:
    return 1;
  case LogLevel::Error:
    return 2;
  default:
    return 0;
  }
}

std::string clock_stamp() {
  std::time_t now = std::time(nullptr);
  std::tm local{};
  localtime_r(&now, &local);
  return fmt::format("{:02}:{:02}:{:02}", local.tm_hour, local.tm_min,
                     local.tm_sec);
}

} // anonymous namespace

// **----- LINE WRITER -----**

LogLevel parse_log_level(const std::string &name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  if (lower == "warn" || lower == "warning")
    return LogLevel::Warn;
  if (lower == "error")
    return LogLevel::Error;
  return LogLevel::Info;
}

bool log_enabled(LogLevel level) {
  static const int threshold = rank(parse_log_level(Config::log_level()));
  return rank(level) >= threshold;
}

void write_log(LogLevel level, fmt::string_view format,
               fmt::format_args args) {
  std::string message = fmt::vformat(format, args);
  std::string stamp = clock_stamp();

  std::lock_guard<std::mutex> lock(log_mutex);
  switch (level) {
  case LogLevel::Info:
    fmt::print("{} [INFO] {}\n", stamp, message);
    break;
  case LogLevel::Warn:
    fmt::print(fg(fmt::color::yellow), "{} [WARN] {}\n", stamp, message);
    break;
  case LogLevel::Error:
    fmt::print(fg(fmt::color::red), "{} [ERROR] {}\n", stamp, message);
    break;
  case LogLevel::Phase:
    fmt::print(fg(fmt::color::cyan), "{} {}\n", stamp, message);
    break;
  case LogLevel::Success:
    fmt::print(fg(fmt::color::green), "{} {}\n", stamp, message);
    break;
  }
  std::fflush(stdout);
}

// **----- TIMING COLLECTOR -----**

std::mutex TimingCollector::timing_mutex;
std::vector<TimingEntry> TimingCollector::entries;

void TimingCollector::record(const std::string &name, long us) {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.push_back({name, us});
}

void TimingCollector::print_summary() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  if (entries.empty())
    return;

  /// Labels are "<job>/<angle>/<stage>"; totals are grouped by stage
  struct StageTotal {
    int count = 0;
    long total_us = 0;
    long max_us = 0;
    std::string slowest;
  };
  std::map<std::string, StageTotal> stages;
  for (const auto &e : entries) {
    auto slash = e.name.rfind('/');
    std::string stage =
        slash == std::string::npos ? e.name : e.name.substr(slash + 1);
    StageTotal &t = stages[stage];
    ++t.count;
    t.total_us += e.microseconds;
    if (e.microseconds >= t.max_us) {
      t.max_us = e.microseconds;
      t.slowest = e.name.substr(0, slash == std::string::npos ? 0 : slash);
    }
  }

  std::lock_guard<std::mutex> out_lock(log_mutex);
  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "=================== STAGE TIMINGS ===================\n");
  fmt::print("{:<10} {:>6} {:>10} {:>10}  {}\n", "Stage", "Runs", "Avg (s)",
             "Max (s)", "Slowest");
  fmt::print("{:-<10} {:-<6} {:-<10} {:-<10}  {:-<20}\n", "", "", "", "", "");

  for (const auto &s : stages) {
    const StageTotal &t = s.second;
    fmt::print("{:<10} {:>6} {:>10.2f} {:>10.2f}  {}\n", s.first, t.count,
               t.total_us / 1e6 / t.count, t.max_us / 1e6, t.slowest);
  }
  fmt::print(fg(fmt::color::cyan),
             "=====================================================\n");
  std::fflush(stdout);
}

std::vector<TimingEntry> TimingCollector::snapshot() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  return entries;
}

void TimingCollector::clear() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.clear();
}

} // namespace multicam
