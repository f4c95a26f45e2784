/**
 * @file logging.hpp
 * @brief Leveled console logging and per-stage timing collection
 *
 * @details Every LOG_* macro funnels into write_log(), which:
 *          - drops lines below the MULTICAM_LOG_LEVEL threshold
 *
 *          - prefixes a wall-clock timestamp, so interleaved output from
 *            parallel angles can be ordered
 *
 *          - prints the whole line under log_mutex and flushes it, keeping
 *            container logs current
 *
 *          TimingCollector gathers "<job>/<angle>/<stage>" durations from
 *          the TIMER_START / TIMER_END pair.
 */

#ifndef MULTICAM_LOGGING_HPP
#define MULTICAM_LOGGING_HPP

#include <chrono>
#include <cstdio>
#include <mutex>
#include <string>
#include <vector>

#include <fmt/color.h>
#include <fmt/core.h>

namespace multicam {

#ifndef ENABLE_LOGGING
#define ENABLE_LOGGING 1
#endif

#ifndef ENABLE_TIMING
#define ENABLE_TIMING 1
#endif

/// Serialises console output (defined in logging.cpp)
extern std::mutex log_mutex;

// **----- LOG LEVELS -----**

/// Phase and Success are informational lines with their own colour
enum class LogLevel { Info, Phase, Success, Warn, Error };

/**
 * @brief Threshold for "info", "warn" or "error" (case-insensitive).
 * @return Info for anything unrecognised
 */
LogLevel parse_log_level(const std::string &name);

/// True if a line at this level passes the MULTICAM_LOG_LEVEL threshold
bool log_enabled(LogLevel level);

/// Format, stamp and print one line. Safe from any thread.
void write_log(LogLevel level, fmt::string_view format, fmt::format_args args);

template <typename... Args>
void log_line(LogLevel level, fmt::string_view format, const Args &...args) {
  if (!log_enabled(level))
    return;
  write_log(level, format, fmt::make_format_args(args...));
}

// **----- LOGGING MACROS -----**

#if ENABLE_LOGGING
#define LOG_INFO(...)                                                          \
  multicam::log_line(multicam::LogLevel::Info, __VA_ARGS__)
#define LOG_WARN(...)                                                          \
  multicam::log_line(multicam::LogLevel::Warn, __VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  multicam::log_line(multicam::LogLevel::Error, __VA_ARGS__)
#define LOG_PHASE(...)                                                         \
  multicam::log_line(multicam::LogLevel::Phase, __VA_ARGS__)
#define LOG_SUCCESS(...)                                                       \
  multicam::log_line(multicam::LogLevel::Success, __VA_ARGS__)
#else
#define LOG_INFO(...) ((void)0)
#define LOG_WARN(...) ((void)0)
#define LOG_ERROR(...) ((void)0)
#define LOG_PHASE(...) ((void)0)
#define LOG_SUCCESS(...) ((void)0)
#endif

// **----- TIMING COLLECTION -----**

struct TimingEntry {
  std::string name;  //< "<job>/<angle>/<stage>"
  long microseconds; //< Duration in microseconds
};

/**
 * @class TimingCollector
 * @brief Process-wide store of stage durations, shared by every angle.
 */
class TimingCollector {
  static std::mutex timing_mutex;
  static std::vector<TimingEntry> entries;

public:
  static void record(const std::string &name, long us);

  /**
   * @brief Print run count, average and maximum per stage, with the
   *        job/angle that took longest. Called at the end of a batch.
   */
  static void print_summary();

  /// Copy of the collected entries
  static std::vector<TimingEntry> snapshot();

  /**
   * @brief Clear all collected timings.
   * @note Called at the start of each batch.
   */
  static void clear();
};

// **----- TIMING MACROS -----**

inline long elapsed_us(std::chrono::steady_clock::time_point start) {
  return static_cast<long>(
      std::chrono::duration_cast<std::chrono::microseconds>(
          std::chrono::steady_clock::now() - start)
          .count());
}

#if ENABLE_TIMING
#define TIMER_START(name)                                                      \
  const auto stage_clock_##name = std::chrono::steady_clock::now()

/// label: "<job>/<angle>/<stage>"
#define TIMER_END(name, label)                                                 \
  multicam::TimingCollector::record(label,                                     \
                                    multicam::elapsed_us(stage_clock_##name))
#else
#define TIMER_START(name) ((void)0)
#define TIMER_END(name, label) ((void)0)
#endif

} // namespace multicam

#endif // MULTICAM_LOGGING_HPP
