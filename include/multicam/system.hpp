/**
 * @file system.hpp
 * @brief System utilities: CPU and memory detection, time helpers
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for containers
 *
 *          - Cgroup-aware available memory detection
 *
 *          - Clock string parsing and formatting
 *
 * @note For containers, CPU and memory discovery respect cgroup limits set by
 *       docker-compose or docker run --cpus / --memory flags.
 */

#ifndef MULTICAM_SYSTEM_HPP
#define MULTICAM_SYSTEM_HPP

#include <string>
#include <vector>

namespace multicam {

// **---- CPU Detection ----**

/**
 * @brief Detect the actual number of CPUs available to this process.
 *
 * @note In containers, std::thread::hardware_concurrency() returns the
 *       HOST's total cores, not the container's cgroup limit. This function
 *       reads cgroup files to detect the actual limit.
 *
 *       Supports:
 *
 *        - Cgroup v2: `/sys/fs/cgroup/cpu.max`
 *
 *        - Cgroup v1: `/sys/fs/cgroup/cpu/cpu.cfs_quota_us` and
 *          `cpu.cfs_period_us`
 *
 *        - Cpuset: `/sys/fs/cgroup/cpuset.cpus.effective` (counts allowed cores)
 *
 * @return Detected CPU limit, or -1 if every source failed
 */
int detect_cpu_limit();

// **---- Memory Detection ----**

/**
 * @brief Detect memory available for new work, in bytes.
 *
 * @note Uses MemAvailable from /proc/meminfo, lowered to the remaining
 *       cgroup headroom (memory.max - memory.current) when a limit is set.
 *
 * @return Available bytes, or -1 if /proc/meminfo could not be read
 */
long long detect_available_memory_bytes();

/// Parse a cpuset list such as "0-3,8,10-11"
std::vector<int> parse_cpuset_string(const std::string &line);

// **---- Utilities ----**

/**
 * @brief Format seconds as HH:MM:SS string.
 */
std::string format_time(double seconds);

/**
 * @brief Parse "HH:MM:SS" into seconds.
 * @param text Clock string; hours may exceed 23
 * @param seconds Output
 * @return false when the text is not a valid clock
 */
bool parse_clock(const std::string &text, double &seconds);

/// Human readable size ("12.3 MB")
std::string format_bytes(long long bytes);

} // namespace multicam

#endif // MULTICAM_SYSTEM_HPP
