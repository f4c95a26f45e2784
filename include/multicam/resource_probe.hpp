/**
 * @file resource_probe.hpp
 * @brief Resource measurement and concurrency ceiling calculation
 *
 * @details ResourceProbe measures CPU count, available memory and accelerator
 *          presence, and derives how many heavy stages (extract, compress,
 *          upload) may run at once:
 *
 *          - memBound = floor(availableMemGB / 2)   (~2GB per operation)
 *
 *          - cpuBound = max(1, cpuCount / 2)
 *
 *          - accelerator present: min(memBound, 2)  (shared host memory)
 *
 *          - otherwise:           min(memBound, cpuBound)
 *
 *          - clamped to [1, 4]
 *
 * @note Never fails. Each measurement has a fallback (2 CPUs, 4GB, no
 *       accelerator) so a valid ceiling is always produced.
 */

#ifndef MULTICAM_RESOURCE_PROBE_HPP
#define MULTICAM_RESOURCE_PROBE_HPP

#include "types.hpp"

namespace multicam {

constexpr int FALLBACK_CPU_COUNT = 2;
constexpr double FALLBACK_MEMORY_GB = 4.0;
constexpr double MEMORY_PER_OPERATION_GB = 2.0;
constexpr int ACCELERATOR_SESSION_CAP = 2;

/**
 * @class ResourceProbe
 * @brief Host resource measurement.
 *
 * @note The three measurement hooks are virtual so tests (and callers on
 *       unusual hosts) can substitute fixed values.
 */
class ResourceProbe {
public:
  virtual ~ResourceProbe() = default;

  /**
   * @brief Measure everything and compute the ceiling.
   */
  ResourceSnapshot snapshot();

  /// Shorthand for snapshot().computed_ceiling
  int compute_ceiling();

  /**
   * @brief Pure ceiling derivation from measured values.
   * @return Value in [MIN_CEILING, MAX_CEILING]
   */
  static int derive_ceiling(int cpu_count, double available_memory_gb,
                            bool accelerator_present);

protected:
  /// Cgroup-aware CPU count, FALLBACK_CPU_COUNT on failure
  virtual int cpu_count();

  /// Available memory in GB, FALLBACK_MEMORY_GB on failure
  virtual double available_memory_gb();

  /**
   * @brief Run the accelerator check command with a short timeout.
   * @return false on non-zero exit, timeout or missing command
   */
  virtual bool accelerator_present();
};

} // namespace multicam

#endif // MULTICAM_RESOURCE_PROBE_HPP
