/**
 * @file resource_probe.cpp
 * @brief Resource measurement implementation
 */

#include "multicam/resource_probe.hpp"

#include <algorithm>
#include <cmath>

#include "multicam/config.hpp"
#include "multicam/logging.hpp"
#include "multicam/process.hpp"
#include "multicam/system.hpp"

namespace multicam {

int ResourceProbe::derive_ceiling(int cpu_count, double available_memory_gb,
                                  bool accelerator_present) {
  int mem_bound = static_cast<int>(
      std::floor(std::max(0.0, available_memory_gb) / MEMORY_PER_OPERATION_GB));
  int cpu_bound = std::max(1, cpu_count / 2);

  int candidate;
  if (accelerator_present) {
    /// Accelerator and host may share memory (embedded boards)
    candidate = std::min(mem_bound, ACCELERATOR_SESSION_CAP);
  } else {
    candidate = std::min(mem_bound, cpu_bound);
  }

  return std::max(MIN_CEILING, std::min(candidate, MAX_CEILING));
}

int ResourceProbe::cpu_count() {
  int cpus = detect_cpu_limit();
  return cpus > 0 ? cpus : FALLBACK_CPU_COUNT;
}

double ResourceProbe::available_memory_gb() {
  long long bytes = detect_available_memory_bytes();
  if (bytes < 0)
    return FALLBACK_MEMORY_GB;
  return static_cast<double>(bytes) / (1024.0 * 1024.0 * 1024.0);
}

bool ResourceProbe::accelerator_present() {
  auto timeout = std::chrono::seconds(Config::accelerator_probe_timeout_sec());
  ProcessResult r = run_process({Config::accelerator_probe_cmd()},
                                std::chrono::duration_cast<std::chrono::milliseconds>(timeout));
  if (r.timed_out) {
    LOG_WARN("Accelerator probe timed out after {}s, assuming none",
             timeout.count());
  }
  return r.ok();
}

ResourceSnapshot ResourceProbe::snapshot() {
  ResourceSnapshot snap;
  snap.cpu_count = cpu_count();
  snap.available_memory_gb = available_memory_gb();
  snap.accelerator_present = accelerator_present();
  snap.computed_ceiling = derive_ceiling(
      snap.cpu_count, snap.available_memory_gb, snap.accelerator_present);

  LOG_INFO("System resources: {} CPUs, {:.1f}GB RAM, accelerator: {}",
           snap.cpu_count, snap.available_memory_gb,
           snap.accelerator_present ? "yes" : "no");
  LOG_INFO("Concurrency ceiling: {}", snap.computed_ceiling);
  return snap;
}

int ResourceProbe::compute_ceiling() { return snapshot().computed_ceiling; }

} // namespace multicam
