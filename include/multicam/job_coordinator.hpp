/**
 * @file job_coordinator.hpp
 * @brief Parallel batch execution under a shared concurrency ceiling
 *
 * @details The JobCoordinator class fans a batch out:
 *
 *          - Every angle of every job becomes one work item; a pool of at
 *            most `ceiling` workers pulls items from a shared index
 *
 *          - Each angle still takes a ConcurrencyGate slot before heavy
 *            work, so a gate shared with other callers keeps its meaning
 *
 *          - Progress goes through a ProgressDispatcher; a slow sink never
 *            holds up a worker
 *
 *          - The gate capacity comes from ResourceProbe unless overridden
 *
 *          - A failed angle marks its job as failed but never stops sibling
 *            angles or other jobs
 *
 * @note One gate per coordinator. Construct one coordinator per process so
 *       the ceiling is shared by everything that process runs.
 */

#ifndef MULTICAM_JOB_COORDINATOR_HPP
#define MULTICAM_JOB_COORDINATOR_HPP

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

#include "angle_pipeline.hpp"
#include "concurrency_gate.hpp"
#include "media_tools.hpp"
#include "progress.hpp"
#include "resource_probe.hpp"
#include "transfer_client.hpp"
#include "types.hpp"

namespace multicam {

/**
 * @class JobCoordinator
 * @brief Runs batches of jobs and exposes their status.
 *
 * @attention LIFECYCLE:
 *
 *   1. process_batch() validates credentials and descriptors; nothing runs
 *      if either is invalid
 *
 *   2. The ceiling is resolved and the gate resized
 *
 *   3. Jobs run to completion; counts accumulate as each job finishes
 *
 *   4. The summary is printed and stays queryable through status()
 */
class JobCoordinator {
public:
  /**
   * @param sink Optional progress consumer (not owned)
   * @param work_dir Root of the transient artifact tree
   * @param key_root First component of every destination key
   */
  JobCoordinator(TransferClient &transfer, MediaTools tools,
                 ResourceProbe &probe, ProgressSink *sink = nullptr,
                 std::string work_dir = Config::work_dir(),
                 std::string key_root = Config::key_root());

  JobCoordinator(const JobCoordinator &) = delete;
  JobCoordinator &operator=(const JobCoordinator &) = delete;

  /**
   * @brief Process every job and wait for all of them.
   *
   * @param ceiling_override 0 = ask ResourceProbe; other values are clamped
   *        to [1, 4]
   * @return Validation error if the batch could not start. Per-job failures
   *         are reported through status() and job_snapshots(), not here.
   */
  Status process_batch(const std::vector<JobDescriptor> &descriptors,
                       int ceiling_override = 0);

  /// Counts for the current or last batch
  BatchStatus status() const;

  /// Copies of every job in the current or last batch
  std::vector<Job> job_snapshots() const;

  /// Resources measured at the start of the last batch
  ResourceSnapshot resources() const;

  /// Wait until the sink has seen every event published so far
  void flush_progress() { progress_.flush(); }

  size_t progress_dropped() const { return progress_.dropped(); }

  const ConcurrencyGate &gate() const { return gate_; }

private:
  /// One angle of one job
  struct WorkItem {
    size_t job;
    AngleTask task;
  };

  TransferClient &transfer_;
  MediaTools tools_;
  ResourceProbe &probe_;
  std::string work_dir_;
  std::string key_root_;

  ConcurrencyGate gate_{MIN_CEILING};
  std::atomic<bool> active_{false};

  mutable std::mutex jobs_mutex_; //< Guards jobs_, the per-job counters,
                                  //< resources_, ceiling_
  std::vector<Job> jobs_;
  std::vector<int> angles_left_;
  std::vector<int> angles_failed_;
  ResourceSnapshot resources_;
  int ceiling_{0};
  bool use_accelerator_{false};

  std::atomic<int> completed_{0};
  std::atomic<int> failed_{0};

  /**
   * @brief Run work items until none are left. Body of every pool worker.
   */
  void drain(const std::vector<WorkItem> &items, std::atomic<size_t> &next);

  /// Run one angle; marks its job started first and settles it when the
  /// job's last angle is done. Never throws.
  void run_angle(const WorkItem &item);

  /// Final status of job index once every angle has finished
  void settle_job(size_t index);

  /// Record an angle state change and relay it to the sink
  void on_angle(size_t index, const AngleTask &task, const std::string &stage,
                const std::string &error);

  /// Event for job index with the current angle map and counts
  ProgressEvent make_event(size_t index, const std::string &stage) const;

  Aggregate aggregate() const;

  /// Hand the event to the dispatcher; never blocks
  void emit(const ProgressEvent &event);

  void print_batch_summary(double wall_clock_sec) const;

  /// Declared last: stops delivering before anything else is torn down
  ProgressDispatcher progress_;
};

/**
 * @brief Process exit status for a finished batch.
 * @return Number of failed jobs, capped at 255 so a failing batch can
 *         never wrap around to 0
 */
int batch_exit_code(const BatchStatus &status);

} // namespace multicam

#endif // MULTICAM_JOB_COORDINATOR_HPP
