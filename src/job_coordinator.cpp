/**
 * @file job_coordinator.cpp
 * @brief Batch execution implementation
 *
 * @details Implements the JobCoordinator:
 *
 *          - Pre-flight validation and the single-batch guard
 *
 *          - Ceiling resolution and gate sizing
 *
 *          - Bounded worker pool over all angles, with continue-on-error
 *
 *          - Summary output
 */

#include "multicam/job_coordinator.hpp"

#include <algorithm>
#include <chrono>
#include <system_error>
#include <thread>

#include <fmt/color.h>
#include <fmt/core.h>

#include "multicam/logging.hpp"
#include "multicam/manifest.hpp"

namespace multicam {

namespace {

/// Clears the busy flag on every exit path of process_batch()
class ActiveGuard {
  std::atomic<bool> &flag_;

public:
  explicit ActiveGuard(std::atomic<bool> &flag) : flag_(flag) {}
  ~ActiveGuard() { flag_.store(false); }

  ActiveGuard(const ActiveGuard &) = delete;
  ActiveGuard &operator=(const ActiveGuard &) = delete;
};

} // anonymous namespace

JobCoordinator::JobCoordinator(TransferClient &transfer, MediaTools tools,
                               ResourceProbe &probe, ProgressSink *sink,
                               std::string work_dir, std::string key_root)
    : transfer_(transfer), tools_(tools), probe_(probe),
      work_dir_(std::move(work_dir)), key_root_(std::move(key_root)),
      progress_(sink, static_cast<size_t>(
                          std::max(1, Config::progress_queue_capacity()))) {}

// **---- Batch ----**

Status JobCoordinator::process_batch(
    const std::vector<JobDescriptor> &descriptors, int ceiling_override) {
  bool expected = false;
  if (!active_.compare_exchange_strong(expected, true)) {
    LOG_WARN("Batch rejected: processing already active");
    return Status::error(ErrorKind::Validation, "Processing already active");
  }
  ActiveGuard guard(active_);

  // **----- PRE-FLIGHT -----**

  StorageConfig storage = transfer_.config();
  Status s = storage.validate();
  if (!s.ok()) {
    LOG_ERROR("Batch rejected: {}", s.message);
    return s;
  }
  s = validate_batch(descriptors);
  if (!s.ok()) {
    LOG_ERROR("Batch rejected: {}", s.message);
    return s;
  }

  // **----- CEILING -----**

  ResourceSnapshot snap = probe_.snapshot();
  int ceiling = ceiling_override > 0
                    ? std::clamp(ceiling_override, MIN_CEILING, MAX_CEILING)
                    : snap.computed_ceiling;

  std::vector<WorkItem> items;
  {
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    jobs_.clear();
    angles_left_.clear();
    angles_failed_.clear();
    for (const auto &d : descriptors) {
      jobs_.emplace_back(d);
      angles_left_.push_back(static_cast<int>(d.angles.size()));
      angles_failed_.push_back(0);
    }
    for (size_t i = 0; i < jobs_.size(); ++i) {
      for (const auto &angle : jobs_[i].descriptor.angles) {
        items.push_back({i, AnglePipeline::make_task(jobs_[i], angle.first,
                                                     angle.second, work_dir_,
                                                     key_root_)});
      }
    }
    resources_ = snap;
    ceiling_ = ceiling;
    use_accelerator_ = storage.accelerator_enabled && snap.accelerator_present;
  }
  completed_.store(0);
  failed_.store(0);

  /// No slot is held here: the busy flag keeps other batches out
  gate_.resize(ceiling);
  gate_.reset_peak();
  TimingCollector::clear();

  LOG_PHASE("================== BATCH PROCESSING ==================");
  LOG_INFO("Jobs to process: {}", descriptors.size());
  LOG_INFO("CPUs: {}  Memory: {:.1f}GB  Accelerator: {}", snap.cpu_count,
           snap.available_memory_gb, snap.accelerator_present ? "yes" : "no");
  LOG_INFO("Concurrency ceiling: {}{}", ceiling,
           ceiling_override > 0 ? " (override)" : "");
  LOG_INFO("Hardware transcode: {}", use_accelerator_ ? "enabled" : "disabled");
  LOG_PHASE("=======================================================");

  {
    ProgressEvent ev;
    ev.stage = "batch_started";
    ev.status = JobStatus::Processing;
    ev.aggregate = aggregate();
    emit(ev);
  }

  auto batch_start = std::chrono::steady_clock::now();

  // **----- WORKER POOL -----**

  /// More workers than gate slots would only wait on the gate
  size_t pool_size = std::min(items.size(), static_cast<size_t>(ceiling));
  std::atomic<size_t> next{0};
  std::vector<std::thread> workers;
  workers.reserve(pool_size);

  for (size_t i = 0; i < pool_size; ++i) {
    try {
      workers.emplace_back(&JobCoordinator::drain, this, std::cref(items),
                           std::ref(next));
    } catch (const std::system_error &e) {
      LOG_WARN("Started {} of {} workers: {}", workers.size(), pool_size,
               e.what());
      break;
    }
  }

  /// Short of workers: the calling thread takes the missing place
  if (workers.size() < pool_size) {
    drain(items, next);
  }
  for (auto &w : workers) {
    w.join();
  }

  double elapsed_sec = std::chrono::duration<double>(
                           std::chrono::steady_clock::now() - batch_start)
                           .count();

  print_batch_summary(elapsed_sec);
  TimingCollector::print_summary();

  {
    ProgressEvent ev;
    ev.stage = "batch_completed";
    ev.status = failed_.load() > 0 ? JobStatus::Error : JobStatus::Completed;
    ev.aggregate = aggregate();
    emit(ev);
  }
  return Status::success();
}

// **---- Job ----**

void JobCoordinator::drain(const std::vector<WorkItem> &items,
                           std::atomic<size_t> &next) {
  for (size_t i = next++; i < items.size(); i = next++) {
    run_angle(items[i]);
  }
}

void JobCoordinator::run_angle(const WorkItem &item) {
  const size_t index = item.job;
  const AngleTask &task = item.task;

  ProgressEvent started;
  bool first = false;
  size_t angles = 0;
  {
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    Job &job = jobs_[index];
    if (job.status == JobStatus::Pending) {
      job.status = JobStatus::Processing;
      started = make_event(index, "started");
      first = true;
      angles = job.descriptor.angles.size();
    }
  }
  if (first) {
    emit(started);
    LOG_PHASE("[{}] Starting ({} angles)", task.job_id, angles);
  }

  AnglePipeline pipeline(
      task, gate_, tools_, transfer_, use_accelerator_,
      [this, index](const AngleTask &t, const std::string &stage,
                    const std::string &error) {
        on_angle(index, t, stage, error);
      });

  bool failed = false;
  std::string unexpected;
  try {
    failed = !pipeline.run().ok();
  } catch (const std::exception &e) {
    unexpected = e.what();
  } catch (...) {
    unexpected = "unknown exception";
  }

  if (!unexpected.empty()) {
    LOG_ERROR("[{}][{}] Unexpected failure: {}", task.job_id, task.angle_id,
              unexpected);
    AngleTask errored = pipeline.task();
    errored.status = AngleStatus::Error;
    on_angle(index, errored, "angle_error", unexpected);
    failed = true;
  }

  bool last = false;
  {
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    if (failed)
      ++angles_failed_[index];
    last = --angles_left_[index] == 0;
  }
  if (last)
    settle_job(index);
}

void JobCoordinator::settle_job(size_t index) {
  ProgressEvent settled;
  std::string id;
  size_t angles = 0;
  int failures = 0;
  {
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    Job &j = jobs_[index];
    failures = angles_failed_[index];
    if (failures > 0) {
      j.status = JobStatus::Error;
      j.error_message = fmt::format("{} angles failed", failures);
      ++failed_;
    } else {
      j.status = JobStatus::Completed;
      ++completed_;
    }
    settled = make_event(index, failures > 0 ? "error" : "completed");
    id = j.id;
    angles = j.descriptor.angles.size();
  }
  emit(settled);

  if (failures > 0) {
    LOG_ERROR("[{}] Failed: {} of {} angles failed", id, failures, angles);
  } else {
    LOG_SUCCESS("[{}] Completed", id);
  }
}

void JobCoordinator::on_angle(size_t index, const AngleTask &task,
                              const std::string &stage,
                              const std::string &error) {
  ProgressEvent ev;
  {
    std::lock_guard<std::mutex> lock(jobs_mutex_);
    jobs_[index].angle_status[task.angle_id] = task.status;
    ev = make_event(index, stage);
  }
  ev.angle_id = task.angle_id;
  ev.error = error;
  emit(ev);
}

// **---- Status ----**

ProgressEvent JobCoordinator::make_event(size_t index,
                                         const std::string &stage) const {
  /// Caller holds jobs_mutex_
  const Job &job = jobs_[index];
  ProgressEvent ev;
  ev.job_id = job.id;
  ev.stage = stage;
  ev.status = job.status;
  ev.angle_status = job.angle_status;
  ev.aggregate = aggregate();
  ev.error = job.error_message;
  return ev;
}

Aggregate JobCoordinator::aggregate() const {
  Aggregate a;
  a.total = static_cast<int>(jobs_.size());
  a.completed = completed_.load();
  a.failed = failed_.load();
  return a;
}

void JobCoordinator::emit(const ProgressEvent &event) {
  progress_.notify(event);
}

BatchStatus JobCoordinator::status() const {
  std::lock_guard<std::mutex> lock(jobs_mutex_);
  BatchStatus st;
  st.processing_active = active_.load();
  st.total_jobs = static_cast<int>(jobs_.size());
  st.ceiling = ceiling_;
  for (const auto &job : jobs_) {
    switch (job.status) {
    case JobStatus::Pending:
      ++st.pending;
      break;
    case JobStatus::Processing:
      ++st.in_progress;
      break;
    case JobStatus::Completed:
      ++st.completed;
      break;
    case JobStatus::Error:
      ++st.error;
      break;
    }
  }
  return st;
}

std::vector<Job> JobCoordinator::job_snapshots() const {
  std::lock_guard<std::mutex> lock(jobs_mutex_);
  return jobs_;
}

ResourceSnapshot JobCoordinator::resources() const {
  std::lock_guard<std::mutex> lock(jobs_mutex_);
  return resources_;
}

void JobCoordinator::print_batch_summary(double wall_clock_sec) const {
  std::vector<Job> jobs = job_snapshots();
  BatchStatus st = status();

  std::lock_guard<std::mutex> lock(log_mutex);
  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "============== BATCH PROCESSING SUMMARY ==============\n");
  fmt::print("{:<25} {:>25}\n", "Total jobs:", st.total_jobs);
  fmt::print("{:<25} {:>25}\n", "Completed:", st.completed);
  fmt::print("{:<25} {:>25}\n", "Failed:", st.error);
  fmt::print("{:<25} {:>25}\n", "Concurrency ceiling:", st.ceiling);
  fmt::print("{:<25} {:>25}\n", "Peak in flight:", gate_.peak());
  fmt::print("{:<25} {:>22.1f}s\n", "Wall-clock time:", wall_clock_sec);
  fmt::print(fg(fmt::color::cyan),
             "======================================================\n");
  std::fflush(stdout);

  if (st.error > 0) {
    fmt::print(fg(fmt::color::red), "\nFailed jobs:\n");
    for (const auto &job : jobs) {
      if (job.status != JobStatus::Error)
        continue;
      fmt::print(fg(fmt::color::red), "  - {}: {}\n", job.id,
                 job.error_message);
      for (const auto &angle : job.angle_status) {
        if (angle.second == AngleStatus::Error) {
          fmt::print(fg(fmt::color::red), "      {}\n", angle.first);
        }
      }
    }
    std::fflush(stdout);
  }
}

int batch_exit_code(const BatchStatus &status) {
  return std::min(status.error, 255);
}

} // namespace multicam
