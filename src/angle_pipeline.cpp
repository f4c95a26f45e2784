/**
 * @file angle_pipeline.cpp
 * @brief Per-angle state machine implementation
 */

#include "multicam/angle_pipeline.hpp"

#include <filesystem>
#include <system_error>
#include <vector>

#include <fmt/core.h>

#include "multicam/logging.hpp"
#include "multicam/system.hpp"

namespace multicam {

namespace fs = std::filesystem;

namespace {

/**
 * @brief Removes the listed files when the scope ends.
 * @note Best-effort: a failed removal is logged, never reported.
 */
class ArtifactGuard {
  std::vector<std::string> paths_;
  std::string prefix_;

public:
  ArtifactGuard(std::vector<std::string> paths, std::string prefix)
      : paths_(std::move(paths)), prefix_(std::move(prefix)) {}

  ~ArtifactGuard() {
    for (const auto &p : paths_) {
      std::error_code ec;
      if (fs::remove(p, ec)) {
        LOG_INFO("{} Removed {}", prefix_, p);
      } else if (ec) {
        LOG_WARN("{} Could not remove {}: {}", prefix_, p, ec.message());
      }
    }
  }

  ArtifactGuard(const ArtifactGuard &) = delete;
  ArtifactGuard &operator=(const ArtifactGuard &) = delete;
};

bool ensure_parent(const std::string &path, std::string &error) {
  std::error_code ec;
  fs::path parent = fs::path(path).parent_path();
  if (parent.empty())
    return true;
  fs::create_directories(parent, ec);
  if (ec) {
    error = fmt::format("Cannot create {}: {}", parent.string(), ec.message());
    return false;
  }
  return true;
}

} // anonymous namespace

// **---- Construction ----**

AnglePipeline::AnglePipeline(AngleTask task, ConcurrencyGate &gate,
                             MediaTools tools, TransferClient &transfer,
                             bool use_accelerator, AngleObserver observer)
    : task_(std::move(task)), gate_(gate), tools_(tools), transfer_(transfer),
      use_accelerator_(use_accelerator), observer_(std::move(observer)) {}

AngleTask AnglePipeline::make_task(const Job &job, const std::string &angle_id,
                                   const std::string &source_path,
                                   const std::string &work_dir,
                                   const std::string &key_root) {
  AngleTask t;
  t.job_id = job.id;
  t.angle_id = angle_id;
  t.source_path = source_path;

  std::string name = job.id + "_" + angle_id;
  t.segment_path =
      (fs::path(work_dir) / "segments" / (name + "_segment.mp4")).string();
  t.compressed_path =
      (fs::path(work_dir) / "compressed" / (name + ".mp4")).string();
  t.destination_key = key_root + "/" + job.key_prefix + "/" + name + ".mp4";

  parse_clock(job.descriptor.window_start, t.window_start);
  parse_clock(job.descriptor.window_end, t.window_end);
  return t;
}

// **---- State helpers ----**

void AnglePipeline::transition(AngleStatus status, const char *stage) {
  task_.status = status;
  if (observer_)
    observer_(task_, stage, "");
}

Status AnglePipeline::fail(Status status) {
  task_.status = AngleStatus::Error;
  LOG_ERROR("[{}][{}] {}: {}", task_.job_id, task_.angle_id,
            to_string(status.kind), status.message);
  if (observer_)
    observer_(task_, "angle_error", status.message);
  return status;
}

// **---- Main Processing ----**

Status AnglePipeline::run() {
  const std::string prefix =
      fmt::format("[{}][{}]", task_.job_id, task_.angle_id);
  const std::string label = task_.job_id + "/" + task_.angle_id;

  ConcurrencyGate::Slot slot(gate_);
  TIMER_START(total);

  if (observer_)
    observer_(task_, "angle_started", "");

  // **----- IDEMPOTENT SHORT-CIRCUIT -----**

  if (transfer_.head_exists(task_.destination_key)) {
    LOG_INFO("{} Already uploaded: {}", prefix, task_.destination_key);
    transition(AngleStatus::Complete, "angle_completed");
    return Status::success();
  }

  /// Everything below may leave files behind
  ArtifactGuard cleanup({task_.segment_path, task_.compressed_path}, prefix);

  // **----- EXTRACT -----**

  transition(AngleStatus::Extracting, "extracting");
  LOG_PHASE("{} Extracting {} - {}", prefix, format_time(task_.window_start),
            format_time(task_.window_end));

  std::string dir_error;
  if (!ensure_parent(task_.segment_path, dir_error) ||
      !ensure_parent(task_.compressed_path, dir_error)) {
    return fail(Status::error(ErrorKind::ToolInvocation, dir_error));
  }

  {
    TIMER_START(extract);
    Status s = tools_.extractor->extract(task_.source_path, task_.window_start,
                                         task_.window_end, task_.segment_path);
    TIMER_END(extract, label + "/extract");
    if (!s.ok())
      return fail(s);
  }

  // **----- RESOLUTION CHECK -----**

  transition(AngleStatus::CheckingResolution, "checking_resolution");

  Resolution res;
  {
    TIMER_START(probe);
    Status s = tools_.prober->probe(task_.segment_path, res);
    TIMER_END(probe, label + "/probe");
    if (!s.ok())
      return fail(s);
  }
  LOG_INFO("{} Resolution {}x{}", prefix, res.width, res.height);

  std::string final_path = task_.segment_path;

  if (needs_compression(res)) {
    transition(AngleStatus::Compressing, "compressing");
    TIMER_START(compress);
    Status s = compress();
    TIMER_END(compress, label + "/compress");
    if (!s.ok())
      return fail(s);
    final_path = task_.compressed_path;
  } else {
    transition(AngleStatus::SkippingCompression, "skipping_compression");
    LOG_INFO("{} Below 4K, uploading segment as-is", prefix);
  }

  // **----- UPLOAD -----**

  transition(AngleStatus::Uploading, "uploading");
  {
    TIMER_START(upload);
    Status s = transfer_.upload(final_path, task_.destination_key);
    TIMER_END(upload, label + "/upload");
    if (!s.ok())
      return fail(s);
  }

  TIMER_END(total, label + "/total");
  transition(AngleStatus::Complete, "angle_completed");
  LOG_SUCCESS("{} Uploaded {}", prefix, task_.destination_key);
  return Status::success();
}

Status AnglePipeline::compress() {
  const std::string prefix =
      fmt::format("[{}][{}]", task_.job_id, task_.angle_id);
  const Resolution target{TARGET_WIDTH, TARGET_HEIGHT};

  Status s;
  if (use_accelerator_) {
    LOG_PHASE("{} Compressing (hardware)", prefix);
    s = tools_.transcoder->transcode(task_.segment_path, task_.compressed_path,
                                     target, TranscodeBackend::Hardware);
    if (!s.ok()) {
      LOG_WARN("{} Hardware transcode failed, falling back to software: {}",
               prefix, s.message);
      std::error_code ec;
      fs::remove(task_.compressed_path, ec);
    }
  }

  if (!use_accelerator_ || !s.ok()) {
    LOG_PHASE("{} Compressing (software)", prefix);
    s = tools_.transcoder->transcode(task_.segment_path, task_.compressed_path,
                                     target, TranscodeBackend::Software);
    if (!s.ok())
      return s;
  }

  /// The segment is superseded; reclaim the space before uploading
  std::error_code ec;
  if (!fs::remove(task_.segment_path, ec) && ec) {
    LOG_WARN("{} Could not remove {}: {}", prefix, task_.segment_path,
             ec.message());
  }
  return Status::success();
}

} // namespace multicam
