/**
 * @file angle_pipeline.hpp
 * @brief Per-angle processing state machine
 *
 * @details The AnglePipeline class drives one camera angle through:
 *
 *          1. Acquire a slot of the shared ConcurrencyGate
 *
 *          2. Skip everything if the destination object already exists
 *
 *          3. Extract the event window (stream copy)
 *
 *          4. Probe the segment resolution
 *
 *          5. Compress (>= 3840 wide or >= 2160 high) or pass through
 *
 *          6. Upload the final artifact
 *
 *          7. Remove transient files
 *
 * @note Log lines are prefixed with [job][angle]. Transient files are
 *       removed on every exit path.
 */

#ifndef MULTICAM_ANGLE_PIPELINE_HPP
#define MULTICAM_ANGLE_PIPELINE_HPP

#include <functional>
#include <string>

#include "concurrency_gate.hpp"
#include "media_tools.hpp"
#include "transfer_client.hpp"
#include "types.hpp"

namespace multicam {

/**
 * @brief Called on every state change with the stage name and, for the
 *        error stage, the failure message.
 */
using AngleObserver = std::function<void(
    const AngleTask &task, const std::string &stage, const std::string &error)>;

/**
 * @class AnglePipeline
 * @brief Runs one AngleTask to a terminal state.
 *
 * @attention STATE ORDER:
 *
 *   PENDING -> EXTRACTING -> CHECKING_RESOLUTION
 *           -> COMPRESSING | SKIPPING_COMPRESSION -> UPLOADING -> COMPLETE
 *
 *   ERROR is reachable from every non-terminal state.
 */
class AnglePipeline {
  AngleTask task_;
  ConcurrencyGate &gate_;
  MediaTools tools_;
  TransferClient &transfer_;
  bool use_accelerator_; //< Try the hardware backend first
  AngleObserver observer_;

  void transition(AngleStatus status, const char *stage);

  /// Mark the task failed, log and report
  Status fail(Status status);

  /**
   * @brief Hardware transcode with one software fallback.
   */
  Status compress();

public:
  AnglePipeline(AngleTask task, ConcurrencyGate &gate, MediaTools tools,
                TransferClient &transfer, bool use_accelerator,
                AngleObserver observer = nullptr);

  /**
   * @brief Run the pipeline.
   * @return Error of the stage that failed; task().status is Complete or
   *         Error afterwards
   */
  Status run();

  const AngleTask &task() const { return task_; }

  /**
   * @brief Build the task for one angle of a job.
   * @note Window bounds must already be validated clocks.
   */
  static AngleTask make_task(const Job &job, const std::string &angle_id,
                             const std::string &source_path,
                             const std::string &work_dir,
                             const std::string &key_root);
};

} // namespace multicam

#endif // MULTICAM_ANGLE_PIPELINE_HPP
