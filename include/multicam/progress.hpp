/**
 * @file progress.hpp
 * @brief Progress events and the outbound event queue
 *
 * @details Decouples the processing core from whatever presents progress:
 *
 *          - The coordinator and pipelines call ProgressSink::notify()
 *
 *          - ProgressQueue buffers events for a presentation thread that
 *            calls pop() in a loop
 *
 *          - notify() never blocks: when the queue is full the oldest event
 *            is dropped
 *
 *          - ProgressDispatcher puts a ProgressQueue and its own delivery
 *            thread in front of a sink that may be slow or may throw
 */

#ifndef MULTICAM_PROGRESS_HPP
#define MULTICAM_PROGRESS_HPP

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <thread>

#include "types.hpp"

namespace multicam {

/**
 * @struct ProgressEvent
 * @brief One structured progress notification.
 */
struct ProgressEvent {
  std::string job_id;   //< Empty for batch-level events
  std::string angle_id; //< Empty for job-level events
  std::string stage;    //< "extracting", "angle_completed", ...
  JobStatus status = JobStatus::Pending;
  std::map<std::string, AngleStatus> angle_status;
  Aggregate aggregate;
  std::string error;
};

/// Single-line rendering for logs
std::string to_string(const ProgressEvent &event);

/**
 * @class ProgressSink
 * @brief Consumer of progress events.
 * @note Implementations must return quickly. Callers treat delivery as
 *       best-effort and log any exception a sink throws.
 */
class ProgressSink {
public:
  virtual ~ProgressSink() = default;
  virtual void notify(const ProgressEvent &event) = 0;
};

/**
 * @class ProgressQueue
 * @brief Bounded, non-blocking outbound event channel.
 *
 * @attention USAGE:
 *
 *   - Producers call notify()
 *
 *   - One presentation thread calls pop() in a loop
 *
 *   - Call finish() when no more events will be produced
 */
class ProgressQueue : public ProgressSink {
public:
  explicit ProgressQueue(size_t capacity);

  void notify(const ProgressEvent &event) override;

  /**
   * @brief Pop an event (blocking).
   * @param event Output: the next event
   * @return false once finished and drained
   */
  bool pop(ProgressEvent &event);

  /**
   * @brief Signal that no more events will be pushed.
   */
  void finish();

  /**
   * @brief Most recent event, used to prime a late subscriber.
   * @return false if nothing has been published yet
   */
  bool latest(ProgressEvent &event) const;

  /// Events discarded because the queue was full
  size_t dropped() const { return dropped_.load(); }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
  }

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<ProgressEvent> events_;
  ProgressEvent latest_;
  bool has_latest_{false};
  size_t capacity_;
  std::atomic<size_t> dropped_{0};
  std::atomic<bool> done_{false};
};

/**
 * @class ProgressDispatcher
 * @brief Asynchronous, best-effort delivery to an external sink.
 *
 * @details Producers only enqueue. One delivery thread forwards events to
 *          the target in publish order. Anything the target throws is
 *          logged and the event counts as delivered.
 *
 * @note If the delivery thread cannot be started, events are delivered on
 *       the calling thread instead.
 */
class ProgressDispatcher : public ProgressSink {
public:
  /// @param target Receiver of the events (not owned, may be null)
  ProgressDispatcher(ProgressSink *target, size_t capacity);

  /// Delivers what is still queued, then stops the delivery thread
  ~ProgressDispatcher() override;

  ProgressDispatcher(const ProgressDispatcher &) = delete;
  ProgressDispatcher &operator=(const ProgressDispatcher &) = delete;

  void notify(const ProgressEvent &event) override;

  /// Block until every published event is delivered or dropped
  void flush();

  size_t dropped() const { return queue_.dropped(); }

private:
  void run();
  void deliver(const ProgressEvent &event);

  ProgressSink *target_;
  ProgressQueue queue_;

  std::mutex mutex_; //< Guards published_, delivered_
  std::condition_variable idle_cv_;
  uint64_t published_{0};
  uint64_t delivered_{0};

  std::thread worker_;
};

} // namespace multicam

#endif // MULTICAM_PROGRESS_HPP
