/**
 * @file progress.cpp
 * @brief Progress event queue implementation
 */

#include "multicam/progress.hpp"

#include <algorithm>
#include <system_error>

#include <fmt/core.h>

#include "multicam/logging.hpp"

namespace multicam {

std::string to_string(const ProgressEvent &event) {
  std::string angles;
  for (const auto &a : event.angle_status) {
    if (!angles.empty())
      angles += ",";
    angles += fmt::format("{}={}", a.first, to_string(a.second));
  }

  std::string line = fmt::format(
      "{} {}{}{} status={} [{}] progress={}/{} failed={}",
      event.job_id.empty() ? "batch" : event.job_id,
      event.angle_id.empty() ? "" : event.angle_id,
      event.angle_id.empty() ? "" : " ", event.stage, to_string(event.status),
      angles, event.aggregate.completed + event.aggregate.failed,
      event.aggregate.total, event.aggregate.failed);
  if (!event.error.empty()) {
    line += fmt::format(" error=\"{}\"", event.error);
  }
  return line;
}

ProgressQueue::ProgressQueue(size_t capacity)
    : capacity_(std::max<size_t>(1, capacity)) {}

void ProgressQueue::notify(const ProgressEvent &event) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (done_.load())
      return;
    if (events_.size() >= capacity_) {
      events_.pop_front();
      ++dropped_;
    }
    events_.push_back(event);
    latest_ = event;
    has_latest_ = true;
  }
  cv_.notify_one();
}

bool ProgressQueue::pop(ProgressEvent &event) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait(lock, [this] { return !events_.empty() || done_.load(); });

  if (events_.empty()) {
    return false;
  }

  event = std::move(events_.front());
  events_.pop_front();
  return true;
}

void ProgressQueue::finish() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    done_.store(true);
  }
  cv_.notify_all();
}

bool ProgressQueue::latest(ProgressEvent &event) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!has_latest_)
    return false;
  event = latest_;
  return true;
}

// **---- Dispatcher ----**

ProgressDispatcher::ProgressDispatcher(ProgressSink *target, size_t capacity)
    : target_(target), queue_(capacity) {
  if (!target_)
    return;
  try {
    worker_ = std::thread(&ProgressDispatcher::run, this);
  } catch (const std::system_error &e) {
    LOG_WARN("Progress delivery thread unavailable ({}), delivering inline",
             e.what());
  }
}

ProgressDispatcher::~ProgressDispatcher() {
  queue_.finish();
  if (worker_.joinable())
    worker_.join();
}

void ProgressDispatcher::notify(const ProgressEvent &event) {
  if (!target_)
    return;

  if (!worker_.joinable()) {
    deliver(event);
    return;
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    ++published_;
  }
  queue_.notify(event);
}

void ProgressDispatcher::flush() {
  if (!worker_.joinable())
    return;
  std::unique_lock<std::mutex> lock(mutex_);
  /// A dropped event is always followed by a newer one whose delivery
  /// wakes us
  idle_cv_.wait(lock,
                [this] { return delivered_ + queue_.dropped() >= published_; });
}

void ProgressDispatcher::run() {
  ProgressEvent ev;
  while (queue_.pop(ev)) {
    deliver(ev);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++delivered_;
    }
    idle_cv_.notify_all();
  }
}

void ProgressDispatcher::deliver(const ProgressEvent &event) {
  try {
    target_->notify(event);
  } catch (const std::exception &e) {
    LOG_WARN("Progress sink failed on {}: {}", event.stage, e.what());
  } catch (...) {
    LOG_WARN("Progress sink failed on {}: unknown exception", event.stage);
  }
}

} // namespace multicam
