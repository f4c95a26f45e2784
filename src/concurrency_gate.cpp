/**
 * @file concurrency_gate.cpp
 * @brief Counting gate implementation
 */

#include "multicam/concurrency_gate.hpp"

#include <algorithm>

#include "multicam/types.hpp"

namespace multicam {

ConcurrencyGate::ConcurrencyGate(int capacity)
    : capacity(std::max(MIN_CEILING, capacity)) {}

void ConcurrencyGate::acquire() {
  std::unique_lock<std::mutex> lock(mutex);
  cv.wait(lock, [this] { return in_flight_ < capacity; });
  ++in_flight_;
  peak_ = std::max(peak_, in_flight_);
}

void ConcurrencyGate::release() {
  {
    std::lock_guard<std::mutex> lock(mutex);
    --in_flight_;
  }
  cv.notify_one();
}

void ConcurrencyGate::resize(int new_capacity) {
  {
    std::lock_guard<std::mutex> lock(mutex);
    capacity = std::max(MIN_CEILING, new_capacity);
  }
  cv.notify_all();
}

int ConcurrencyGate::limit() const {
  std::lock_guard<std::mutex> lock(mutex);
  return capacity;
}

int ConcurrencyGate::in_flight() const {
  std::lock_guard<std::mutex> lock(mutex);
  return in_flight_;
}

int ConcurrencyGate::peak() const {
  std::lock_guard<std::mutex> lock(mutex);
  return peak_;
}

void ConcurrencyGate::reset_peak() {
  std::lock_guard<std::mutex> lock(mutex);
  peak_ = in_flight_;
}

} // namespace multicam
