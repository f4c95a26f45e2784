/**
 * @file concurrency_gate.hpp
 * @brief Counting gate bounding concurrently executing heavy stages
 *
 * @details Provides:
 *          - ConcurrencyGate: counting semaphore built on a mutex and
 *            condition variable
 *
 *          - ConcurrencyGate::Slot: scoped acquisition, released on every
 *            exit path
 */

#ifndef MULTICAM_CONCURRENCY_GATE_HPP
#define MULTICAM_CONCURRENCY_GATE_HPP

#include <condition_variable>
#include <mutex>

namespace multicam {

/**
 * @class ConcurrencyGate
 * @brief Global limit on in-flight heavy work.
 *
 * @attention DESIGN:
 *
 * - One gate is shared by every job and angle of a coordinator
 *
 * - Angle tasks are created freely; each blocks in acquire() before doing
 *   any extraction, compression or transfer
 *
 * - peak() records the highest in-flight count ever observed
 */
class ConcurrencyGate {
  mutable std::mutex mutex;
  std::condition_variable cv;
  int capacity;
  int in_flight_{0};
  int peak_{0};

public:
  explicit ConcurrencyGate(int capacity);

  ConcurrencyGate(const ConcurrencyGate &) = delete;
  ConcurrencyGate &operator=(const ConcurrencyGate &) = delete;

  /**
   * @brief Block until a slot is free, then take it.
   */
  void acquire();

  /**
   * @brief Return a slot and wake one waiter.
   */
  void release();

  /**
   * @brief Change the capacity.
   * @note Only meaningful while no slot is held; waiters are re-checked.
   */
  void resize(int new_capacity);

  int limit() const;
  int in_flight() const;
  int peak() const;
  void reset_peak();

  /**
   * @class Slot
   * @brief RAII holder for one gate slot.
   */
  class Slot {
    ConcurrencyGate *gate_;

  public:
    explicit Slot(ConcurrencyGate &gate) : gate_(&gate) { gate_->acquire(); }
    ~Slot() {
      if (gate_)
        gate_->release();
    }

    Slot(const Slot &) = delete;
    Slot &operator=(const Slot &) = delete;
  };
};

} // namespace multicam

#endif // MULTICAM_CONCURRENCY_GATE_HPP
