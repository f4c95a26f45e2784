// Unit tests for ConcurrencyGate

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>

#include "multicam/concurrency_gate.hpp"

namespace multicam {
namespace {

TEST(ConcurrencyGateTest, NeverExceedsCapacity) {
  ConcurrencyGate gate(3);
  std::atomic<int> inside{0};
  std::atomic<int> worst{0};

  std::vector<std::thread> threads;
  for (int i = 0; i < 12; ++i) {
    threads.emplace_back([&] {
      ConcurrencyGate::Slot slot(gate);
      int now = ++inside;
      int prev = worst.load();
      while (now > prev && !worst.compare_exchange_weak(prev, now)) {
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
      --inside;
    });
  }
  for (auto &t : threads) t.join();

  EXPECT_LE(worst.load(), 3);
  EXPECT_LE(gate.peak(), 3);
  EXPECT_GE(gate.peak(), 1);
  EXPECT_EQ(gate.in_flight(), 0);
}

TEST(ConcurrencyGateTest, CapacityClampedToOne) {
  ConcurrencyGate gate(0);
  EXPECT_EQ(gate.limit(), 1);

  gate.resize(-3);
  EXPECT_EQ(gate.limit(), 1);

  gate.resize(4);
  EXPECT_EQ(gate.limit(), 4);
}

TEST(ConcurrencyGateTest, ResizeWakesWaiters) {
  ConcurrencyGate gate(1);
  gate.acquire();

  std::atomic<bool> entered{false};
  std::thread waiter([&] {
    ConcurrencyGate::Slot slot(gate);
    entered = true;
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_FALSE(entered.load());

  gate.resize(2);
  waiter.join();
  EXPECT_TRUE(entered.load());

  gate.release();
  EXPECT_EQ(gate.in_flight(), 0);
}

TEST(ConcurrencyGateTest, SlotReleasedWhenBodyThrows) {
  ConcurrencyGate gate(1);
  try {
    ConcurrencyGate::Slot slot(gate);
    throw std::runtime_error("stage failed");
  } catch (const std::runtime_error &) {
  }
  EXPECT_EQ(gate.in_flight(), 0);

  ConcurrencyGate::Slot again(gate);
  EXPECT_EQ(gate.in_flight(), 1);
}

TEST(ConcurrencyGateTest, ResetPeakKeepsCurrentLoad) {
  ConcurrencyGate gate(2);
  gate.acquire();
  gate.acquire();
  gate.release();
  EXPECT_EQ(gate.peak(), 2);

  gate.reset_peak();
  EXPECT_EQ(gate.peak(), 1);
  gate.release();
}

}  // namespace
}  // namespace multicam
