#ifndef SYNCTIMER_TEST_MACROS_HPP
#define SYNCTIMER_TEST_MACROS_HPP

#include <chrono>
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

// =============================================================================
// Test Counters
// =============================================================================

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name)                                                             \
  std::cout << "Testing " << name << "... ";                                   \
  try

#define PASS()                                                                 \
  std::cout << "PASSED" << std::endl;                                          \
  ++tests_passed

#define FAIL(msg)                                                              \
  std::cout << "FAILED: " << msg << std::endl;                                 \
  ++tests_failed

// Unlike assert, stays active in release builds
#define EXPECT(cond)                                                           \
  do {                                                                         \
    if (!(cond))                                                               \
      throw std::runtime_error(std::string(__FILE__) + ":" +                   \
                               std::to_string(__LINE__) + ": " #cond);         \
  } while (0)

// Poll `pred` until it holds or `timeout` elapses
inline bool wait_until(const std::function<bool()> &pred,
                       std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred())
      return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  return pred();
}

inline int report_results() {
  std::cout << "=== Results ===" << std::endl;
  std::cout << "Passed: " << tests_passed << std::endl;
  std::cout << "Failed: " << tests_failed << std::endl;
  return tests_failed > 0 ? 1 : 0;
}

#endif // SYNCTIMER_TEST_MACROS_HPP
