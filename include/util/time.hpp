// Copyright (c) 2024 FoldChain
// Distributed under the MIT software license

#ifndef FOLDCHAIN_UTIL_TIME_HPP
#define FOLDCHAIN_UTIL_TIME_HPP

#include <cstdint>

namespace foldchain {
namespace util {

/**
 * Mockable time source
 *
 * Production code calls GetTime() instead of reading the system clock
 * directly. Tests call SetMockTime() (or use MockTimeScope) to control the
 * slot clock without waiting for real time to elapse.
 */

/**
 * Get current time as Unix timestamp (seconds since epoch)
 * Returns mock time if set, otherwise returns real system time
 */
int64_t GetTime();

/**
 * Set mock time for testing
 *
 * @param time Unix timestamp in seconds (0 to disable mocking)
 */
void SetMockTime(int64_t time);

/**
 * Get current mock time setting
 * Returns 0 if mock time is disabled (using real time)
 */
int64_t GetMockTime();

/**
 * RAII helper to set mock time and restore it when scope exits
 */
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time) : previous_time_(GetMockTime()) {
    SetMockTime(time);
  }

  ~MockTimeScope() { SetMockTime(previous_time_); }

  MockTimeScope(const MockTimeScope &) = delete;
  MockTimeScope &operator=(const MockTimeScope &) = delete;

private:
  int64_t previous_time_;
};

} // namespace util
} // namespace foldchain

#endif // FOLDCHAIN_UTIL_TIME_HPP
