// DOGEPROV - Time Utilities
// Copyright (c) 2024 DOGEPROV Developers
// MIT License
//
// Wall-clock access with a process-wide mock clock, so approval deadlines
// can be driven deterministically from tests.

#ifndef DOGEPROV_UTIL_TIME_H
#define DOGEPROV_UTIL_TIME_H

#include <chrono>
#include <cstdint>

namespace dogeprov {
namespace util {

using Seconds = std::chrono::seconds;
using SystemClock = std::chrono::system_clock;
using SystemTimePoint = std::chrono::system_clock::time_point;

/// Current Unix timestamp in seconds (mock time when set)
int64_t GetTime();

// ============================================================================
// Mock Time (for testing)
// ============================================================================

/// Pin the clock to a Unix timestamp; 0 returns to the system clock
void SetMockTime(int64_t timestamp);

/// Move a pinned clock forward
void AdvanceMockTime(Seconds duration);

void DisableMockTime();

bool IsMockTimeEnabled();

} // namespace util
} // namespace dogeprov

#endif // DOGEPROV_UTIL_TIME_H
