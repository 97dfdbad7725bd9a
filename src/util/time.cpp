// DOGEPROV - Time Utilities Implementation
// Copyright (c) 2024 DOGEPROV Developers
// MIT License

#include "dogeprov/util/time.h"

#include <atomic>

namespace dogeprov {
namespace util {

namespace {
    std::atomic<bool> g_mockTimeEnabled{false};
    std::atomic<int64_t> g_mockTime{0};
}

int64_t GetTime() {
    if (g_mockTimeEnabled.load()) {
        return g_mockTime.load();
    }
    return std::chrono::duration_cast<Seconds>(
        SystemClock::now().time_since_epoch()).count();
}

void SetMockTime(int64_t timestamp) {
    g_mockTime.store(timestamp);
    g_mockTimeEnabled.store(timestamp != 0);
}

void AdvanceMockTime(Seconds duration) {
    g_mockTime.fetch_add(duration.count());
}

void DisableMockTime() {
    g_mockTimeEnabled.store(false);
    g_mockTime.store(0);
}

bool IsMockTimeEnabled() {
    return g_mockTimeEnabled.load();
}

} // namespace util
} // namespace dogeprov
