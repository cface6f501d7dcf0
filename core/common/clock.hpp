#pragma once

#include <chrono>
#include <functional>

namespace obix {

using TimePoint = std::chrono::steady_clock::time_point;

/// Injectable time source. Empty means steady_clock::now.
using Clock = std::function<TimePoint()>;

inline Clock steadyClock() {
    return [] { return std::chrono::steady_clock::now(); };
}

inline double elapsedMs(TimePoint from, TimePoint to) {
    return std::chrono::duration<double, std::milli>(to - from).count();
}

} // namespace obix
