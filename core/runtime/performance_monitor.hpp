#pragma once

#include "common/clock.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

namespace obix {

struct PerformanceSample {
    double timestamp_ms = 0.0;          // since monitor start
    double avg_transition_us = 0.0;     // over the window since the previous sample
    double cache_hit_ratio = 0.0;
    size_t memory_estimate = 0;
    size_t state_count = 0;
    size_t transition_count = 0;
};

struct PerformanceSummary {
    size_t sample_count = 0;
    double avg_transition_us = 0.0;     // over every recorded transition
    double avg_cache_hit_ratio = 0.0;
    size_t peak_memory_estimate = 0;
};

// ─── Performance Monitor ───────────────────────────────────────
// Rolling transition latency plus a bounded series of snapshots, at
// most one per sampling interval. Past kMaxSamples the series is cut
// back to the newest kRetainedSamples.

class PerformanceMonitor {
public:
    static constexpr size_t kMaxSamples = 1000;
    static constexpr size_t kRetainedSamples = 500;

    explicit PerformanceMonitor(std::chrono::milliseconds interval, Clock clock = {});

    void recordTransition(double latency_us);

    /// True once the sampling interval has passed since the last sample.
    bool due() const;

    /// Stamps and stores a sample; the latency field is filled from
    /// the transitions recorded since the previous sample.
    void record(PerformanceSample sample);

    std::vector<PerformanceSample> samples() const;
    size_t sampleCount() const;
    PerformanceSummary summary() const;
    void clear();

private:
    std::chrono::milliseconds interval_;
    Clock clock_;
    TimePoint started_;

    mutable std::mutex mutex_;
    std::vector<PerformanceSample> samples_;
    std::optional<TimePoint> last_sample_;

    double total_latency_us_ = 0.0;
    uint64_t total_transitions_ = 0;
    double window_latency_us_ = 0.0;
    uint64_t window_transitions_ = 0;
};

} // namespace obix
