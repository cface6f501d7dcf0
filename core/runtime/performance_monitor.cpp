#include "runtime/performance_monitor.hpp"

#include <algorithm>
#include <cstddef>

namespace obix {

PerformanceMonitor::PerformanceMonitor(std::chrono::milliseconds interval, Clock clock)
    : interval_(interval), clock_(std::move(clock)) {
    if (!clock_) clock_ = steadyClock();
    started_ = clock_();
}

void PerformanceMonitor::recordTransition(double latency_us) {
    std::lock_guard<std::mutex> lock(mutex_);
    total_latency_us_ += latency_us;
    total_transitions_++;
    window_latency_us_ += latency_us;
    window_transitions_++;
}

bool PerformanceMonitor::due() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!last_sample_) return true;
    return clock_() - *last_sample_ >= interval_;
}

void PerformanceMonitor::record(PerformanceSample sample) {
    std::lock_guard<std::mutex> lock(mutex_);
    TimePoint now = clock_();
    last_sample_ = now;

    sample.timestamp_ms = elapsedMs(started_, now);
    sample.avg_transition_us = window_transitions_ > 0
        ? window_latency_us_ / static_cast<double>(window_transitions_)
        : 0.0;
    window_latency_us_ = 0.0;
    window_transitions_ = 0;

    samples_.push_back(sample);
    if (samples_.size() > kMaxSamples) {
        samples_.erase(samples_.begin(),
                       samples_.end() - static_cast<std::ptrdiff_t>(kRetainedSamples));
    }
}

std::vector<PerformanceSample> PerformanceMonitor::samples() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return samples_;
}

size_t PerformanceMonitor::sampleCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return samples_.size();
}

PerformanceSummary PerformanceMonitor::summary() const {
    std::lock_guard<std::mutex> lock(mutex_);
    PerformanceSummary result;
    result.sample_count = samples_.size();
    result.avg_transition_us = total_transitions_ > 0
        ? total_latency_us_ / static_cast<double>(total_transitions_)
        : 0.0;

    double hit_ratio_sum = 0.0;
    for (const auto& s : samples_) {
        hit_ratio_sum += s.cache_hit_ratio;
        result.peak_memory_estimate = std::max(result.peak_memory_estimate, s.memory_estimate);
    }
    if (!samples_.empty()) {
        result.avg_cache_hit_ratio = hit_ratio_sum / static_cast<double>(samples_.size());
    }
    return result;
}

void PerformanceMonitor::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    samples_.clear();
    last_sample_.reset();
    total_latency_us_ = 0.0;
    total_transitions_ = 0;
    window_latency_us_ = 0.0;
    window_transitions_ = 0;
}

} // namespace obix
