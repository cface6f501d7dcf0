#include "runtime/optimization_policy.hpp"

namespace obix {

std::string toString(OptimizerPhase phase) {
    switch (phase) {
        case OptimizerPhase::IDLE: return "idle";
        case OptimizerPhase::TRIGGERED: return "triggered";
        case OptimizerPhase::RUNNING: return "running";
    }
    return "idle";
}

std::string toString(TriggerReason reason) {
    switch (reason) {
        case TriggerReason::TIMER: return "timer";
        case TriggerReason::TRANSITION_VOLUME: return "transition_volume";
        case TriggerReason::MEMORY_PRESSURE: return "memory_pressure";
    }
    return "timer";
}

OptimizationPolicy::OptimizationPolicy(const OptimizerConfig& config, Clock clock)
    : config_(config), clock_(std::move(clock)) {
    if (!clock_) clock_ = steadyClock();
}

std::optional<TriggerDecision> OptimizationPolicy::evaluate(bool timer_fired,
                                                            uint64_t transitions_since_pass,
                                                            size_t state_count,
                                                            size_t memory_estimate) const {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (last_pass_ && clock_() - *last_pass_ < config_.interval / 2) {
            return std::nullopt;
        }
    }

    if (config_.max_memory_usage > 0 &&
        static_cast<double>(memory_estimate) >
            config_.compaction_threshold * static_cast<double>(config_.max_memory_usage)) {
        return TriggerDecision{TriggerReason::MEMORY_PRESSURE, OptimizationLevel::MAXIMUM};
    }
    if (transitions_since_pass > 2 * static_cast<uint64_t>(state_count)) {
        return TriggerDecision{TriggerReason::TRANSITION_VOLUME, config_.level};
    }
    if (timer_fired) {
        return TriggerDecision{TriggerReason::TIMER, config_.level};
    }
    return std::nullopt;
}

bool OptimizationPolicy::trigger(OptimizationLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (phase_ != OptimizerPhase::IDLE) {
        deferred_++;
        return false;
    }
    pending_level_ = level;
    phase_ = OptimizerPhase::TRIGGERED;
    return true;
}

std::optional<OptimizationLevel> OptimizationPolicy::begin() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (phase_ != OptimizerPhase::TRIGGERED) return std::nullopt;
    phase_ = OptimizerPhase::RUNNING;
    return pending_level_;
}

bool OptimizationPolicy::beginManual() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (phase_ == OptimizerPhase::RUNNING) return false;
    phase_ = OptimizerPhase::RUNNING;
    return true;
}

void OptimizationPolicy::finish() {
    std::lock_guard<std::mutex> lock(mutex_);
    last_pass_ = clock_();
    phase_ = OptimizerPhase::IDLE;
}

} // namespace obix
