#pragma once

#include "common/clock.hpp"
#include "common/config.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace obix {

enum class OptimizerPhase {
    IDLE,
    TRIGGERED,
    RUNNING
};

enum class TriggerReason {
    TIMER,
    TRANSITION_VOLUME,
    MEMORY_PRESSURE
};

std::string toString(OptimizerPhase phase);
std::string toString(TriggerReason reason);

struct TriggerDecision {
    TriggerReason reason = TriggerReason::TIMER;
    OptimizationLevel level = OptimizationLevel::STANDARD;
};

// ─── Optimization Policy ───────────────────────────────────────
// Decides when a pass should run and at which level, and keeps the
// Idle → Triggered → Running → Idle phase. At most one pass is in
// flight; a trigger arriving while one is pending or running is
// counted as deferred and dropped.

class OptimizationPolicy {
public:
    explicit OptimizationPolicy(const OptimizerConfig& config, Clock clock = {});

    /// Memory pressure wins over the other triggers and forces MAXIMUM.
    /// Nothing fires within half an interval of the previous pass.
    std::optional<TriggerDecision> evaluate(bool timer_fired, uint64_t transitions_since_pass,
                                            size_t state_count, size_t memory_estimate) const;

    /// Idle → Triggered. Returns false (and counts a deferral) otherwise.
    bool trigger(OptimizationLevel level);

    /// Triggered → Running. Returns the level the trigger asked for.
    std::optional<OptimizationLevel> begin();

    /// Idle or Triggered → Running, for an explicitly requested pass.
    bool beginManual();

    /// Running → Idle; starts the rate-limit window.
    void finish();

    OptimizerPhase phase() const { return phase_.load(); }
    uint64_t deferredTriggers() const { return deferred_.load(); }
    void resetDeferred() { deferred_ = 0; }

private:
    OptimizerConfig config_;
    Clock clock_;

    std::atomic<OptimizerPhase> phase_{OptimizerPhase::IDLE};
    std::atomic<uint64_t> deferred_{0};

    mutable std::mutex mutex_;   // guards transitions of phase_ and the fields below
    OptimizationLevel pending_level_ = OptimizationLevel::STANDARD;
    std::optional<TimePoint> last_pass_;
};

} // namespace obix
