#pragma once

#include "automaton/machine.hpp"
#include "cache/transition_cache.hpp"
#include "common/clock.hpp"
#include "common/config.hpp"
#include "runtime/compiled_dispatch.hpp"
#include "runtime/optimization_policy.hpp"
#include "runtime/performance_monitor.hpp"
#include "runtime/periodic_task.hpp"

#include <nlohmann/json_fwd.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

namespace obix {

/// Outcome of one optimization pass.
struct PassResult {
    OptimizationLevel level = OptimizationLevel::STANDARD;
    size_t states_before = 0;
    size_t states_after = 0;
    double reduction_percentage = 0.0;
    double duration_ms = 0.0;
    int64_t memory_delta = 0;        // bytes, negative when the pass freed memory
    size_t compiled_transitions = 0;
    size_t dropped_cache_entries = 0;
    bool dispatch_cleared = false;
};

struct OptimizationStats {
    uint64_t transitions_processed = 0;
    uint64_t minimizations_performed = 0;
    uint64_t states_removed = 0;
    uint64_t failed_optimizations = 0;
    uint64_t deferred_triggers = 0;
    uint64_t compiled_dispatches = 0;
    uint64_t stale_dispatches = 0;
    uint64_t cache_hits = 0;
    uint64_t cache_misses = 0;
    uint64_t cache_evictions = 0;
    std::optional<PassResult> last_result;
};

// ─── Optimized Machine ─────────────────────────────────────────
// Runtime context around one Machine. Owns the transition cache, the
// compiled dispatch table, the optimization policy and the background
// timer; there is no process-wide state.
//
// transition() resolves a label through, in order:
//   compiled dispatch → transition cache → the machine itself
//
// Passes minimize a private copy of the machine, validate it, and swap
// it in under a brief exclusive lock. Transitions hold a shared lock,
// so each one sees either the old machine or the new one. The cursor,
// the cache and the dispatch table are remapped during the swap.

class OptimizedMachine {
public:
    explicit OptimizedMachine(Machine machine, OptimizerConfig config = {}, Clock clock = {});
    ~OptimizedMachine();

    OptimizedMachine(const OptimizedMachine&) = delete;
    OptimizedMachine& operator=(const OptimizedMachine&) = delete;

    /// Starts the background timer when background optimization is on.
    void start();
    void stop();

    /// Follow `label` from the cursor. Returns a copy of the new state.
    /// Throws NoCurrentStateError or UndefinedTransitionError.
    State transition(const std::string& label);

    /// Reset, then run every label in order.
    State processSequence(const std::vector<std::string>& labels);

    void reset();
    StateId currentState() const { return cursor_.load(); }

    /// Install a new machine. Cache and dispatch are cleared.
    void replaceMachine(Machine machine);

    /// Immutable view of the machine currently in place.
    std::shared_ptr<const Machine> snapshot() const;

    /// Run a pass now at the configured level, or at `level`.
    /// Returns nullopt if another pass is in flight or the pass failed.
    std::optional<PassResult> runOptimizationPass();
    std::optional<PassResult> runOptimizationPass(OptimizationLevel level);

    /// Evaluate the triggers as a timer tick would.
    void tick();

    /// One-shot minimization without a runtime context.
    static std::pair<Machine, double> minimize(const Machine& machine);

    CacheStats getCacheStats() const { return cache_.getStats(); }
    OptimizationStats getOptimizationStats() const;
    void resetStats();

    /// Rough footprint in bytes: fixed overhead plus per state,
    /// transition, cache entry, compiled entry and sample costs.
    size_t estimateMemoryUsage() const;

    /// Machine record plus "optimization" and "performance" sections.
    nlohmann::json exportToJson() const;

    const OptimizerConfig& config() const { return config_; }
    OptimizerPhase phase() const { return policy_.phase(); }
    const AdaptiveTransitionCache& cache() const { return cache_; }
    const CompiledDispatchTable& compiledDispatch() const { return dispatch_; }

    /// Mutable table, for pre-seeding routes. An entry whose target is
    /// not a member is disabled on first use and the lookup falls back.
    CompiledDispatchTable& compiledDispatch() { return dispatch_; }
    const PerformanceMonitor& performance() const { return monitor_; }

    static constexpr size_t kBaseMemory = 1000;
    static constexpr size_t kStateMemory = 200;
    static constexpr size_t kTransitionMemory = 100;
    static constexpr size_t kCacheEntryMemory = 150;
    static constexpr size_t kCompiledEntryMemory = 300;
    static constexpr size_t kSampleMemory = 100;

private:
    OptimizerConfig config_;
    Clock clock_;

    mutable std::shared_mutex machine_mutex_;
    std::shared_ptr<const Machine> machine_;
    std::atomic<StateId> cursor_{kNoState};
    std::atomic<size_t> state_count_{0};
    std::atomic<size_t> transition_count_{0};

    AdaptiveTransitionCache cache_;
    CompiledDispatchTable dispatch_;
    OptimizationPolicy policy_;
    PerformanceMonitor monitor_;
    std::unique_ptr<PeriodicTask> task_;

    std::atomic<uint64_t> transitions_processed_{0};
    std::atomic<uint64_t> transitions_since_pass_{0};
    std::atomic<uint64_t> minimizations_performed_{0};
    std::atomic<uint64_t> states_removed_{0};
    std::atomic<uint64_t> failed_optimizations_{0};
    std::atomic<uint64_t> compiled_dispatches_{0};
    std::atomic<uint64_t> stale_dispatches_{0};

    mutable std::mutex result_mutex_;
    std::optional<PassResult> last_result_;

    StateId resolve(const Machine& machine, StateId current, const std::string& label);
    void afterTransition(double latency_us);
    void maybeTrigger();
    void runTriggeredPass();
    std::optional<PassResult> executePass(OptimizationLevel level);
    size_t compileHottest(const Machine& machine);
    void installMachine(std::shared_ptr<const Machine> machine, bool clear_derived);
};

} // namespace obix
