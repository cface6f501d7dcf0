#include "runtime/optimized_machine.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"
#include "minimizer/machine_minimizer.hpp"
#include "serialization/machine_json.hpp"
#include "verification/verification.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <exception>

namespace obix {

using logging::OBIX;

OptimizedMachine::OptimizedMachine(Machine machine, OptimizerConfig config, Clock clock)
    : config_(std::move(config)),
      clock_(clock ? std::move(clock) : steadyClock()),
      cache_(config_.cache, clock_),
      dispatch_(config_.compile_limit),
      policy_(config_, clock_),
      monitor_(config_.sample_interval, clock_) {
    installMachine(std::make_shared<const Machine>(std::move(machine)), false);
}

OptimizedMachine::~OptimizedMachine() {
    stop();
}

void OptimizedMachine::start() {
    if (!config_.runtime_optimization || !config_.background_optimization) return;
    if (!task_) {
        task_ = std::make_unique<PeriodicTask>(config_.interval, [this] { tick(); });
    }
    task_->start();
    OBIX.debug("background optimization started, interval ", config_.interval.count(), "ms\n");
}

void OptimizedMachine::stop() {
    if (task_) task_->stop();
}

// ─── Transitions ───────────────────────────────────────────────

State OptimizedMachine::transition(const std::string& label) {
    auto started = std::chrono::steady_clock::now();
    State result;
    {
        std::shared_lock<std::shared_mutex> lock(machine_mutex_);
        const Machine& machine = *machine_;
        StateId current = cursor_.load();
        if (current == kNoState || !machine.hasState(current)) {
            throw NoCurrentStateError();
        }
        StateId next = resolve(machine, current, label);
        cursor_.store(next);
        result = *machine.getState(next);
    }
    auto latency = std::chrono::duration<double, std::micro>(
        std::chrono::steady_clock::now() - started);
    afterTransition(latency.count());
    return result;
}

State OptimizedMachine::processSequence(const std::vector<std::string>& labels) {
    reset();
    if (labels.empty()) {
        std::shared_lock<std::shared_mutex> lock(machine_mutex_);
        const State* state = machine_->getState(cursor_.load());
        if (!state) throw NoCurrentStateError();
        return *state;
    }
    State last;
    for (const auto& label : labels) {
        last = transition(label);
    }
    return last;
}

void OptimizedMachine::reset() {
    std::shared_lock<std::shared_mutex> lock(machine_mutex_);
    cursor_.store(machine_->initialState());
}

StateId OptimizedMachine::resolve(const Machine& machine, StateId current,
                                  const std::string& label) {
    try {
        if (auto compiled = dispatch_.dispatch(machine, current, label)) {
            compiled_dispatches_++;
            return *compiled;
        }
    } catch (const CompiledDispatchStaleError& e) {
        stale_dispatches_++;
        dispatch_.disable(current, label);
        OBIX.warn(e.what(), ", falling back\n");
    }

    if (config_.cache_enabled) {
        auto resolver = [&machine](StateId state, const std::string& l) {
            return machine.target(state, l);
        };
        if (auto cached = cache_.get(current, label, resolver)) {
            if (machine.hasState(*cached)) {
                if (config_.runtime_optimization && config_.level >= OptimizationLevel::AGGRESSIVE) {
                    dispatch_.compile(current, label, *cached);
                }
                return *cached;
            }
            cache_.erase(current, label);
        }
    }

    auto target = machine.target(current, label);
    if (!target) {
        throw UndefinedTransitionError(label, machine.getState(current)->name);
    }
    if (config_.cache_enabled) {
        cache_.set(current, label, *target);
    }
    return *target;
}

void OptimizedMachine::afterTransition(double latency_us) {
    transitions_processed_++;
    transitions_since_pass_++;

    if (config_.performance_monitoring) {
        monitor_.recordTransition(latency_us);
        if (monitor_.due()) {
            PerformanceSample sample;
            sample.cache_hit_ratio = cache_.getStats().hit_ratio;
            sample.memory_estimate = estimateMemoryUsage();
            sample.state_count = state_count_.load();
            sample.transition_count = transition_count_.load();
            monitor_.record(sample);
        }
    }

    if (config_.runtime_optimization) {
        maybeTrigger();
    }
}

// ─── Optimization ──────────────────────────────────────────────

void OptimizedMachine::maybeTrigger() {
    auto decision = policy_.evaluate(false, transitions_since_pass_.load(), state_count_.load(),
                                     estimateMemoryUsage());
    if (!decision) return;
    if (!policy_.trigger(decision->level)) {
        OBIX.trace("trigger deferred (", toString(decision->reason), ")\n");
        return;
    }
    OBIX.debug("optimization triggered by ", toString(decision->reason),
               " at level ", toString(decision->level), "\n");

    if (task_ && task_->running()) {
        task_->wake();
    } else {
        runTriggeredPass();
    }
}

void OptimizedMachine::tick() {
    if (policy_.phase() == OptimizerPhase::TRIGGERED) {
        runTriggeredPass();
        return;
    }
    auto decision = policy_.evaluate(true, transitions_since_pass_.load(), state_count_.load(),
                                     estimateMemoryUsage());
    if (!decision) return;
    if (policy_.trigger(decision->level)) {
        OBIX.debug("optimization triggered by ", toString(decision->reason),
                   " at level ", toString(decision->level), "\n");
        runTriggeredPass();
    }
}

void OptimizedMachine::runTriggeredPass() {
    auto level = policy_.begin();
    if (!level) return;
    executePass(*level);
}

std::optional<PassResult> OptimizedMachine::runOptimizationPass() {
    return runOptimizationPass(config_.level);
}

std::optional<PassResult> OptimizedMachine::runOptimizationPass(OptimizationLevel level) {
    if (!policy_.beginManual()) {
        policy_.trigger(level);  // counts the deferral
        return std::nullopt;
    }
    return executePass(level);
}

std::optional<PassResult> OptimizedMachine::executePass(OptimizationLevel level) {
    struct FinishGuard {
        OptimizationPolicy& policy;
        ~FinishGuard() { policy.finish(); }
    } guard{policy_};

    auto started = std::chrono::steady_clock::now();
    size_t memory_before = estimateMemoryUsage();
    std::shared_ptr<const Machine> base;
    StateId cursor = kNoState;
    {
        std::shared_lock<std::shared_mutex> lock(machine_mutex_);
        base = machine_;
        cursor = cursor_.load();
    }

    OBIX.info("optimization pass started: level ", toString(level), ", ",
              base->stateCount(), " states\n");

    try {
        // Any later cursor is reachable from this one or from the initial
        // state, so rooting the pass at both keeps every state still in play
        Machine source = *base;
        source.setCurrentState(base->hasState(cursor) ? cursor : kNoState);

        MachineMinimizer minimizer;
        MinimizationResult minimized = level == OptimizationLevel::MINIMAL
            ? minimizer.removeUnreachable(source)
            : minimizer.minimize(source);

        for (const auto& check : MachineChecker().check(minimized.machine)) {
            if (!check.passed) {
                throw OptimizationError("Minimized machine failed " + check.check_name +
                                        ": " + check.message);
            }
        }

        auto next = std::make_shared<const Machine>(std::move(minimized.machine));

        PassResult result;
        result.level = level;
        result.states_before = base->stateCount();
        result.states_after = next->stateCount();
        result.reduction_percentage = minimized.metrics.reduction_percentage;

        {
            std::unique_lock<std::shared_mutex> lock(machine_mutex_);
            if (machine_ != base) {
                throw OptimizationError("Machine was replaced during the pass");
            }
            machine_ = next;

            auto mapped = minimized.state_mapping.find(cursor_.load());
            cursor_.store(mapped != minimized.state_mapping.end()
                              ? mapped->second
                              : next->initialState());
            state_count_ = next->stateCount();
            transition_count_ = next->countTransitions();

            if (config_.cache_enabled) {
                cache_.remapStates(minimized.state_mapping);
            }
            dispatch_.remap(minimized.state_mapping);
            dispatch_.prune(*next);
            if (level >= OptimizationLevel::AGGRESSIVE) {
                result.compiled_transitions = compileHottest(*next);
            }
            transitions_since_pass_ = 0;
        }

        if (level == OptimizationLevel::MAXIMUM) {
            result.dropped_cache_entries = cache_.dropTier(CacheTier::COLD) +
                                           cache_.dropSecondary();
            if (config_.max_memory_usage > 0 && estimateMemoryUsage() > config_.max_memory_usage) {
                dispatch_.clear();
                result.dispatch_cleared = true;
            }
            OBIX.info("compaction dropped ", result.dropped_cache_entries, " cold cache entries",
                      result.dispatch_cleared ? ", cleared compiled dispatch" : "", "\n");
        }

        result.duration_ms = std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - started).count();
        result.memory_delta = static_cast<int64_t>(estimateMemoryUsage()) -
                              static_cast<int64_t>(memory_before);

        minimizations_performed_++;
        states_removed_ += result.states_before - result.states_after;
        {
            std::lock_guard<std::mutex> lock(result_mutex_);
            last_result_ = result;
        }

        OBIX.info("optimization pass finished: ", result.states_before, " -> ",
                  result.states_after, " states in ", result.duration_ms, "ms\n");
        return result;
    } catch (const std::exception& e) {
        failed_optimizations_++;
        OBIX.warn("optimization pass aborted, keeping previous machine: ", e.what(), "\n");
        return std::nullopt;
    }
}

size_t OptimizedMachine::compileHottest(const Machine& machine) {
    if (!config_.cache_enabled) return 0;
    size_t compiled = 0;
    for (const auto& [key, target] : cache_.hottest(config_.compile_limit)) {
        if (machine.target(key.state, key.label) != target) continue;
        if (dispatch_.compile(key.state, key.label, target)) compiled++;
    }
    return compiled;
}

std::pair<Machine, double> OptimizedMachine::minimize(const Machine& machine) {
    MinimizationResult result = MachineMinimizer().minimize(machine);
    return {std::move(result.machine), result.reduction_ratio};
}

// ─── Machine management ────────────────────────────────────────

void OptimizedMachine::replaceMachine(Machine machine) {
    installMachine(std::make_shared<const Machine>(std::move(machine)), true);
}

void OptimizedMachine::installMachine(std::shared_ptr<const Machine> machine,
                                      bool clear_derived) {
    std::unique_lock<std::shared_mutex> lock(machine_mutex_);
    // Entries of the old machine must not outlive the swap
    if (clear_derived) {
        cache_.clear();
        dispatch_.clear();
    }
    cursor_.store(machine->hasCurrentState() ? machine->currentState() : machine->initialState());
    state_count_ = machine->stateCount();
    transition_count_ = machine->countTransitions();
    transitions_since_pass_ = 0;
    machine_ = std::move(machine);
}

std::shared_ptr<const Machine> OptimizedMachine::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(machine_mutex_);
    return machine_;
}

// ─── Stats ─────────────────────────────────────────────────────

OptimizationStats OptimizedMachine::getOptimizationStats() const {
    OptimizationStats stats;
    stats.transitions_processed = transitions_processed_.load();
    stats.minimizations_performed = minimizations_performed_.load();
    stats.states_removed = states_removed_.load();
    stats.failed_optimizations = failed_optimizations_.load();
    stats.deferred_triggers = policy_.deferredTriggers();
    stats.compiled_dispatches = compiled_dispatches_.load();
    stats.stale_dispatches = stale_dispatches_.load();

    CacheStats cache = cache_.getStats();
    stats.cache_hits = cache.hits;
    stats.cache_misses = cache.misses;
    stats.cache_evictions = cache.evictions;

    std::lock_guard<std::mutex> lock(result_mutex_);
    stats.last_result = last_result_;
    return stats;
}

void OptimizedMachine::resetStats() {
    transitions_processed_ = 0;
    minimizations_performed_ = 0;
    states_removed_ = 0;
    failed_optimizations_ = 0;
    compiled_dispatches_ = 0;
    stale_dispatches_ = 0;
    policy_.resetDeferred();
    cache_.resetStats();
    monitor_.clear();

    std::lock_guard<std::mutex> lock(result_mutex_);
    last_result_.reset();
}

size_t OptimizedMachine::estimateMemoryUsage() const {
    return kBaseMemory
        + kStateMemory * state_count_.load()
        + kTransitionMemory * transition_count_.load()
        + kCacheEntryMemory * (cache_.size() + cache_.secondarySize())
        + kCompiledEntryMemory * dispatch_.size()
        + kSampleMemory * monitor_.sampleCount();
}

nlohmann::json OptimizedMachine::exportToJson() const {
    nlohmann::json j;
    {
        std::shared_lock<std::shared_mutex> lock(machine_mutex_);
        j = machineToJson(*machine_);
        j["current"] = cursor_.load();
    }

    OptimizationStats stats = getOptimizationStats();
    nlohmann::json optimization = {
        {"level", toString(config_.level)},
        {"phase", toString(policy_.phase())},
        {"transitionsProcessed", stats.transitions_processed},
        {"minimizationsPerformed", stats.minimizations_performed},
        {"statesRemoved", stats.states_removed},
        {"failedOptimizations", stats.failed_optimizations},
        {"deferredTriggers", stats.deferred_triggers},
        {"compiledDispatches", stats.compiled_dispatches},
        {"cacheHits", stats.cache_hits},
        {"cacheMisses", stats.cache_misses},
        {"cacheEvictions", stats.cache_evictions},
        {"compiledTransitions", dispatch_.size()},
    };
    if (stats.last_result) {
        const PassResult& r = *stats.last_result;
        optimization["lastResult"] = {
            {"level", toString(r.level)},
            {"statesBefore", r.states_before},
            {"statesAfter", r.states_after},
            {"stateReductionPct", r.reduction_percentage},
            {"durationMs", r.duration_ms},
            {"memoryDelta", r.memory_delta},
        };
    } else {
        optimization["lastResult"] = nullptr;
    }
    j["optimization"] = std::move(optimization);

    PerformanceSummary perf = monitor_.summary();
    j["performance"] = {
        {"sampleCount", perf.sample_count},
        {"avgTransitionUs", perf.avg_transition_us},
        {"avgCacheHitRatio", perf.avg_cache_hit_ratio},
        {"peakMemoryEstimate", perf.peak_memory_estimate},
        {"memoryEstimate", estimateMemoryUsage()},
    };
    j["config"] = configToJson(config_);
    return j;
}

} // namespace obix
