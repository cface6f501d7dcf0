#include <gtest/gtest.h>
#include "runtime/compiled_dispatch.hpp"
#include "runtime/optimization_policy.hpp"
#include "runtime/optimized_machine.hpp"
#include "runtime/performance_monitor.hpp"
#include "runtime/periodic_task.hpp"
#include "common/errors.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

using namespace obix;
using std::chrono::milliseconds;

namespace {

struct FakeClock {
    std::shared_ptr<TimePoint> now = std::make_shared<TimePoint>();

    Clock clock() const {
        auto t = now;
        return [t] { return *t; };
    }
    void advance(milliseconds d) { *now += d; }
};

/// States {s1, s3} and {s2, s4} are pairwise indistinguishable.
Machine fourStateMachine() {
    Machine m;
    StateId s1 = m.addState("s1");
    StateId s2 = m.addState("s2", "", true);
    StateId s3 = m.addState("s3");
    StateId s4 = m.addState("s4", "", true);
    m.addTransition(s1, "a", s2);
    m.addTransition(s1, "b", s3);
    m.addTransition(s3, "a", s4);
    m.addTransition(s3, "b", s1);
    m.addTransition(s2, "a", s3);
    m.addTransition(s2, "b", s4);
    m.addTransition(s4, "a", s1);
    m.addTransition(s4, "b", s2);
    return m;
}

/// `n` states tracking their index modulo 5; every label defined everywhere.
Machine moduloMachine(size_t n = 50) {
    Machine m;
    for (size_t i = 0; i < n; i++) {
        m.addState("q" + std::to_string(i), "", i % 5 == 0);
    }
    for (size_t i = 0; i < n; i++) {
        m.addTransition(i + 1, "a", (i + 1) % n + 1);
        m.addTransition(i + 1, "b", (i + 5) % n + 1);
    }
    return m;
}

OptimizerConfig quietConfig() {
    OptimizerConfig config;
    config.runtime_optimization = false;
    config.background_optimization = false;
    config.performance_monitoring = false;
    config.cache.predictive_prefetch = false;
    return config;
}

OptimizerConfig inlineConfig(OptimizationLevel level) {
    OptimizerConfig config = quietConfig();
    config.runtime_optimization = true;
    config.level = level;
    return config;
}

void expectNoDanglingDispatch(const OptimizedMachine& om) {
    auto machine = om.snapshot();
    for (const auto& [key, target] : om.compiledDispatch().entries()) {
        EXPECT_TRUE(machine->hasState(key.state)) << "source " << key.state;
        EXPECT_TRUE(machine->hasState(target)) << "target " << target;
    }
}

} // namespace

// ─── Compiled Dispatch Table ───────────────────────────────────

TEST(CompiledDispatchTest, CompileAndLookup) {
    CompiledDispatchTable table(4);
    EXPECT_TRUE(table.compile(1, "a", 2));
    EXPECT_EQ(table.lookup(1, "a"), 2u);
    EXPECT_FALSE(table.lookup(1, "b").has_value());
    EXPECT_EQ(table.size(), 1);
}

TEST(CompiledDispatchTest, RespectsLimit) {
    CompiledDispatchTable table(2);
    EXPECT_TRUE(table.compile(1, "a", 2));
    EXPECT_TRUE(table.compile(2, "a", 3));
    EXPECT_FALSE(table.compile(3, "a", 1));
    EXPECT_TRUE(table.compile(1, "a", 3));   // overwrite still allowed
    EXPECT_EQ(table.size(), 2);
}

TEST(CompiledDispatchTest, StaleTargetThrowsAndDisable) {
    Machine m;
    StateId a = m.addState("a");
    CompiledDispatchTable table;
    table.compile(a, "x", 99);

    EXPECT_THROW(table.dispatch(m, a, "x"), CompiledDispatchStaleError);

    table.disable(a, "x");
    EXPECT_TRUE(table.isDisabled(a, "x"));
    EXPECT_FALSE(table.lookup(a, "x").has_value());
    EXPECT_FALSE(table.compile(a, "x", a));
}

TEST(CompiledDispatchTest, RemapAndPrune) {
    Machine m;
    StateId a = m.addState("a");
    StateId b = m.addState("b");
    CompiledDispatchTable table;
    table.compile(a, "x", b);
    table.compile(3, "x", 4);
    table.compile(5, "x", 6);

    table.remap({{a, a}, {b, b}, {3, a}, {4, b}});
    EXPECT_EQ(table.size(), 1);   // 3→a collides with a; 5 is unmapped
    EXPECT_EQ(table.lookup(a, "x"), b);

    table.compile(a, "y", 42);
    EXPECT_EQ(table.prune(m), 1);
    EXPECT_EQ(table.size(), 1);
}

// ─── Optimization Policy ───────────────────────────────────────

TEST(OptimizationPolicyTest, PhaseCycle) {
    OptimizerConfig config;
    OptimizationPolicy policy(config);
    EXPECT_EQ(policy.phase(), OptimizerPhase::IDLE);

    EXPECT_TRUE(policy.trigger(OptimizationLevel::AGGRESSIVE));
    EXPECT_EQ(policy.phase(), OptimizerPhase::TRIGGERED);
    EXPECT_EQ(policy.begin(), OptimizationLevel::AGGRESSIVE);
    EXPECT_EQ(policy.phase(), OptimizerPhase::RUNNING);

    // Arrivals while running are deferred, not queued
    EXPECT_FALSE(policy.trigger(OptimizationLevel::STANDARD));
    EXPECT_FALSE(policy.beginManual());
    EXPECT_EQ(policy.deferredTriggers(), 1);

    policy.finish();
    EXPECT_EQ(policy.phase(), OptimizerPhase::IDLE);
    EXPECT_FALSE(policy.begin().has_value());
}

TEST(OptimizationPolicyTest, VolumeTrigger) {
    OptimizerConfig config;
    OptimizationPolicy policy(config);
    EXPECT_FALSE(policy.evaluate(false, 8, 4, 0).has_value());
    auto decision = policy.evaluate(false, 9, 4, 0);
    ASSERT_TRUE(decision.has_value());
    EXPECT_EQ(decision->reason, TriggerReason::TRANSITION_VOLUME);
    EXPECT_EQ(decision->level, OptimizationLevel::STANDARD);
}

TEST(OptimizationPolicyTest, MemoryPressureForcesMaximum) {
    OptimizerConfig config;
    config.level = OptimizationLevel::MINIMAL;
    config.max_memory_usage = 10000;
    config.compaction_threshold = 0.8;
    OptimizationPolicy policy(config);

    EXPECT_FALSE(policy.evaluate(false, 0, 4, 8000).has_value());
    auto decision = policy.evaluate(false, 0, 4, 8001);
    ASSERT_TRUE(decision.has_value());
    EXPECT_EQ(decision->reason, TriggerReason::MEMORY_PRESSURE);
    EXPECT_EQ(decision->level, OptimizationLevel::MAXIMUM);
}

TEST(OptimizationPolicyTest, RateLimitedToHalfInterval) {
    FakeClock time;
    OptimizerConfig config;
    config.interval = milliseconds(1000);
    OptimizationPolicy policy(config, time.clock());

    EXPECT_TRUE(policy.evaluate(true, 0, 4, 0).has_value());
    ASSERT_TRUE(policy.beginManual());
    policy.finish();

    time.advance(milliseconds(499));
    EXPECT_FALSE(policy.evaluate(true, 100, 4, 0).has_value());
    time.advance(milliseconds(1));
    EXPECT_TRUE(policy.evaluate(true, 0, 4, 0).has_value());
}

// ─── Periodic Task ─────────────────────────────────────────────

TEST(PeriodicTaskTest, WakeRunsCallbackEarly) {
    std::atomic<int> runs{0};
    PeriodicTask task(milliseconds(60000), [&runs] { runs++; });
    task.start();
    EXPECT_TRUE(task.running());
    task.wake();

    for (int i = 0; i < 200 && runs.load() == 0; i++) {
        std::this_thread::sleep_for(milliseconds(10));
    }
    EXPECT_GE(runs.load(), 1);
    task.stop();
    EXPECT_FALSE(task.running());
}

TEST(PeriodicTaskTest, RunsOnPeriodAndStopsCleanly) {
    std::atomic<int> runs{0};
    {
        PeriodicTask task(milliseconds(5), [&runs] { runs++; });
        task.start();
        for (int i = 0; i < 200 && runs.load() < 3; i++) {
            std::this_thread::sleep_for(milliseconds(5));
        }
    }  // destructor joins
    int after = runs.load();
    EXPECT_GE(after, 3);
    std::this_thread::sleep_for(milliseconds(20));
    EXPECT_EQ(runs.load(), after);
}

// ─── Performance Monitor ───────────────────────────────────────

TEST(PerformanceMonitorTest, SamplesOncePerInterval) {
    FakeClock time;
    PerformanceMonitor monitor(milliseconds(100), time.clock());
    EXPECT_TRUE(monitor.due());
    monitor.recordTransition(2.0);
    monitor.recordTransition(4.0);
    monitor.record({});
    EXPECT_FALSE(monitor.due());

    time.advance(milliseconds(100));
    EXPECT_TRUE(monitor.due());

    auto samples = monitor.samples();
    ASSERT_EQ(samples.size(), 1);
    EXPECT_DOUBLE_EQ(samples[0].avg_transition_us, 3.0);
    EXPECT_DOUBLE_EQ(monitor.summary().avg_transition_us, 3.0);
}

TEST(PerformanceMonitorTest, TruncatesToNewestSamples) {
    FakeClock time;
    PerformanceMonitor monitor(milliseconds(1), time.clock());
    for (size_t i = 0; i <= PerformanceMonitor::kMaxSamples; i++) {
        PerformanceSample sample;
        sample.state_count = i;
        monitor.record(sample);
        time.advance(milliseconds(1));
    }
    auto samples = monitor.samples();
    ASSERT_EQ(samples.size(), PerformanceMonitor::kRetainedSamples);
    EXPECT_EQ(samples.back().state_count, PerformanceMonitor::kMaxSamples);
}

// ─── Optimized Machine: transitions ────────────────────────────

TEST(OptimizedMachineTest, TransitionFollowsMachine) {
    OptimizedMachine om(fourStateMachine(), quietConfig());
    EXPECT_EQ(om.transition("a").name, "s2");
    EXPECT_EQ(om.transition("b").name, "s4");
    EXPECT_TRUE(om.transition("b").accepting);
    EXPECT_EQ(om.getOptimizationStats().transitions_processed, 3);
}

TEST(OptimizedMachineTest, TransitionErrorsSurface) {
    OptimizedMachine empty(Machine{}, quietConfig());
    EXPECT_THROW(empty.transition("a"), NoCurrentStateError);

    OptimizedMachine om(fourStateMachine(), quietConfig());
    EXPECT_THROW(om.transition("zzz"), UndefinedTransitionError);
    EXPECT_EQ(om.currentState(), 1u);
}

TEST(OptimizedMachineTest, RepeatedTransitionsHitCache) {
    OptimizedMachine om(fourStateMachine(), quietConfig());
    for (int i = 0; i < 20; i++) om.transition("b");   // s1 ↔ s3
    auto stats = om.getCacheStats();
    EXPECT_EQ(stats.misses, 2);
    EXPECT_EQ(stats.hits, 18);
    EXPECT_EQ(stats.size, 2);
}

TEST(OptimizedMachineTest, CacheDisabledStillTransitions) {
    OptimizerConfig config = quietConfig();
    config.cache_enabled = false;
    OptimizedMachine om(fourStateMachine(), config);
    EXPECT_EQ(om.processSequence({"a", "a"}).name, "s3");
    EXPECT_EQ(om.getCacheStats().hits + om.getCacheStats().misses, 0);
}

TEST(OptimizedMachineTest, ProcessSequenceResets) {
    OptimizedMachine om(fourStateMachine(), quietConfig());
    om.transition("a");
    EXPECT_EQ(om.processSequence({"b"}).name, "s3");
    EXPECT_EQ(om.processSequence({}).name, "s1");
}

// ─── Optimized Machine: passes ─────────────────────────────────

TEST(OptimizedMachineTest, StandardPassSwapsAndRemapsCursor) {
    OptimizedMachine om(fourStateMachine(), quietConfig());
    om.transition("b");
    om.transition("a");   // cursor on s4
    ASSERT_EQ(om.currentState(), 4u);

    auto result = om.runOptimizationPass(OptimizationLevel::STANDARD);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->states_before, 4);
    EXPECT_EQ(result->states_after, 2);
    EXPECT_DOUBLE_EQ(result->reduction_percentage, 50.0);

    EXPECT_EQ(om.snapshot()->stateCount(), 2);
    EXPECT_EQ(om.currentState(), 2u);   // s4 folded into s2
    EXPECT_EQ(om.transition("a").name, "s1");

    auto stats = om.getOptimizationStats();
    EXPECT_EQ(stats.minimizations_performed, 1);
    EXPECT_EQ(stats.states_removed, 2);
    ASSERT_TRUE(stats.last_result.has_value());
    EXPECT_EQ(stats.last_result->level, OptimizationLevel::STANDARD);
}

TEST(OptimizedMachineTest, MinimalPassOnlyPrunes) {
    Machine m = fourStateMachine();
    m.addState("orphan");
    OptimizedMachine om(std::move(m), quietConfig());

    auto result = om.runOptimizationPass(OptimizationLevel::MINIMAL);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->states_after, 4);
}

TEST(OptimizedMachineTest, PassKeepsCursorOutsideInitialReach) {
    Machine m;
    StateId s1 = m.addState("s1");
    StateId s2 = m.addState("s2");
    StateId s3 = m.addState("s3");
    StateId s4 = m.addState("s4", "done");
    m.addTransition(s1, "a", s2);
    m.addTransition(s3, "a", s4);
    m.setCurrentState(s3);

    for (auto level : {OptimizationLevel::MINIMAL, OptimizationLevel::STANDARD,
                       OptimizationLevel::MAXIMUM}) {
        OptimizedMachine om(m, quietConfig());
        ASSERT_EQ(om.currentState(), s3);
        ASSERT_TRUE(om.runOptimizationPass(level).has_value());
        EXPECT_EQ(om.currentState(), s3) << toString(level);
        EXPECT_EQ(om.transition("a").name, "s4") << toString(level);
    }
}

TEST(OptimizedMachineTest, CacheSurvivesPassRemapped) {
    OptimizedMachine om(fourStateMachine(), quietConfig());
    om.processSequence({"a", "b", "a", "b"});
    om.runOptimizationPass(OptimizationLevel::STANDARD);

    auto machine = om.snapshot();
    for (const auto& [key, target] : om.cache().hottest(100)) {
        EXPECT_TRUE(machine->hasState(key.state));
        EXPECT_EQ(machine->target(key.state, key.label), target);
    }
}

TEST(OptimizedMachineTest, AggressiveCompilesHotTransitions) {
    OptimizedMachine om(fourStateMachine(), inlineConfig(OptimizationLevel::AGGRESSIVE));
    om.transition("b");
    om.transition("b");   // cache miss, miss
    om.transition("b");   // hit on (s1, b): compiled
    EXPECT_GE(om.compiledDispatch().size(), 1);

    om.processSequence({"b", "b", "b", "b"});
    EXPECT_GE(om.getOptimizationStats().compiled_dispatches, 1);
    expectNoDanglingDispatch(om);
}

TEST(OptimizedMachineTest, NoDanglingDispatchAfterAnyPass) {
    for (auto level : {OptimizationLevel::MINIMAL, OptimizationLevel::STANDARD,
                       OptimizationLevel::AGGRESSIVE, OptimizationLevel::MAXIMUM}) {
        OptimizerConfig config = quietConfig();
        config.level = OptimizationLevel::AGGRESSIVE;
        config.runtime_optimization = true;
        config.interval = milliseconds(3600000);
        OptimizedMachine om(moduloMachine(), config);

        // Warm cache and dispatch; the volume trigger fires along the way
        for (int i = 0; i < 300; i++) om.transition(i % 3 ? "a" : "b");
        ASSERT_TRUE(om.runOptimizationPass(level).has_value());
        expectNoDanglingDispatch(om);
        EXPECT_NO_THROW(om.processSequence({"a", "b", "a"}));
    }
}

TEST(OptimizedMachineTest, MaximumCompactsColdTierAndDispatch) {
    OptimizerConfig config = quietConfig();
    config.max_memory_usage = 1;
    config.cache.predictive_prefetch = false;
    OptimizedMachine om(moduloMachine(), config);
    for (int i = 0; i < 50; i++) om.transition("a");   // 50 cold entries

    auto result = om.runOptimizationPass(OptimizationLevel::MAXIMUM);
    ASSERT_TRUE(result.has_value());
    EXPECT_GT(result->dropped_cache_entries, 0);
    EXPECT_TRUE(result->dispatch_cleared);
    EXPECT_EQ(om.compiledDispatch().size(), 0);
    EXPECT_EQ(om.getCacheStats().cold_size, 0);
}

TEST(OptimizedMachineTest, SecondaryCacheCountsTowardMemoryAndIsCompacted) {
    OptimizerConfig config = quietConfig();
    config.cache.max_size = 4;
    config.cache.l2_enabled = true;
    OptimizedMachine om(moduloMachine(), config);
    for (int i = 0; i < 50; i++) om.transition("a");

    ASSERT_EQ(om.cache().secondarySize(), 2);
    EXPECT_EQ(om.estimateMemoryUsage(), 1000 + 200 * 50 + 100 * 100 + 150 * (4 + 2));

    auto result = om.runOptimizationPass(OptimizationLevel::MAXIMUM);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(om.cache().secondarySize(), 0);
}

TEST(OptimizedMachineTest, FailedPassKeepsMachine) {
    Machine m;
    StateId a = m.addState("");   // fails the machine check after minimization
    StateId b = m.addState("b");
    m.addTransition(a, "x", b);
    OptimizedMachine om(std::move(m), quietConfig());
    auto before = om.snapshot();

    EXPECT_FALSE(om.runOptimizationPass(OptimizationLevel::STANDARD).has_value());
    EXPECT_EQ(om.snapshot(), before);
    EXPECT_EQ(om.getOptimizationStats().failed_optimizations, 1);
    EXPECT_EQ(om.phase(), OptimizerPhase::IDLE);
}

// ─── Optimized Machine: triggers ───────────────────────────────

TEST(OptimizedMachineTest, TransitionVolumeTriggersInlinePass) {
    OptimizedMachine om(fourStateMachine(), inlineConfig(OptimizationLevel::STANDARD));
    for (int i = 0; i < 8; i++) om.transition("a");
    EXPECT_EQ(om.getOptimizationStats().minimizations_performed, 0);

    om.transition("a");   // 9 > 2 × 4
    EXPECT_EQ(om.getOptimizationStats().minimizations_performed, 1);
    EXPECT_EQ(om.snapshot()->stateCount(), 2);
}

TEST(OptimizedMachineTest, TriggersAreRateLimited) {
    FakeClock time;
    OptimizerConfig config = inlineConfig(OptimizationLevel::STANDARD);
    config.interval = milliseconds(1000);
    OptimizedMachine om(moduloMachine(10), config, time.clock());

    for (int i = 0; i < 21; i++) om.transition("a");
    ASSERT_EQ(om.getOptimizationStats().minimizations_performed, 1);

    // Volume builds up again but the window is still closed
    for (int i = 0; i < 50; i++) om.transition("a");
    EXPECT_EQ(om.getOptimizationStats().minimizations_performed, 1);

    time.advance(milliseconds(500));
    om.transition("a");
    EXPECT_EQ(om.getOptimizationStats().minimizations_performed, 2);
}

TEST(OptimizedMachineTest, MemoryPressureRunsMaximum) {
    OptimizerConfig config = inlineConfig(OptimizationLevel::MINIMAL);
    config.max_memory_usage = 100;
    OptimizedMachine om(fourStateMachine(), config);

    om.transition("a");
    auto stats = om.getOptimizationStats();
    ASSERT_TRUE(stats.last_result.has_value());
    EXPECT_EQ(stats.last_result->level, OptimizationLevel::MAXIMUM);
}

TEST(OptimizedMachineTest, TickRunsTimerPass) {
    FakeClock time;
    OptimizerConfig config = inlineConfig(OptimizationLevel::STANDARD);
    config.interval = milliseconds(1000);
    OptimizedMachine om(fourStateMachine(), config, time.clock());

    om.tick();
    EXPECT_EQ(om.getOptimizationStats().minimizations_performed, 1);
    om.tick();   // inside the rate-limit window
    EXPECT_EQ(om.getOptimizationStats().minimizations_performed, 1);
    time.advance(milliseconds(1000));
    om.tick();
    EXPECT_EQ(om.getOptimizationStats().minimizations_performed, 2);
}

TEST(OptimizedMachineTest, BackgroundTimerOptimizes) {
    OptimizerConfig config = quietConfig();
    config.runtime_optimization = true;
    config.background_optimization = true;
    config.interval = milliseconds(10);
    OptimizedMachine om(fourStateMachine(), config);
    om.start();

    for (int i = 0; i < 300 && om.getOptimizationStats().minimizations_performed == 0; i++) {
        std::this_thread::sleep_for(milliseconds(10));
    }
    om.stop();
    EXPECT_GE(om.getOptimizationStats().minimizations_performed, 1);
    EXPECT_EQ(om.snapshot()->stateCount(), 2);
}

TEST(OptimizedMachineTest, ConcurrentTransitionsDuringPasses) {
    OptimizerConfig config = quietConfig();
    config.level = OptimizationLevel::AGGRESSIVE;
    OptimizedMachine om(moduloMachine(), config);

    std::atomic<int> failures{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; t++) {
        workers.emplace_back([&om, &failures, t] {
            for (int i = 0; i < 2000; i++) {
                try {
                    om.transition((i + t) % 4 ? "a" : "b");
                } catch (const AutomatonError&) {
                    failures++;
                }
            }
        });
    }
    for (int i = 0; i < 20; i++) {
        om.runOptimizationPass(OptimizationLevel::AGGRESSIVE);
    }
    for (auto& w : workers) w.join();

    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(om.getOptimizationStats().transitions_processed, 8000);
    EXPECT_TRUE(om.snapshot()->hasState(om.currentState()));
    expectNoDanglingDispatch(om);
}

// ─── Optimized Machine: stats and export ───────────────────────

TEST(OptimizedMachineTest, MemoryEstimate) {
    OptimizerConfig config = quietConfig();
    config.cache_enabled = false;
    OptimizedMachine om(fourStateMachine(), config);
    EXPECT_EQ(om.estimateMemoryUsage(), 1000 + 4 * 200 + 8 * 100);

    om.runOptimizationPass(OptimizationLevel::STANDARD);
    EXPECT_EQ(om.estimateMemoryUsage(), 1000 + 2 * 200 + 4 * 100);
}

TEST(OptimizedMachineTest, PerformanceSamplesFeedMemoryEstimate) {
    FakeClock time;
    OptimizerConfig config = quietConfig();
    config.cache_enabled = false;
    config.performance_monitoring = true;
    config.sample_interval = milliseconds(100);
    OptimizedMachine om(fourStateMachine(), config, time.clock());

    om.transition("a");
    om.transition("a");
    EXPECT_EQ(om.performance().sampleCount(), 1);
    time.advance(milliseconds(100));
    om.transition("a");
    EXPECT_EQ(om.performance().sampleCount(), 2);
    EXPECT_EQ(om.estimateMemoryUsage(), 1000 + 4 * 200 + 8 * 100 + 2 * 100);
}

TEST(OptimizedMachineTest, ResetStats) {
    OptimizedMachine om(fourStateMachine(), quietConfig());
    om.transition("a");
    om.runOptimizationPass();
    om.resetStats();

    auto stats = om.getOptimizationStats();
    EXPECT_EQ(stats.transitions_processed, 0);
    EXPECT_EQ(stats.minimizations_performed, 0);
    EXPECT_FALSE(stats.last_result.has_value());
    EXPECT_EQ(om.getCacheStats().misses, 0);
}

TEST(OptimizedMachineTest, ExportIncludesOptimizationAndPerformance) {
    OptimizedMachine om(fourStateMachine(), quietConfig());
    om.transition("a");
    om.runOptimizationPass();

    nlohmann::json j = om.exportToJson();
    EXPECT_EQ(j["version"], 1);
    EXPECT_EQ(j["states"].size(), 2);
    EXPECT_EQ(j["current"], 2);
    EXPECT_EQ(j["optimization"]["minimizationsPerformed"], 1);
    EXPECT_EQ(j["optimization"]["lastResult"]["statesAfter"], 2);
    EXPECT_TRUE(j["performance"].contains("memoryEstimate"));
    EXPECT_EQ(j["config"]["optimizationLevel"], "standard");
}

TEST(OptimizedMachineTest, ReplaceMachineClearsDerivedState) {
    OptimizedMachine om(fourStateMachine(), quietConfig());
    om.transition("a");
    om.replaceMachine(moduloMachine(10));
    EXPECT_EQ(om.cache().size(), 0);
    EXPECT_EQ(om.snapshot()->stateCount(), 10);
    EXPECT_EQ(om.currentState(), 1u);
}

TEST(OptimizedMachineTest, StaleDispatchFallsBackToMachine) {
    OptimizedMachine om(fourStateMachine(), quietConfig());
    ASSERT_TRUE(om.compiledDispatch().compile(1, "a", 99));   // 99 is not a state

    EXPECT_EQ(om.transition("a").name, "s2");
    auto stats = om.getOptimizationStats();
    EXPECT_EQ(stats.stale_dispatches, 1);
    EXPECT_EQ(stats.compiled_dispatches, 0);
    EXPECT_TRUE(om.compiledDispatch().isDisabled(1, "a"));
    EXPECT_FALSE(om.compiledDispatch().compile(1, "a", 2));

    // Later lookups take the ordinary path without complaint
    EXPECT_EQ(om.processSequence({"a"}).name, "s2");
    EXPECT_EQ(om.getOptimizationStats().stale_dispatches, 1);
}

TEST(OptimizedMachineTest, ReplaceMachineDropsSeededRoutes) {
    OptimizedMachine om(fourStateMachine(), quietConfig());
    om.compiledDispatch().compile(1, "a", 4);
    om.replaceMachine(fourStateMachine());
    EXPECT_EQ(om.compiledDispatch().size(), 0);
    EXPECT_EQ(om.transition("a").name, "s2");
}

TEST(OptimizedMachineTest, StaticMinimize) {
    auto [machine, ratio] = OptimizedMachine::minimize(fourStateMachine());
    EXPECT_EQ(machine.stateCount(), 2);
    EXPECT_DOUBLE_EQ(ratio, 0.5);
}
