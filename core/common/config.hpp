#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace obix {

enum class CacheStrategy {
    LRU,
    FREQUENCY,
    HYBRID
};

enum class OptimizationLevel {
    MINIMAL = 0,     // unreachable-state pruning only
    STANDARD = 1,    // full equivalence-class minimization
    AGGRESSIVE = 2,  // STANDARD + compiled dispatch of hot transitions
    MAXIMUM = 3      // AGGRESSIVE + memory compaction
};

/// Transition cache configuration.
struct CacheConfig {
    CacheStrategy strategy = CacheStrategy::LRU;
    size_t max_size = 1000;
    std::chrono::milliseconds ttl{3600000};  // 0 disables expiry
    bool predictive_prefetch = true;
    bool multi_tier = true;
    int frequency_threshold = 3;             // accesses before leaving cold
    std::chrono::milliseconds temporal_threshold{5000};

    // Grow capacity by 1.2x while the hit ratio beats the threshold,
    // shrink by 0.8x below 0.7x of it; bounded to [100, 10000]
    bool adaptive_size = false;
    double hit_ratio_threshold = 0.8;

    // Capacity evictions are demoted into a secondary cache
    bool l2_enabled = false;
    size_t l2_max_size = 0;                  // 0 = half the primary capacity
};

/// Runtime optimizer configuration.
struct OptimizerConfig {
    bool cache_enabled = true;
    bool runtime_optimization = true;
    bool background_optimization = true;     // false: passes run on the caller
    OptimizationLevel level = OptimizationLevel::STANDARD;
    std::chrono::milliseconds interval{60000};
    size_t max_memory_usage = 0;             // bytes, 0 = no ceiling
    double compaction_threshold = 0.8;
    bool performance_monitoring = true;
    std::chrono::milliseconds sample_interval{10000};
    size_t compile_limit = 100;
    CacheConfig cache;
};

// ── Enum parsing (case-insensitive). Throws std::invalid_argument. ──
CacheStrategy parseCacheStrategy(const std::string& name);
OptimizationLevel parseOptimizationLevel(const std::string& name);
std::string toString(CacheStrategy strategy);
std::string toString(OptimizationLevel level);

/// Build an OptimizerConfig from a JSON object. Missing keys keep their
/// defaults; unknown keys are ignored. Recognized keys:
///   cacheStrategy, maxCacheSize, ttlMs, predictivePrefetch, multiTier,
///   frequencyThreshold, temporalThresholdMs, adaptiveSize,
///   hitRatioThreshold, l2Cache, l2MaxSize, cacheEnabled,
///   runtimeOptimization, backgroundOptimization, optimizationLevel,
///   optimizationIntervalMs, maxMemoryUsage, compactionThreshold,
///   performanceMonitoring, sampleIntervalMs, compileLimit
OptimizerConfig configFromJson(const nlohmann::json& j);

nlohmann::json configToJson(const OptimizerConfig& config);

} // namespace obix
