#include "common/config.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace obix {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::chrono::milliseconds readMs(const nlohmann::json& j, const char* key,
                                 std::chrono::milliseconds fallback) {
    if (!j.contains(key)) return fallback;
    return std::chrono::milliseconds(j.at(key).get<long long>());
}

} // namespace

CacheStrategy parseCacheStrategy(const std::string& name) {
    std::string n = lower(name);
    if (n == "lru") return CacheStrategy::LRU;
    if (n == "frequency" || n == "lfu") return CacheStrategy::FREQUENCY;
    if (n == "hybrid") return CacheStrategy::HYBRID;
    throw std::invalid_argument("Unknown cache strategy: " + name);
}

OptimizationLevel parseOptimizationLevel(const std::string& name) {
    std::string n = lower(name);
    if (n == "minimal") return OptimizationLevel::MINIMAL;
    if (n == "standard") return OptimizationLevel::STANDARD;
    if (n == "aggressive") return OptimizationLevel::AGGRESSIVE;
    if (n == "maximum") return OptimizationLevel::MAXIMUM;
    throw std::invalid_argument("Unknown optimization level: " + name);
}

std::string toString(CacheStrategy strategy) {
    switch (strategy) {
        case CacheStrategy::LRU: return "lru";
        case CacheStrategy::FREQUENCY: return "frequency";
        case CacheStrategy::HYBRID: return "hybrid";
    }
    return "lru";
}

std::string toString(OptimizationLevel level) {
    switch (level) {
        case OptimizationLevel::MINIMAL: return "minimal";
        case OptimizationLevel::STANDARD: return "standard";
        case OptimizationLevel::AGGRESSIVE: return "aggressive";
        case OptimizationLevel::MAXIMUM: return "maximum";
    }
    return "standard";
}

OptimizerConfig configFromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("Optimizer configuration must be a JSON object");
    }

    OptimizerConfig config;
    CacheConfig& cache = config.cache;

    if (j.contains("cacheStrategy"))
        cache.strategy = parseCacheStrategy(j.at("cacheStrategy").get<std::string>());
    cache.max_size = j.value("maxCacheSize", cache.max_size);
    cache.ttl = readMs(j, "ttlMs", cache.ttl);
    cache.predictive_prefetch = j.value("predictivePrefetch", cache.predictive_prefetch);
    cache.multi_tier = j.value("multiTier", cache.multi_tier);
    cache.frequency_threshold = j.value("frequencyThreshold", cache.frequency_threshold);
    cache.temporal_threshold = readMs(j, "temporalThresholdMs", cache.temporal_threshold);
    cache.adaptive_size = j.value("adaptiveSize", cache.adaptive_size);
    cache.hit_ratio_threshold = j.value("hitRatioThreshold", cache.hit_ratio_threshold);
    cache.l2_enabled = j.value("l2Cache", cache.l2_enabled);
    cache.l2_max_size = j.value("l2MaxSize", cache.l2_max_size);

    config.cache_enabled = j.value("cacheEnabled", config.cache_enabled);
    config.runtime_optimization = j.value("runtimeOptimization", config.runtime_optimization);
    config.background_optimization =
        j.value("backgroundOptimization", config.background_optimization);
    if (j.contains("optimizationLevel"))
        config.level = parseOptimizationLevel(j.at("optimizationLevel").get<std::string>());
    config.interval = readMs(j, "optimizationIntervalMs", config.interval);
    config.max_memory_usage = j.value("maxMemoryUsage", config.max_memory_usage);
    config.compaction_threshold = j.value("compactionThreshold", config.compaction_threshold);
    config.performance_monitoring =
        j.value("performanceMonitoring", config.performance_monitoring);
    config.sample_interval = readMs(j, "sampleIntervalMs", config.sample_interval);
    config.compile_limit = j.value("compileLimit", config.compile_limit);

    if (cache.max_size == 0) {
        throw std::invalid_argument("maxCacheSize must be positive");
    }
    if (cache.hit_ratio_threshold <= 0.0 || cache.hit_ratio_threshold > 1.0) {
        throw std::invalid_argument("hitRatioThreshold must be in (0, 1]");
    }
    if (config.compaction_threshold <= 0.0 || config.compaction_threshold > 1.0) {
        throw std::invalid_argument("compactionThreshold must be in (0, 1]");
    }
    return config;
}

nlohmann::json configToJson(const OptimizerConfig& config) {
    return {
        {"cacheStrategy", toString(config.cache.strategy)},
        {"maxCacheSize", config.cache.max_size},
        {"ttlMs", config.cache.ttl.count()},
        {"predictivePrefetch", config.cache.predictive_prefetch},
        {"multiTier", config.cache.multi_tier},
        {"frequencyThreshold", config.cache.frequency_threshold},
        {"temporalThresholdMs", config.cache.temporal_threshold.count()},
        {"adaptiveSize", config.cache.adaptive_size},
        {"hitRatioThreshold", config.cache.hit_ratio_threshold},
        {"l2Cache", config.cache.l2_enabled},
        {"l2MaxSize", config.cache.l2_max_size},
        {"cacheEnabled", config.cache_enabled},
        {"runtimeOptimization", config.runtime_optimization},
        {"backgroundOptimization", config.background_optimization},
        {"optimizationLevel", toString(config.level)},
        {"optimizationIntervalMs", config.interval.count()},
        {"maxMemoryUsage", config.max_memory_usage},
        {"compactionThreshold", config.compaction_threshold},
        {"performanceMonitoring", config.performance_monitoring},
        {"sampleIntervalMs", config.sample_interval.count()},
        {"compileLimit", config.compile_limit},
    };
}

} // namespace obix
