#pragma once

#include "automaton/machine.hpp"
#include "common/clock.hpp"
#include "common/config.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace obix {

enum class CacheTier {
    HOT,
    FREQUENT,
    COLD
};

std::string toString(CacheTier tier);

struct TransitionKey {
    StateId state = kNoState;
    std::string label;

    bool operator==(const TransitionKey& other) const {
        return state == other.state && label == other.label;
    }
};

struct TransitionKeyHash {
    size_t operator()(const TransitionKey& key) const {
        size_t h = std::hash<std::string>()(key.label);
        return h ^ (std::hash<uint64_t>()(key.state) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
    }
};

struct CacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t evictions = 0;      // capacity evictions, expiries and dropped tiers
    uint64_t prefetches = 0;
    uint64_t predictive_hits = 0;
    uint64_t l2_hits = 0;           // counted in hits as well
    uint64_t capacity_adjustments = 0;
    double hit_ratio = 0.0;
    size_t size = 0;
    size_t capacity = 0;
    size_t l2_size = 0;
    size_t l2_capacity = 0;
    size_t hot_size = 0;
    size_t frequent_size = 0;
    size_t cold_size = 0;
};

// ─── Adaptive Transition Cache ─────────────────────────────────
// (state, label) → target cache in front of the raw machine lookup.
//
// Entries live in one of three tiers. An access with count above the
// frequency threshold that arrives within the temporal threshold
// moves the entry one tier toward HOT. A periodic rebalance demotes
// idle entries: count <= 1 and idle for 2x the temporal threshold
// goes back to COLD, HOT idle past the threshold drops to FREQUENT.
// Eviction takes the least valuable entry of the coldest non-empty
// tier, "value" being decided by the configured strategy.
//
// Optional extras: with l2_enabled an evicted entry moves into a
// smaller secondary cache and a later hit there brings it back; with
// adaptive_size an insertion into a full cache first re-tunes the
// capacity from the hit ratio.
//
// All public operations are serialized by an internal mutex, so a
// lookup always copies out a complete entry.

class AdaptiveTransitionCache {
public:
    using TimePoint = obix::TimePoint;
    using Clock = obix::Clock;

    /// Raw lookup used to warm predicted entries.
    using Resolver = std::function<std::optional<StateId>(StateId, const std::string&)>;

    explicit AdaptiveTransitionCache(CacheConfig config = {}, Clock clock = {});

    /// Cached target, or nullopt on a miss (or an expired entry).
    /// Falls back to the secondary cache when it is enabled.
    /// With predictive prefetch on, a hit resolves the most likely next
    /// label from the target through `resolver` and warms it.
    std::optional<StateId> get(StateId state, const std::string& label,
                               const Resolver& resolver = {});

    void set(StateId state, const std::string& label, StateId target);

    /// Lookup without touching metadata or statistics.
    std::optional<StateId> peek(StateId state, const std::string& label) const;
    std::optional<CacheTier> tierOf(StateId state, const std::string& label) const;

    bool erase(StateId state, const std::string& label);
    void clear();

    /// Drop every entry of a tier. Returns the number removed.
    size_t dropTier(CacheTier tier);

    /// Empty the secondary cache. Returns the number removed.
    size_t dropSecondary();

    /// Re-key entries after a minimization swap. Entries whose source
    /// or target has no mapping are dropped; on a key collision the
    /// entry with the higher access count wins.
    void remapStates(const std::unordered_map<StateId, StateId>& mapping);

    /// Most accessed entries, highest access count first.
    std::vector<std::pair<TransitionKey, StateId>> hottest(size_t n) const;

    /// Cache every transition of a machine, up to capacity.
    size_t precompute(const Machine& machine);

    /// Apply demotions and purge expired entries now.
    void rebalance();

    CacheStats getStats() const;
    void resetStats();

    /// Entries in the primary cache.
    size_t size() const;
    size_t secondarySize() const;
    size_t capacity() const;
    const CacheConfig& config() const { return config_; }

private:
    struct Entry {
        StateId target = kNoState;
        TimePoint last_access;
        std::optional<TimePoint> expires_at;
        uint64_t access_count = 0;
        CacheTier tier = CacheTier::COLD;
        bool prefetched = false;
        std::list<TransitionKey>::iterator position;
    };

    using EntryMap = std::unordered_map<TransitionKey, Entry, TransitionKeyHash>;

    static constexpr size_t kMinAdaptiveCapacity = 100;
    static constexpr size_t kMaxAdaptiveCapacity = 10000;
    static constexpr uint64_t kMinAdaptiveRequests = 100;

    CacheConfig config_;
    Clock clock_;

    mutable std::mutex mutex_;
    EntryMap entries_;
    EntryMap secondary_;                  // tier and position unused
    size_t capacity_ = 0;
    size_t l2_capacity_ = 0;
    std::list<TransitionKey> tiers_[3];   // per tier, least recent first
    std::unordered_map<StateId, std::unordered_map<std::string, uint64_t>> label_frequency_;
    TimePoint next_maintenance_;

    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
    uint64_t evictions_ = 0;
    uint64_t prefetches_ = 0;
    uint64_t predictive_hits_ = 0;
    uint64_t l2_hits_ = 0;
    uint64_t capacity_adjustments_ = 0;

    std::list<TransitionKey>& tierList(CacheTier tier) { return tiers_[static_cast<int>(tier)]; }

    void insertLocked(const TransitionKey& key, StateId target, TimePoint now, bool prefetched);
    void removeLocked(EntryMap::iterator it);
    void moveToTier(Entry& entry, CacheTier tier);
    void touch(Entry& entry, TimePoint now);
    void promote(Entry& entry, std::chrono::steady_clock::duration idle);
    bool expired(const Entry& entry, TimePoint now) const;
    void evictOneLocked(TimePoint now);
    EntryMap::iterator selectVictim(CacheTier tier, TimePoint now);
    void maintainLocked(TimePoint now, bool force);
    void prefetchLocked(StateId from, const Resolver& resolver, TimePoint now);
    void demoteLocked(const TransitionKey& key, const Entry& entry, TimePoint now);
    void adjustCapacityLocked();
    void resizeSecondaryLocked(TimePoint now);
    void evictSecondaryLocked(TimePoint now);
    void countLabelLocked(StateId state, const std::string& label);
};

} // namespace obix
