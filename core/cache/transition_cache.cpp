#include "cache/transition_cache.hpp"
#include "common/logging.hpp"

#include <algorithm>
#include <tuple>

namespace obix {

std::string toString(CacheTier tier) {
    switch (tier) {
        case CacheTier::HOT: return "hot";
        case CacheTier::FREQUENT: return "frequent";
        case CacheTier::COLD: return "cold";
    }
    return "cold";
}

AdaptiveTransitionCache::AdaptiveTransitionCache(CacheConfig config, Clock clock)
    : config_(std::move(config)), clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = steadyClock();
    }
    if (config_.max_size == 0) {
        config_.max_size = 1;
    }
    capacity_ = config_.max_size;
    TimePoint now = clock_();
    resizeSecondaryLocked(now);
    next_maintenance_ = now + config_.temporal_threshold;
}

// ─── Lookup ────────────────────────────────────────────────────

std::optional<StateId> AdaptiveTransitionCache::get(StateId state, const std::string& label,
                                                    const Resolver& resolver) {
    std::lock_guard<std::mutex> lock(mutex_);
    TimePoint now = clock_();
    maintainLocked(now, false);

    TransitionKey key{state, label};
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        auto demoted = secondary_.find(key);
        if (demoted == secondary_.end() || expired(demoted->second, now)) {
            if (demoted != secondary_.end()) secondary_.erase(demoted);
            misses_++;
            return std::nullopt;
        }

        // Back into the primary cache, keeping its access history
        Entry restored = demoted->second;
        secondary_.erase(demoted);
        insertLocked(key, restored.target, now, false);
        entries_.at(key).access_count = restored.access_count + 1;
        hits_++;
        l2_hits_++;
        countLabelLocked(state, label);
        return restored.target;
    }
    if (expired(it->second, now)) {
        removeLocked(it);
        evictions_++;
        misses_++;
        return std::nullopt;
    }

    Entry& entry = it->second;
    auto idle = now - entry.last_access;
    touch(entry, now);
    promote(entry, idle);

    hits_++;
    countLabelLocked(state, label);
    if (entry.prefetched) {
        predictive_hits_++;
        entry.prefetched = false;
    }

    StateId target = entry.target;
    if (config_.predictive_prefetch && resolver) {
        prefetchLocked(target, resolver, now);
    }
    return target;
}

void AdaptiveTransitionCache::set(StateId state, const std::string& label, StateId target) {
    std::lock_guard<std::mutex> lock(mutex_);
    TimePoint now = clock_();
    countLabelLocked(state, label);

    TransitionKey key{state, label};
    secondary_.erase(key);
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        Entry& entry = it->second;
        entry.target = target;
        entry.prefetched = false;
        entry.last_access = now;
        if (config_.ttl.count() > 0) entry.expires_at = now + config_.ttl;
        auto& list = tierList(entry.tier);
        list.splice(list.end(), list, entry.position);
        return;
    }

    insertLocked(key, target, now, false);
}

std::optional<StateId> AdaptiveTransitionCache::peek(StateId state,
                                                     const std::string& label) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(TransitionKey{state, label});
    if (it == entries_.end() || expired(it->second, clock_())) return std::nullopt;
    return it->second.target;
}

std::optional<CacheTier> AdaptiveTransitionCache::tierOf(StateId state,
                                                         const std::string& label) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(TransitionKey{state, label});
    if (it == entries_.end()) return std::nullopt;
    return it->second.tier;
}

// ─── Removal ───────────────────────────────────────────────────

bool AdaptiveTransitionCache::erase(StateId state, const std::string& label) {
    std::lock_guard<std::mutex> lock(mutex_);
    TransitionKey key{state, label};
    bool demoted = secondary_.erase(key) > 0;
    auto it = entries_.find(key);
    if (it == entries_.end()) return demoted;
    removeLocked(it);
    return true;
}

void AdaptiveTransitionCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    secondary_.clear();
    for (auto& list : tiers_) list.clear();
    label_frequency_.clear();
}

size_t AdaptiveTransitionCache::dropTier(CacheTier tier) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& list = tierList(tier);
    size_t dropped = list.size();
    for (const auto& key : list) {
        entries_.erase(key);
    }
    list.clear();
    evictions_ += dropped;
    return dropped;
}

size_t AdaptiveTransitionCache::dropSecondary() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t dropped = secondary_.size();
    secondary_.clear();
    return dropped;
}

// ─── Remapping ─────────────────────────────────────────────────

void AdaptiveTransitionCache::remapStates(const std::unordered_map<StateId, StateId>& mapping) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::pair<TransitionKey, Entry>> old;
    old.reserve(entries_.size());
    for (auto& [key, entry] : entries_) {
        old.emplace_back(key, entry);
    }
    std::sort(old.begin(), old.end(), [](const auto& a, const auto& b) {
        return a.second.last_access < b.second.last_access;
    });

    entries_.clear();
    for (auto& list : tiers_) list.clear();

    for (auto& [key, entry] : old) {
        auto source = mapping.find(key.state);
        auto target = mapping.find(entry.target);
        if (source == mapping.end() || target == mapping.end()) continue;

        TransitionKey new_key{source->second, key.label};
        auto existing = entries_.find(new_key);
        if (existing != entries_.end()) {
            if (existing->second.access_count >= entry.access_count) continue;
            removeLocked(existing);
        }

        entry.target = target->second;
        auto& list = tierList(entry.tier);
        entry.position = list.insert(list.end(), new_key);
        entries_.emplace(new_key, entry);
    }

    EntryMap demoted;
    for (auto& [key, entry] : secondary_) {
        auto source = mapping.find(key.state);
        auto target = mapping.find(entry.target);
        if (source == mapping.end() || target == mapping.end()) continue;

        TransitionKey new_key{source->second, key.label};
        if (entries_.count(new_key)) continue;
        auto existing = demoted.find(new_key);
        if (existing != demoted.end() && existing->second.access_count >= entry.access_count) {
            continue;
        }
        entry.target = target->second;
        demoted[new_key] = entry;
    }
    secondary_ = std::move(demoted);

    std::unordered_map<StateId, std::unordered_map<std::string, uint64_t>> frequency;
    for (const auto& [state, labels] : label_frequency_) {
        auto mapped = mapping.find(state);
        if (mapped == mapping.end()) continue;
        for (const auto& [label, count] : labels) {
            frequency[mapped->second][label] += count;
        }
    }
    label_frequency_ = std::move(frequency);
}

// ─── Queries ───────────────────────────────────────────────────

std::vector<std::pair<TransitionKey, StateId>> AdaptiveTransitionCache::hottest(size_t n) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::tuple<uint64_t, TransitionKey, StateId>> ranked;
    ranked.reserve(entries_.size());
    for (const auto& [key, entry] : entries_) {
        ranked.emplace_back(entry.access_count, key, entry.target);
    }
    std::sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) {
        if (std::get<0>(a) != std::get<0>(b)) return std::get<0>(a) > std::get<0>(b);
        const TransitionKey& ka = std::get<1>(a);
        const TransitionKey& kb = std::get<1>(b);
        return std::tie(ka.state, ka.label) < std::tie(kb.state, kb.label);
    });

    std::vector<std::pair<TransitionKey, StateId>> result;
    for (size_t i = 0; i < ranked.size() && i < n; i++) {
        result.emplace_back(std::get<1>(ranked[i]), std::get<2>(ranked[i]));
    }
    return result;
}

size_t AdaptiveTransitionCache::precompute(const Machine& machine) {
    std::lock_guard<std::mutex> lock(mutex_);
    TimePoint now = clock_();
    size_t inserted = 0;

    for (StateId id : machine.stateIds()) {
        const State* state = machine.getState(id);
        for (const auto& [label, target] : state->transitions) {
            if (entries_.size() >= capacity_) return inserted;
            TransitionKey key{id, label};
            if (entries_.count(key)) continue;
            insertLocked(key, target, now, false);
            inserted++;
        }
    }
    return inserted;
}

void AdaptiveTransitionCache::rebalance() {
    std::lock_guard<std::mutex> lock(mutex_);
    maintainLocked(clock_(), true);
}

CacheStats AdaptiveTransitionCache::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CacheStats stats;
    stats.hits = hits_;
    stats.misses = misses_;
    stats.evictions = evictions_;
    stats.prefetches = prefetches_;
    stats.predictive_hits = predictive_hits_;
    stats.l2_hits = l2_hits_;
    stats.capacity_adjustments = capacity_adjustments_;
    uint64_t total = hits_ + misses_;
    stats.hit_ratio = total > 0 ? static_cast<double>(hits_) / static_cast<double>(total) : 0.0;
    stats.size = entries_.size();
    stats.capacity = capacity_;
    stats.l2_size = secondary_.size();
    stats.l2_capacity = l2_capacity_;
    stats.hot_size = tiers_[static_cast<int>(CacheTier::HOT)].size();
    stats.frequent_size = tiers_[static_cast<int>(CacheTier::FREQUENT)].size();
    stats.cold_size = tiers_[static_cast<int>(CacheTier::COLD)].size();
    return stats;
}

void AdaptiveTransitionCache::resetStats() {
    std::lock_guard<std::mutex> lock(mutex_);
    hits_ = misses_ = evictions_ = prefetches_ = predictive_hits_ = l2_hits_ = 0;
    capacity_adjustments_ = 0;
}

size_t AdaptiveTransitionCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

size_t AdaptiveTransitionCache::secondarySize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return secondary_.size();
}

size_t AdaptiveTransitionCache::capacity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return capacity_;
}

// ─── Internals (mutex held) ────────────────────────────────────

void AdaptiveTransitionCache::insertLocked(const TransitionKey& key, StateId target,
                                           TimePoint now, bool prefetched) {
    // A full cache re-tunes its capacity before making room
    if (config_.adaptive_size && entries_.size() >= capacity_) {
        adjustCapacityLocked();
    }
    while (entries_.size() >= capacity_ && !entries_.empty()) {
        evictOneLocked(now);
    }

    Entry entry;
    entry.target = target;
    entry.last_access = now;
    if (config_.ttl.count() > 0) entry.expires_at = now + config_.ttl;
    entry.access_count = 1;
    entry.tier = CacheTier::COLD;
    entry.prefetched = prefetched;

    auto& list = tierList(CacheTier::COLD);
    entry.position = list.insert(list.end(), key);
    entries_.emplace(key, entry);
}

void AdaptiveTransitionCache::removeLocked(EntryMap::iterator it) {
    tierList(it->second.tier).erase(it->second.position);
    entries_.erase(it);
}

void AdaptiveTransitionCache::moveToTier(Entry& entry, CacheTier tier) {
    if (entry.tier == tier) return;
    auto& from = tierList(entry.tier);
    auto& to = tierList(tier);
    to.splice(to.end(), from, entry.position);
    entry.tier = tier;
}

void AdaptiveTransitionCache::touch(Entry& entry, TimePoint now) {
    entry.last_access = now;
    entry.access_count++;
    if (config_.ttl.count() > 0) entry.expires_at = now + config_.ttl;
    auto& list = tierList(entry.tier);
    list.splice(list.end(), list, entry.position);
}

void AdaptiveTransitionCache::promote(Entry& entry, std::chrono::steady_clock::duration idle) {
    if (!config_.multi_tier) return;
    if (entry.access_count <= static_cast<uint64_t>(config_.frequency_threshold)) return;
    if (idle >= config_.temporal_threshold) return;

    if (entry.tier == CacheTier::COLD) {
        moveToTier(entry, CacheTier::FREQUENT);
    } else if (entry.tier == CacheTier::FREQUENT) {
        moveToTier(entry, CacheTier::HOT);
    }
}

bool AdaptiveTransitionCache::expired(const Entry& entry, TimePoint now) const {
    return entry.expires_at && *entry.expires_at <= now;
}

void AdaptiveTransitionCache::evictOneLocked(TimePoint now) {
    if (tierList(CacheTier::COLD).empty() && config_.multi_tier) {
        maintainLocked(now, true);
        if (entries_.size() < capacity_) return;
    }

    for (CacheTier tier : {CacheTier::COLD, CacheTier::FREQUENT, CacheTier::HOT}) {
        if (tierList(tier).empty()) continue;
        auto victim = selectVictim(tier, now);
        if (victim == entries_.end()) continue;
        TransitionKey key = victim->first;
        Entry entry = victim->second;
        removeLocked(victim);
        evictions_++;
        if (config_.l2_enabled) demoteLocked(key, entry, now);
        return;
    }
}

AdaptiveTransitionCache::EntryMap::iterator AdaptiveTransitionCache::selectVictim(
    CacheTier tier, TimePoint now) {
    const auto& list = tierList(tier);

    if (config_.strategy == CacheStrategy::LRU) {
        return entries_.find(list.front());
    }

    auto best = entries_.end();
    double best_value = 0.0;
    for (const auto& key : list) {
        auto it = entries_.find(key);
        if (it == entries_.end()) continue;
        const Entry& e = it->second;

        double value;
        if (config_.strategy == CacheStrategy::FREQUENCY) {
            value = static_cast<double>(e.access_count);
        } else {
            double idle_s = std::chrono::duration<double>(now - e.last_access).count();
            value = static_cast<double>(e.access_count) / (1.0 + idle_s);
        }

        // The list runs least recent first, so ties go to the older entry
        if (best == entries_.end() || value < best_value) {
            best = it;
            best_value = value;
        }
    }
    return best;
}

void AdaptiveTransitionCache::maintainLocked(TimePoint now, bool force) {
    if (!force && now < next_maintenance_) return;

    auto period = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        config_.temporal_threshold);
    if (config_.ttl.count() > 0) {
        period = std::min(period, std::chrono::duration_cast<std::chrono::steady_clock::duration>(
            config_.ttl / 4));
    }
    if (period <= std::chrono::steady_clock::duration::zero()) {
        period = std::chrono::milliseconds(1);
    }
    next_maintenance_ = now + period;

    for (auto it = secondary_.begin(); it != secondary_.end();) {
        if (expired(it->second, now)) it = secondary_.erase(it);
        else ++it;
    }

    for (auto it = entries_.begin(); it != entries_.end();) {
        if (expired(it->second, now)) {
            auto next = std::next(it);
            removeLocked(it);
            evictions_++;
            it = next;
            continue;
        }

        if (config_.multi_tier) {
            Entry& e = it->second;
            auto idle = now - e.last_access;
            if (e.access_count <= 1 && idle > 2 * config_.temporal_threshold) {
                moveToTier(e, CacheTier::COLD);
            } else if (e.tier == CacheTier::HOT && idle > config_.temporal_threshold) {
                moveToTier(e, CacheTier::FREQUENT);
            }
        }
        ++it;
    }
}

void AdaptiveTransitionCache::prefetchLocked(StateId from, const Resolver& resolver,
                                             TimePoint now) {
    auto freq = label_frequency_.find(from);
    if (freq == label_frequency_.end() || freq->second.empty()) return;

    const std::string* best = nullptr;
    uint64_t best_count = 0;
    for (const auto& [label, count] : freq->second) {
        if (!best || count > best_count || (count == best_count && label < *best)) {
            best = &label;
            best_count = count;
        }
    }

    TransitionKey key{from, *best};
    if (entries_.count(key)) return;

    auto target = resolver(from, *best);
    if (!target) return;
    secondary_.erase(key);
    insertLocked(key, *target, now, true);
    prefetches_++;
}

// ─── Secondary cache and sizing ────────────────────────────────

void AdaptiveTransitionCache::demoteLocked(const TransitionKey& key, const Entry& entry,
                                           TimePoint now) {
    if (l2_capacity_ == 0) return;
    while (secondary_.size() >= l2_capacity_) {
        evictSecondaryLocked(now);
    }
    Entry demoted = entry;
    demoted.prefetched = false;
    secondary_[key] = demoted;
}

void AdaptiveTransitionCache::evictSecondaryLocked(TimePoint now) {
    auto victim = secondary_.end();
    double lowest = 0.0;
    for (auto it = secondary_.begin(); it != secondary_.end(); ++it) {
        double idle_s = std::chrono::duration<double>(now - it->second.last_access).count();
        double value = static_cast<double>(it->second.access_count) / (1.0 + idle_s);
        if (victim == secondary_.end() || value < lowest) {
            victim = it;
            lowest = value;
        }
    }
    if (victim != secondary_.end()) secondary_.erase(victim);
}

void AdaptiveTransitionCache::resizeSecondaryLocked(TimePoint now) {
    if (!config_.l2_enabled) {
        l2_capacity_ = 0;
    } else if (config_.l2_max_size > 0) {
        l2_capacity_ = config_.l2_max_size;
    } else {
        l2_capacity_ = std::max<size_t>(1, capacity_ / 2);
    }
    while (secondary_.size() > l2_capacity_) {
        evictSecondaryLocked(now);
    }
}

void AdaptiveTransitionCache::adjustCapacityLocked() {
    uint64_t total = hits_ + misses_;
    if (total < kMinAdaptiveRequests) return;

    double ratio = static_cast<double>(hits_) / static_cast<double>(total);
    size_t before = capacity_;
    if (ratio > config_.hit_ratio_threshold && capacity_ < kMaxAdaptiveCapacity) {
        capacity_ = std::min(kMaxAdaptiveCapacity, std::max(capacity_ + 1, capacity_ * 6 / 5));
    } else if (ratio < config_.hit_ratio_threshold * 0.7 && capacity_ > kMinAdaptiveCapacity) {
        capacity_ = std::max(kMinAdaptiveCapacity, capacity_ * 4 / 5);
    }
    if (capacity_ == before) return;

    capacity_adjustments_++;
    resizeSecondaryLocked(clock_());
    logging::OBIX.debug("cache capacity ", before, " -> ", capacity_,
                        " at hit ratio ", ratio, "\n");
}

void AdaptiveTransitionCache::countLabelLocked(StateId state, const std::string& label) {
    if (config_.predictive_prefetch) {
        label_frequency_[state][label]++;
    }
}

} // namespace obix
