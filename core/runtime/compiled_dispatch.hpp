#pragma once

#include "automaton/machine.hpp"
#include "cache/transition_cache.hpp"

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace obix {

// ─── Compiled Dispatch Table ───────────────────────────────────
// (state, label) → target for transitions known to be hot. A lookup
// here skips both the cache and the machine's own transition map.
//
// A pair whose target turns out not to be a member of the current
// machine is stale: it is removed and disabled, and never compiled
// again for the lifetime of the table.

class CompiledDispatchTable {
public:
    explicit CompiledDispatchTable(size_t limit = 100) : limit_(limit) {}

    /// Returns false if the pair is disabled or the table is full.
    bool compile(StateId source, const std::string& label, StateId target);

    std::optional<StateId> lookup(StateId source, const std::string& label) const;

    /// Compiled target of the pair, checked against `machine`.
    /// Throws CompiledDispatchStaleError if the target is not a member.
    std::optional<StateId> dispatch(const Machine& machine, StateId source,
                                    const std::string& label) const;

    void disable(StateId source, const std::string& label);
    bool isDisabled(StateId source, const std::string& label) const;

    /// Re-key after a minimization swap; unmapped pairs are dropped.
    void remap(const std::unordered_map<StateId, StateId>& mapping);

    /// Drop every entry whose source or target is not in `machine`.
    size_t prune(const Machine& machine);

    std::vector<std::pair<TransitionKey, StateId>> entries() const;

    void clear();
    size_t size() const;
    size_t limit() const { return limit_; }

private:
    size_t limit_;
    mutable std::mutex mutex_;
    std::unordered_map<TransitionKey, StateId, TransitionKeyHash> table_;
    std::unordered_set<TransitionKey, TransitionKeyHash> disabled_;
};

} // namespace obix
