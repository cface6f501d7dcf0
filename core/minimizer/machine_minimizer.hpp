#pragma once

#include "automaton/machine.hpp"
#include "equivalence/equivalence_class_computer.hpp"

#include <cstddef>
#include <unordered_map>
#include <vector>

namespace obix {

struct MinimizationMetrics {
    size_t original_state_count = 0;
    size_t minimized_state_count = 0;
    size_t equivalence_class_count = 0;
    size_t original_transition_count = 0;
    size_t minimized_transition_count = 0;
    size_t refinement_passes = 0;
    double reduction_percentage = 0.0;
    double processing_time_ms = 0.0;
};

struct MinimizationResult {
    Machine machine;
    double reduction_ratio = 0.0;   // 1 - minimized / original
    MinimizationMetrics metrics;

    /// Original state id → id of the state that now stands for it.
    /// States dropped as unreachable have no entry.
    std::unordered_map<StateId, StateId> state_mapping;

    EquivalenceResult equivalence;
};

// ─── Machine Minimizer ─────────────────────────────────────────
// Rebuilds a machine with one state per equivalence class. The
// representative of a class is its first member in discovery order;
// it keeps its id, name and payload, and its transitions are
// rewritten to point at class representatives. Only states reachable
// from the initial state or from the cursor survive, so a machine keeps
// running from wherever it stands.

class MachineMinimizer {
public:
    explicit MachineMinimizer(bool record_history = false)
        : record_history_(record_history) {}

    /// Full equivalence-class minimization.
    MinimizationResult minimize(const Machine& machine);

    /// Reachability pruning only; no refinement. States reachable from
    /// the cursor are kept along with those reachable from the initial state.
    MinimizationResult removeUnreachable(const Machine& machine);

    /// Build the reduced machine from a computed class map.
    /// Throws OptimizationError if the class map does not cover a transition.
    static Machine buildFromClasses(const Machine& machine, const EquivalenceResult& classes,
                                    std::unordered_map<StateId, StateId>& mapping);

    const MinimizationMetrics& lastMetrics() const { return last_metrics_; }

private:
    bool record_history_;
    MinimizationMetrics last_metrics_;

    /// Initial state, then the cursor when it is elsewhere.
    static std::vector<StateId> liveRoots(const Machine& machine);
    static void finishMetrics(const Machine& original, MinimizationResult& result);
};

} // namespace obix
