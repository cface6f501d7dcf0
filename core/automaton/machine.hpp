#pragma once

#include "automaton/state.hpp"
#include "graph/minimizable_graph.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace obix {

// ─── Machine ───────────────────────────────────────────────────
// A finite-state machine: a set of states owned by value, one
// designated initial state and a mutable current-state cursor.
// Copyable, so optimization passes can work on a private copy.
//
// Every structural mutation bumps revision(), so a holder of two
// copies can tell whether one has been edited since it was taken.

class Machine : public MinimizableGraph {
public:
    Machine() = default;
    explicit Machine(const std::string& initial_name);

    // ── States ──
    /// The first state added becomes initial and current.
    StateId addState(const std::string& name, const std::string& value = "",
                     bool accepting = false);
    StateId addStateWithId(StateId id, const std::string& name,
                           const std::string& value = "", bool accepting = false);
    bool removeState(StateId id);

    State* getState(StateId id);
    const State* getState(StateId id) const;
    std::optional<StateId> findState(const std::string& name) const;
    bool hasState(StateId id) const { return states_.count(id) > 0; }
    std::vector<StateId> stateIds() const;
    size_t stateCount() const { return states_.size(); }

    void setAccepting(StateId id, bool accepting);
    void setValue(StateId id, const std::string& value);

    // ── Transitions ──
    void addTransition(StateId from, const std::string& label, StateId to);
    void addTransitionByName(const std::string& from, const std::string& label,
                             const std::string& to);
    bool removeTransition(StateId from, const std::string& label);
    std::optional<StateId> target(StateId from, const std::string& label) const;
    size_t countTransitions() const;
    const std::set<std::string>& alphabet() const { return alphabet_; }

    // ── Cursor ──
    StateId initialState() const { return initial_; }
    StateId currentState() const { return current_; }
    bool hasCurrentState() const { return current_ != kNoState; }
    void setInitialState(StateId id);
    void setCurrentState(StateId id);
    void resetToState(const std::string& name);
    void reset() { current_ = initial_; }

    /// Follow `label` from the cursor and move the cursor.
    /// Throws NoCurrentStateError or UndefinedTransitionError.
    const State& transition(const std::string& label);

    /// Reset, then run every label in order.
    const State& processSequence(const std::vector<std::string>& labels);

    /// True if the sequence runs to completion and ends in an accepting state.
    bool accepts(const std::vector<std::string>& labels);

    // ── Reachability ──
    /// States reachable from the initial state, breadth-first.
    std::vector<StateId> reachableStates() const;

    /// States reachable from any of `roots`, breadth-first in root order.
    std::vector<StateId> reachableFrom(const std::vector<StateId>& roots) const;

    /// Drop states unreachable from the initial state.
    size_t removeUnreachableStates();

    uint64_t revision() const { return revision_; }
    bool isMinimized() const { return minimized_; }
    void setMinimized(bool minimized) { minimized_ = minimized; }

    void forEachState(const std::function<void(const State&)>& fn) const;

    // ── MinimizableGraph ──
    bool contains(NodeId id) const override { return hasState(id); }
    std::string signature(NodeId id) const override;
    std::vector<std::string> transitionLabels(NodeId id) const override;
    std::optional<NodeId> transitionTarget(NodeId id, const std::string& label) const override;
    void setEquivalenceClass(NodeId id, ClassId class_id) override;

private:
    StateId next_state_id_ = 1;
    StateId initial_ = kNoState;
    StateId current_ = kNoState;
    uint64_t revision_ = 0;
    bool minimized_ = false;

    std::unordered_map<StateId, State> states_;
    std::unordered_map<std::string, StateId> by_name_;
    std::set<std::string> alphabet_;

    void rebuildAlphabet();
};

} // namespace obix
