#include "automaton/machine.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <deque>
#include <stdexcept>
#include <unordered_set>

namespace obix {

Machine::Machine(const std::string& initial_name) {
    StateId id = addState(initial_name);
    setInitialState(id);
}

// ─── States ────────────────────────────────────────────────────

StateId Machine::addState(const std::string& name, const std::string& value, bool accepting) {
    return addStateWithId(next_state_id_, name, value, accepting);
}

StateId Machine::addStateWithId(StateId id, const std::string& name,
                                const std::string& value, bool accepting) {
    if (id == kNoState) {
        throw std::runtime_error("State ID 0 is reserved");
    }
    if (states_.count(id)) {
        throw std::runtime_error("State ID already exists: " + std::to_string(id));
    }
    if (by_name_.count(name)) {
        throw std::runtime_error("State with ID '" + name + "' already exists.");
    }

    states_.emplace(id, State(id, name, value, accepting));
    by_name_.emplace(name, id);
    if (id >= next_state_id_) {
        next_state_id_ = id + 1;
    }
    if (initial_ == kNoState) {
        initial_ = id;
        current_ = id;
    }
    revision_++;
    return id;
}

bool Machine::removeState(StateId id) {
    auto it = states_.find(id);
    if (it == states_.end()) return false;

    by_name_.erase(it->second.name);
    states_.erase(it);

    // Drop every transition into the removed state
    for (auto& [_, state] : states_) {
        for (auto t = state.transitions.begin(); t != state.transitions.end();) {
            if (t->second == id) t = state.transitions.erase(t);
            else ++t;
        }
    }

    if (initial_ == id) initial_ = kNoState;
    if (current_ == id) current_ = initial_;
    rebuildAlphabet();
    revision_++;
    return true;
}

State* Machine::getState(StateId id) {
    auto it = states_.find(id);
    return it != states_.end() ? &it->second : nullptr;
}

const State* Machine::getState(StateId id) const {
    auto it = states_.find(id);
    return it != states_.end() ? &it->second : nullptr;
}

std::optional<StateId> Machine::findState(const std::string& name) const {
    auto it = by_name_.find(name);
    if (it == by_name_.end()) return std::nullopt;
    return it->second;
}

std::vector<StateId> Machine::stateIds() const {
    std::vector<StateId> ids;
    ids.reserve(states_.size());
    for (const auto& [id, _] : states_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

void Machine::setAccepting(StateId id, bool accepting) {
    State* state = getState(id);
    if (!state) throw std::runtime_error("State not found: " + std::to_string(id));
    state->accepting = accepting;
    revision_++;
}

void Machine::setValue(StateId id, const std::string& value) {
    State* state = getState(id);
    if (!state) throw std::runtime_error("State not found: " + std::to_string(id));
    state->value = value;
    revision_++;
}

// ─── Transitions ───────────────────────────────────────────────

void Machine::addTransition(StateId from, const std::string& label, StateId to) {
    State* source = getState(from);
    if (!source) {
        throw std::runtime_error("Source state '" + std::to_string(from) + "' not found.");
    }
    if (!hasState(to)) {
        throw std::runtime_error("Target state '" + std::to_string(to) + "' not found.");
    }
    source->transitions[label] = to;
    alphabet_.insert(label);
    revision_++;
}

void Machine::addTransitionByName(const std::string& from, const std::string& label,
                                  const std::string& to) {
    auto source = findState(from);
    if (!source) throw std::runtime_error("Source state '" + from + "' not found.");
    auto target_id = findState(to);
    if (!target_id) throw std::runtime_error("Target state '" + to + "' not found.");
    addTransition(*source, label, *target_id);
}

bool Machine::removeTransition(StateId from, const std::string& label) {
    State* source = getState(from);
    if (!source || source->transitions.erase(label) == 0) return false;
    rebuildAlphabet();
    revision_++;
    return true;
}

std::optional<StateId> Machine::target(StateId from, const std::string& label) const {
    const State* source = getState(from);
    if (!source) return std::nullopt;
    return source->nextState(label);
}

size_t Machine::countTransitions() const {
    size_t count = 0;
    for (const auto& [_, state] : states_) {
        count += state.transitions.size();
    }
    return count;
}

void Machine::rebuildAlphabet() {
    alphabet_.clear();
    for (const auto& [_, state] : states_) {
        for (const auto& [label, __] : state.transitions) {
            alphabet_.insert(label);
        }
    }
}

// ─── Cursor ────────────────────────────────────────────────────

void Machine::setInitialState(StateId id) {
    if (!hasState(id)) {
        throw std::runtime_error("State with ID '" + std::to_string(id) + "' not found.");
    }
    initial_ = id;
    current_ = id;
}

void Machine::setCurrentState(StateId id) {
    if (id != kNoState && !hasState(id)) {
        throw std::runtime_error("State with ID '" + std::to_string(id) + "' not found.");
    }
    current_ = id;
}

void Machine::resetToState(const std::string& name) {
    auto id = findState(name);
    if (!id) {
        throw std::runtime_error("State with ID '" + name + "' not found.");
    }
    current_ = *id;
}

const State& Machine::transition(const std::string& label) {
    const State* current = getState(current_);
    if (!current) {
        throw NoCurrentStateError();
    }

    auto next = current->nextState(label);
    if (!next || !hasState(*next)) {
        throw UndefinedTransitionError(label, current->name);
    }

    current_ = *next;
    return states_.at(current_);
}

const State& Machine::processSequence(const std::vector<std::string>& labels) {
    reset();
    if (!hasCurrentState()) {
        throw NoCurrentStateError();
    }
    for (const auto& label : labels) {
        transition(label);
    }
    return states_.at(current_);
}

bool Machine::accepts(const std::vector<std::string>& labels) {
    try {
        return processSequence(labels).accepting;
    } catch (const AutomatonError&) {
        return false;
    }
}

// ─── Reachability ──────────────────────────────────────────────

std::vector<StateId> Machine::reachableStates() const {
    return reachableFrom({initial_});
}

std::vector<StateId> Machine::reachableFrom(const std::vector<StateId>& roots) const {
    std::vector<StateId> order;
    std::unordered_set<StateId> seen;
    std::deque<StateId> queue;
    for (StateId root : roots) {
        if (hasState(root) && seen.insert(root).second) {
            queue.push_back(root);
        }
    }

    while (!queue.empty()) {
        StateId id = queue.front();
        queue.pop_front();
        order.push_back(id);

        for (const auto& [label, next] : states_.at(id).transitions) {
            if (hasState(next) && seen.insert(next).second) {
                queue.push_back(next);
            }
        }
    }
    return order;
}

size_t Machine::removeUnreachableStates() {
    auto reachable = reachableStates();
    std::unordered_set<StateId> keep(reachable.begin(), reachable.end());

    std::vector<StateId> doomed;
    for (const auto& [id, _] : states_) {
        if (!keep.count(id)) doomed.push_back(id);
    }
    for (StateId id : doomed) {
        removeState(id);
    }
    return doomed.size();
}

void Machine::forEachState(const std::function<void(const State&)>& fn) const {
    for (StateId id : stateIds()) {
        fn(states_.at(id));
    }
}

// ─── MinimizableGraph ─────────────────────────────────────────

std::string Machine::signature(NodeId id) const {
    const State* state = getState(id);
    if (!state) {
        throw StructuralError(id, "state is not part of the machine");
    }
    return std::string(state->accepting ? "accept" : "reject") + "|" + state->value;
}

std::vector<std::string> Machine::transitionLabels(NodeId id) const {
    std::vector<std::string> labels;
    const State* state = getState(id);
    if (!state) return labels;
    for (const auto& [label, _] : state->transitions) {
        labels.push_back(label);
    }
    return labels;
}

std::optional<NodeId> Machine::transitionTarget(NodeId id, const std::string& label) const {
    return target(id, label);
}

void Machine::setEquivalenceClass(NodeId id, ClassId class_id) {
    State* state = getState(id);
    if (state) state->equivalence_class = class_id;
}

} // namespace obix
