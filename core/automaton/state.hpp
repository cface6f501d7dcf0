#pragma once

#include "graph/minimizable_graph.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace obix {

using StateId = uint64_t;

/// Cursor value of a machine that has no active state.
constexpr StateId kNoState = 0;

/// A state of a finite-state machine: identity, payload, acceptance and
/// labeled transitions to other states of the same machine (by id).
struct State {
    StateId id = 0;
    std::string name;
    std::string value;
    bool accepting = false;
    std::map<std::string, StateId> transitions;
    std::optional<ClassId> equivalence_class;
    bool minimized = false;

    State() = default;
    State(StateId id, std::string name, std::string value = "", bool accepting = false)
        : id(id), name(std::move(name)), value(std::move(value)), accepting(accepting) {}

    std::optional<StateId> nextState(const std::string& label) const {
        auto it = transitions.find(label);
        if (it == transitions.end()) return std::nullopt;
        return it->second;
    }

    bool hasTransition(const std::string& label) const {
        return transitions.count(label) > 0;
    }
};

} // namespace obix
