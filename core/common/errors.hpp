#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace obix {

// ─── Error Taxonomy ────────────────────────────────────────────
// Every error raised by the automaton core derives from AutomatonError.
//
// StructuralError            malformed node during signature/traversal.
//                            The node is excluded, the computation goes on.
// NoCurrentStateError        transition() on a machine without a cursor.
// UndefinedTransitionError   no mapping for the label from the cursor.
// CompiledDispatchStaleError compiled target no longer in the machine.
//                            Never leaves OptimizedMachine.

class AutomatonError : public std::runtime_error {
public:
    explicit AutomatonError(const std::string& what) : std::runtime_error(what) {}
};

class StructuralError : public AutomatonError {
public:
    StructuralError(uint64_t node_id, const std::string& what)
        : AutomatonError("Structural error at node " + std::to_string(node_id) + ": " + what),
          node_id_(node_id) {}

    uint64_t nodeId() const { return node_id_; }

private:
    uint64_t node_id_;
};

class NoCurrentStateError : public AutomatonError {
public:
    NoCurrentStateError() : AutomatonError("No current state set.") {}
};

class UndefinedTransitionError : public AutomatonError {
public:
    UndefinedTransitionError(const std::string& label, const std::string& state_name)
        : AutomatonError("No transition defined for symbol '" + label +
                         "' from current state '" + state_name + "'."),
          label_(label), state_name_(state_name) {}

    const std::string& label() const { return label_; }
    const std::string& stateName() const { return state_name_; }

private:
    std::string label_;
    std::string state_name_;
};

class CompiledDispatchStaleError : public AutomatonError {
public:
    CompiledDispatchStaleError(uint64_t source, const std::string& label, uint64_t target)
        : AutomatonError("Compiled transition " + std::to_string(source) + ":" + label +
                         " -> " + std::to_string(target) + " is stale") {}
};

/// Raised when an optimization pass produces an inconsistent machine.
/// Caught by the pass driver; the previous machine stays in place.
class OptimizationError : public AutomatonError {
public:
    explicit OptimizationError(const std::string& what) : AutomatonError(what) {}
};

} // namespace obix
