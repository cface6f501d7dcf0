#include "minimizer/machine_minimizer.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"

#include <chrono>
#include <unordered_set>
#include <vector>

namespace obix {

MinimizationResult MachineMinimizer::minimize(const Machine& machine) {
    auto start = std::chrono::steady_clock::now();
    MinimizationResult result;

    if (machine.initialState() == kNoState) {
        result.machine = machine;
        for (StateId id : machine.stateIds()) result.state_mapping[id] = id;
        finishMetrics(machine, result);
        last_metrics_ = result.metrics;
        return result;
    }

    // Class ids are written into the working copy, never the caller's machine
    Machine working = machine;
    EquivalenceClassComputer computer(record_history_);
    result.equivalence = computer.compute(working, liveRoots(working));
    result.machine = buildFromClasses(working, result.equivalence, result.state_mapping);

    finishMetrics(machine, result);
    result.metrics.equivalence_class_count = result.equivalence.classCount();
    result.metrics.refinement_passes = result.equivalence.refinement_passes;
    result.metrics.processing_time_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count();
    last_metrics_ = result.metrics;

    logging::OBIX.debug("minimize: ", result.metrics.original_state_count, " -> ",
                        result.metrics.minimized_state_count, " states\n");
    return result;
}

MinimizationResult MachineMinimizer::removeUnreachable(const Machine& machine) {
    auto start = std::chrono::steady_clock::now();
    MinimizationResult result;

    auto live = machine.reachableFrom(liveRoots(machine));
    std::unordered_set<StateId> keep(live.begin(), live.end());

    result.machine = machine;
    for (StateId id : machine.stateIds()) {
        if (!keep.count(id)) result.machine.removeState(id);
    }
    for (StateId id : result.machine.stateIds()) {
        result.state_mapping[id] = id;
    }
    if (!result.machine.hasCurrentState()) {
        result.machine.reset();
    }

    finishMetrics(machine, result);
    result.metrics.equivalence_class_count = result.machine.stateCount();
    result.metrics.processing_time_ms = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count();
    last_metrics_ = result.metrics;
    return result;
}

Machine MachineMinimizer::buildFromClasses(const Machine& machine,
                                           const EquivalenceResult& classes,
                                           std::unordered_map<StateId, StateId>& mapping) {
    Machine reduced;
    mapping.clear();

    std::unordered_map<ClassId, StateId> representative;
    for (const auto& [class_id, members] : classes.classes) {
        if (members.empty()) continue;
        representative[class_id] = members.front();
        for (StateId member : members) {
            mapping[member] = members.front();
        }
    }

    // Create every state first so transitions can be wired in any order
    for (const auto& [class_id, rep_id] : representative) {
        const State* rep = machine.getState(rep_id);
        if (!rep) {
            throw OptimizationError("Representative state " + std::to_string(rep_id) +
                                    " missing from machine");
        }
        reduced.addStateWithId(rep->id, rep->name, rep->value, rep->accepting);
        State* created = reduced.getState(rep->id);
        created->equivalence_class = class_id;
        created->minimized = true;
    }

    for (const auto& [class_id, rep_id] : representative) {
        const State* rep = machine.getState(rep_id);
        for (const auto& [label, target] : rep->transitions) {
            auto it = mapping.find(target);
            if (it == mapping.end()) {
                throw OptimizationError("Transition " + rep->name + " --" + label +
                                        "--> " + std::to_string(target) +
                                        " leaves the class map");
            }
            reduced.addTransition(rep_id, label, it->second);
        }
    }

    auto initial = mapping.find(machine.initialState());
    if (initial == mapping.end()) {
        throw OptimizationError("Initial state has no equivalence class");
    }
    reduced.setInitialState(initial->second);

    auto current = mapping.find(machine.currentState());
    reduced.setCurrentState(current != mapping.end() ? current->second : initial->second);
    reduced.setMinimized(true);
    return reduced;
}

std::vector<StateId> MachineMinimizer::liveRoots(const Machine& machine) {
    std::vector<StateId> roots{machine.initialState()};
    StateId cursor = machine.currentState();
    if (machine.hasState(cursor) && cursor != machine.initialState()) {
        roots.push_back(cursor);
    }
    return roots;
}

void MachineMinimizer::finishMetrics(const Machine& original, MinimizationResult& result) {
    MinimizationMetrics& m = result.metrics;
    m.original_state_count = original.stateCount();
    m.minimized_state_count = result.machine.stateCount();
    m.original_transition_count = original.countTransitions();
    m.minimized_transition_count = result.machine.countTransitions();

    if (m.original_state_count > 0) {
        result.reduction_ratio = 1.0 - static_cast<double>(m.minimized_state_count) /
                                       static_cast<double>(m.original_state_count);
    }
    m.reduction_percentage = result.reduction_ratio * 100.0;
}

} // namespace obix
