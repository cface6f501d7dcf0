#include "verification/verification.hpp"
#include "common/errors.hpp"

#include <set>

namespace obix {

bool allPassed(const std::vector<VerificationResult>& results) {
    for (const auto& r : results) {
        if (!r.passed) return false;
    }
    return true;
}

// ─── Machine Checker ───────────────────────────────────────────

std::vector<VerificationResult> MachineChecker::check(const Machine& machine) const {
    std::vector<VerificationResult> results;

    if (machine.stateCount() > 0 && !machine.hasState(machine.initialState())) {
        results.push_back({false, "initial_state_exists",
            "Initial state " + std::to_string(machine.initialState()) + " is not a member", 0});
    }

    if (machine.hasCurrentState() && !machine.hasState(machine.currentState())) {
        results.push_back({false, "current_state_valid",
            "Cursor " + std::to_string(machine.currentState()) + " is not a member", 0});
    }

    machine.forEachState([&](const State& state) {
        if (state.name.empty()) {
            results.push_back({false, "state_has_name",
                "State " + std::to_string(state.id) + " has empty name", state.id});
        }
        for (const auto& [label, target] : state.transitions) {
            if (!machine.hasState(target)) {
                results.push_back({false, "transition_target_exists",
                    "State " + state.name + " --" + label + "--> " +
                    std::to_string(target) + " is dangling", state.id});
            }
        }
    });

    // If no failures, add a passing result
    if (results.empty()) {
        results.push_back({true, "machine_check", "All machine checks passed", 0});
    }

    return results;
}

// ─── Partition Checker ─────────────────────────────────────────

std::vector<VerificationResult> PartitionChecker::checkSoundness(
    const MinimizableGraph& graph, const EquivalenceResult& result) const {
    std::vector<VerificationResult> results;

    for (const auto& [class_id, members] : result.classes) {
        if (members.size() <= 1) continue;
        NodeId first = members.front();
        std::string first_sig;
        try {
            first_sig = graph.signature(first);
        } catch (const StructuralError& e) {
            results.push_back({false, "member_has_signature", e.what(), first});
            continue;
        }
        auto first_labels = graph.transitionLabels(first);
        std::set<std::string> label_set(first_labels.begin(), first_labels.end());

        for (size_t i = 1; i < members.size(); i++) {
            NodeId other = members[i];
            std::string other_sig;
            try {
                other_sig = graph.signature(other);
            } catch (const StructuralError& e) {
                results.push_back({false, "member_has_signature", e.what(), other});
                continue;
            }
            if (other_sig != first_sig) {
                results.push_back({false, "class_signature_uniform",
                    "Class " + std::to_string(class_id) + " mixes signatures", other});
                continue;
            }

            auto labels = graph.transitionLabels(other);
            std::set<std::string> other_set(labels.begin(), labels.end());
            if (other_set != label_set) {
                results.push_back({false, "class_labels_uniform",
                    "Class " + std::to_string(class_id) + " mixes label sets", other});
                continue;
            }

            for (const auto& label : label_set) {
                auto a = graph.transitionTarget(first, label);
                auto b = graph.transitionTarget(other, label);
                if (!a || !b || result.classOf(*a) != result.classOf(*b)) {
                    results.push_back({false, "class_successors_equivalent",
                        "Class " + std::to_string(class_id) + " splits on label '" +
                        label + "'", other});
                }
            }
        }
    }

    if (results.empty()) {
        results.push_back({true, "partition_soundness", "Partition is sound", 0});
    }
    return results;
}

std::vector<VerificationResult> PartitionChecker::checkRefinement(
    const std::unordered_map<NodeId, ClassId>& coarser,
    const std::unordered_map<NodeId, ClassId>& finer) const {
    std::vector<VerificationResult> results;
    std::unordered_map<ClassId, ClassId> parent;

    for (const auto& [node, fine_class] : finer) {
        auto it = coarser.find(node);
        if (it == coarser.end()) {
            results.push_back({false, "refinement_covers",
                "Node " + std::to_string(node) + " missing from coarser partition", node});
            continue;
        }
        auto [p, inserted] = parent.emplace(fine_class, it->second);
        if (!inserted && p->second != it->second) {
            results.push_back({false, "refinement_nested",
                "Class " + std::to_string(fine_class) + " spans two coarser classes", node});
        }
    }

    if (results.empty()) {
        results.push_back({true, "partition_refinement", "Partition refines its predecessor", 0});
    }
    return results;
}

} // namespace obix
