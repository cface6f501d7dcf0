#pragma once

#include "automaton/machine.hpp"
#include "equivalence/equivalence_class_computer.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace obix {

/// Verification result for a single check.
struct VerificationResult {
    bool passed = false;
    std::string check_name;
    std::string message;
    uint64_t node_id = 0;  // 0 = machine-level
};

bool allPassed(const std::vector<VerificationResult>& results);

/// Machine Checker: structural integrity of a machine.
/// Initial state exists, cursor is a member, no dangling transitions.
class MachineChecker {
public:
    std::vector<VerificationResult> check(const Machine& machine) const;
};

/// Partition Checker: properties of a computed class map.
class PartitionChecker {
public:
    /// Structural induction: members of a class share the signature and
    /// the label set, and their successors share a class.
    std::vector<VerificationResult> checkSoundness(const MinimizableGraph& graph,
                                                   const EquivalenceResult& result) const;

    /// Every class of `finer` lies inside a single class of `coarser`.
    std::vector<VerificationResult> checkRefinement(
        const std::unordered_map<NodeId, ClassId>& coarser,
        const std::unordered_map<NodeId, ClassId>& finer) const;
};

} // namespace obix
