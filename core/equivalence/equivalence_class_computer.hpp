#pragma once

#include "graph/minimizable_graph.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace obix {

/// A node that could not be classified and was left out of the class map.
struct StructuralIssue {
    NodeId node_id = 0;
    std::string message;
};

/// Outcome of one equivalence class computation.
struct EquivalenceResult {
    std::unordered_map<NodeId, ClassId> class_of;
    std::map<ClassId, std::vector<NodeId>> classes;  // members in discovery order
    std::vector<NodeId> visit_order;                 // classified nodes only
    size_t visited_count = 0;                        // including excluded nodes
    size_t refinement_passes = 0;
    std::vector<StructuralIssue> errors;

    /// Partition after the initial grouping and after every splitting
    /// pass. Only filled when history recording is on.
    std::vector<std::unordered_map<NodeId, ClassId>> history;

    size_t classCount() const { return classes.size(); }
    ClassId classOf(NodeId id) const;
    bool sameClass(NodeId a, NodeId b) const;
};

// ─── Equivalence Class Computer ────────────────────────────────
// Moore-style partition refinement over any MinimizableGraph:
//
//   1. collect every node reachable from the roots (explicit stack,
//      visited set, so cycles and self-loops terminate)
//   2. seed one class per distinct structural signature
//   3. split each class by the sorted (label, successor class) list
//      of its members; the first group keeps the class id
//   4. repeat until a full pass splits nothing
//   5. write the final class ids back into the graph
//
// Classes only ever split, so at most |V| passes are needed.

class EquivalenceClassComputer {
public:
    using TransitionSignature = std::vector<std::pair<std::string, ClassId>>;

    explicit EquivalenceClassComputer(bool record_history = false)
        : record_history_(record_history) {}

    EquivalenceResult compute(MinimizableGraph& graph, NodeId root);

    /// Classify everything reachable from any of `roots`. Roots that
    /// are not part of the graph are skipped.
    EquivalenceResult compute(MinimizableGraph& graph, const std::vector<NodeId>& roots);

    static EquivalenceResult computeEquivalenceClasses(MinimizableGraph& graph, NodeId root,
                                                       bool record_history = false);

private:
    bool record_history_;
    ClassId next_class_id_ = 0;

    void collectNodes(const MinimizableGraph& graph, const std::vector<NodeId>& roots,
                      EquivalenceResult& result,
                      std::unordered_map<NodeId, std::string>& signatures) const;

    void initialPartition(const std::unordered_map<NodeId, std::string>& signatures,
                          EquivalenceResult& result);

    /// One refinement pass. Returns true if any class was split.
    bool refinePartitions(const MinimizableGraph& graph, EquivalenceResult& result);

    TransitionSignature transitionSignature(const MinimizableGraph& graph, NodeId node,
                                            const std::unordered_map<NodeId, ClassId>& class_of) const;
};

} // namespace obix
