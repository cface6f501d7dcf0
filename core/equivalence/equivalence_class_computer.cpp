#include "equivalence/equivalence_class_computer.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"

#include <algorithm>
#include <unordered_set>

namespace obix {

ClassId EquivalenceResult::classOf(NodeId id) const {
    auto it = class_of.find(id);
    return it != class_of.end() ? it->second : kUnknownClass;
}

bool EquivalenceResult::sameClass(NodeId a, NodeId b) const {
    ClassId ca = classOf(a);
    return ca != kUnknownClass && ca == classOf(b);
}

EquivalenceResult EquivalenceClassComputer::computeEquivalenceClasses(
    MinimizableGraph& graph, NodeId root, bool record_history) {
    EquivalenceClassComputer computer(record_history);
    return computer.compute(graph, root);
}

EquivalenceResult EquivalenceClassComputer::compute(MinimizableGraph& graph, NodeId root) {
    return compute(graph, std::vector<NodeId>{root});
}

EquivalenceResult EquivalenceClassComputer::compute(MinimizableGraph& graph,
                                                    const std::vector<NodeId>& roots) {
    EquivalenceResult result;
    next_class_id_ = 0;

    std::vector<NodeId> present;
    for (NodeId root : roots) {
        if (graph.contains(root)) present.push_back(root);
    }
    if (present.empty()) {
        return result;
    }

    std::unordered_map<NodeId, std::string> signatures;
    collectNodes(graph, present, result, signatures);
    initialPartition(signatures, result);

    // Bounded by |V|; the guard only protects against a graph that
    // changes underneath us
    size_t max_passes = result.visited_count + 1;
    while (result.refinement_passes < max_passes) {
        result.refinement_passes++;
        if (!refinePartitions(graph, result)) break;
    }

    for (const auto& [id, class_id] : result.class_of) {
        graph.setEquivalenceClass(id, class_id);
    }

    logging::OBIX.debug("equivalence: ", result.visit_order.size(), " nodes, ",
                        result.classCount(), " classes, ",
                        result.refinement_passes, " passes\n");
    return result;
}

// ─── Reachability ──────────────────────────────────────────────

void EquivalenceClassComputer::collectNodes(
    const MinimizableGraph& graph, const std::vector<NodeId>& roots, EquivalenceResult& result,
    std::unordered_map<NodeId, std::string>& signatures) const {
    std::unordered_set<NodeId> visited;
    // First root on top, so discovery order follows the order of roots
    std::vector<NodeId> stack(roots.rbegin(), roots.rend());

    while (!stack.empty()) {
        NodeId id = stack.back();
        stack.pop_back();
        if (!visited.insert(id).second) continue;

        try {
            signatures.emplace(id, graph.signature(id));
            result.visit_order.push_back(id);
        } catch (const StructuralError& e) {
            result.errors.push_back({id, e.what()});
            logging::OBIX.warn(e.what(), "\n");
        }

        // Successors of an excluded node are still classified on their own
        auto labels = graph.transitionLabels(id);
        for (auto it = labels.rbegin(); it != labels.rend(); ++it) {
            auto next = graph.transitionTarget(id, *it);
            if (next && graph.contains(*next) && !visited.count(*next)) {
                stack.push_back(*next);
            }
        }
    }
    result.visited_count = visited.size();
}

// ─── Initial partition ─────────────────────────────────────────

void EquivalenceClassComputer::initialPartition(
    const std::unordered_map<NodeId, std::string>& signatures, EquivalenceResult& result) {
    std::unordered_map<std::string, ClassId> signature_to_class;

    for (NodeId id : result.visit_order) {
        const std::string& sig = signatures.at(id);
        auto it = signature_to_class.find(sig);
        ClassId class_id;
        if (it != signature_to_class.end()) {
            class_id = it->second;
        } else {
            class_id = next_class_id_++;
            signature_to_class.emplace(sig, class_id);
        }
        result.class_of[id] = class_id;
        result.classes[class_id].push_back(id);
    }

    if (record_history_) {
        result.history.push_back(result.class_of);
    }
}

// ─── Refinement ────────────────────────────────────────────────

EquivalenceClassComputer::TransitionSignature EquivalenceClassComputer::transitionSignature(
    const MinimizableGraph& graph, NodeId node,
    const std::unordered_map<NodeId, ClassId>& class_of) const {
    TransitionSignature sig;
    for (const auto& label : graph.transitionLabels(node)) {
        auto target = graph.transitionTarget(node, label);
        if (!target) continue;
        auto it = class_of.find(*target);
        sig.emplace_back(label, it != class_of.end() ? it->second : kUnknownClass);
    }
    std::sort(sig.begin(), sig.end());
    return sig;
}

bool EquivalenceClassComputer::refinePartitions(const MinimizableGraph& graph,
                                                EquivalenceResult& result) {
    // Signatures read the partition as it stood when the pass began
    const std::unordered_map<NodeId, ClassId> before = result.class_of;
    std::map<ClassId, std::vector<NodeId>> refined;
    bool changed = false;

    for (const auto& [class_id, members] : result.classes) {
        if (members.size() <= 1) {
            refined[class_id] = members;
            continue;
        }

        std::map<TransitionSignature, size_t> group_index;
        std::vector<std::vector<NodeId>> groups;
        for (NodeId id : members) {
            auto sig = transitionSignature(graph, id, before);
            auto it = group_index.find(sig);
            if (it == group_index.end()) {
                group_index.emplace(std::move(sig), groups.size());
                groups.push_back({id});
            } else {
                groups[it->second].push_back(id);
            }
        }

        refined[class_id] = groups[0];
        for (size_t g = 1; g < groups.size(); g++) {
            ClassId fresh = next_class_id_++;
            for (NodeId id : groups[g]) {
                result.class_of[id] = fresh;
            }
            refined[fresh] = std::move(groups[g]);
            changed = true;
        }
    }

    result.classes = std::move(refined);
    if (changed && record_history_) {
        result.history.push_back(result.class_of);
    }
    return changed;
}

} // namespace obix
