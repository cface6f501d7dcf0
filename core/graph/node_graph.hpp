#pragma once

#include "graph/minimizable_graph.hpp"
#include "graph/node.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace obix {

// ─── NodeGraph ─────────────────────────────────────────────────
// Arena of nodes addressed by integer handle. Labeled transitions are
// stored on the source node; an incoming index keeps removal cheap.
// Cycles, self-loops and convergent paths are all legal.

class NodeGraph : public MinimizableGraph {
public:
    NodeGraph() = default;

    // ── Node operations ──
    NodeId addNode(const std::string& type);
    NodeId addNodeWithId(NodeId id, const std::string& type);

    /// Remove a node. With cascade, transitions into it are dropped too;
    /// without, they are left behind as stale handles.
    bool removeNode(NodeId id, bool cascade = true);
    Node* getNode(NodeId id);
    const Node* getNode(NodeId id) const;
    std::vector<NodeId> getNodeIds() const;
    size_t nodeCount() const { return nodes_.size(); }

    // ── Transition operations ──
    void addTransition(NodeId source, const std::string& label, NodeId target);
    bool removeTransition(NodeId source, const std::string& label);
    size_t transitionCount() const;
    std::vector<NodeId> getPredecessors(NodeId id) const;

    // ── MinimizableGraph ──
    bool contains(NodeId id) const override { return nodes_.count(id) > 0; }
    std::string signature(NodeId id) const override;
    std::vector<std::string> transitionLabels(NodeId id) const override;
    std::optional<NodeId> transitionTarget(NodeId id, const std::string& label) const override;
    void setEquivalenceClass(NodeId id, ClassId class_id) override;

    /// Forget every assigned class id.
    void clearEquivalenceClasses();

    NodeGraph clone() const;

    void forEachNode(const std::function<void(const Node&)>& fn) const;

private:
    NodeId next_node_id_ = 1;

    std::unordered_map<NodeId, Node> nodes_;

    // target → sources with at least one transition into it
    std::unordered_map<NodeId, std::unordered_set<NodeId>> incoming_;
};

} // namespace obix
