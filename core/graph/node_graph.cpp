#include "graph/node_graph.hpp"
#include "graph/node_signature.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <stdexcept>

namespace obix {

// ─── Node operations ───────────────────────────────────────────

NodeId NodeGraph::addNode(const std::string& type) {
    NodeId id = next_node_id_++;
    nodes_.emplace(id, Node(id, type));
    return id;
}

NodeId NodeGraph::addNodeWithId(NodeId id, const std::string& type) {
    if (id == 0) {
        throw std::runtime_error("Node ID 0 is reserved");
    }
    if (nodes_.count(id)) {
        throw std::runtime_error("Node ID already exists: " + std::to_string(id));
    }
    nodes_.emplace(id, Node(id, type));
    if (id >= next_node_id_) {
        next_node_id_ = id + 1;
    }
    return id;
}

bool NodeGraph::removeNode(NodeId id, bool cascade) {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) return false;

    // Our own outgoing transitions no longer count as incoming elsewhere
    for (const auto& [label, target] : it->second.transitions) {
        auto in = incoming_.find(target);
        if (in != incoming_.end()) in->second.erase(id);
    }

    if (cascade) {
        auto in = incoming_.find(id);
        if (in != incoming_.end()) {
            for (NodeId source : in->second) {
                Node* src = getNode(source);
                if (!src) continue;
                for (auto t = src->transitions.begin(); t != src->transitions.end();) {
                    if (t->second == id) t = src->transitions.erase(t);
                    else ++t;
                }
            }
        }
        incoming_.erase(id);
    }

    nodes_.erase(it);
    return true;
}

Node* NodeGraph::getNode(NodeId id) {
    auto it = nodes_.find(id);
    return it != nodes_.end() ? &it->second : nullptr;
}

const Node* NodeGraph::getNode(NodeId id) const {
    auto it = nodes_.find(id);
    return it != nodes_.end() ? &it->second : nullptr;
}

std::vector<NodeId> NodeGraph::getNodeIds() const {
    std::vector<NodeId> ids;
    ids.reserve(nodes_.size());
    for (const auto& [id, _] : nodes_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

// ─── Transition operations ────────────────────────────────────

void NodeGraph::addTransition(NodeId source, const std::string& label, NodeId target) {
    Node* src = getNode(source);
    if (!src)
        throw std::runtime_error("Source node not found: " + std::to_string(source));
    if (!nodes_.count(target))
        throw std::runtime_error("Target node not found: " + std::to_string(target));

    auto existing = src->transitions.find(label);
    if (existing != src->transitions.end()) {
        NodeId old_target = existing->second;
        existing->second = target;
        // Drop the old incoming entry unless another label still points there
        bool still_linked = false;
        for (const auto& [l, t] : src->transitions) {
            if (t == old_target) { still_linked = true; break; }
        }
        if (!still_linked) incoming_[old_target].erase(source);
    } else {
        src->transitions.emplace(label, target);
    }
    incoming_[target].insert(source);
}

bool NodeGraph::removeTransition(NodeId source, const std::string& label) {
    Node* src = getNode(source);
    if (!src) return false;
    auto it = src->transitions.find(label);
    if (it == src->transitions.end()) return false;

    NodeId target = it->second;
    src->transitions.erase(it);
    for (const auto& [l, t] : src->transitions) {
        if (t == target) return true;
    }
    incoming_[target].erase(source);
    return true;
}

size_t NodeGraph::transitionCount() const {
    size_t count = 0;
    for (const auto& [_, node] : nodes_) {
        count += node.transitions.size();
    }
    return count;
}

std::vector<NodeId> NodeGraph::getPredecessors(NodeId id) const {
    auto it = incoming_.find(id);
    if (it == incoming_.end()) return {};
    std::vector<NodeId> result(it->second.begin(), it->second.end());
    std::sort(result.begin(), result.end());
    return result;
}

// ─── MinimizableGraph ─────────────────────────────────────────

std::string NodeGraph::signature(NodeId id) const {
    const Node* node = getNode(id);
    if (!node) {
        throw StructuralError(id, "node is not part of the graph");
    }
    return NodeSignature::compute(*node);
}

std::vector<std::string> NodeGraph::transitionLabels(NodeId id) const {
    std::vector<std::string> labels;
    const Node* node = getNode(id);
    if (!node) return labels;
    labels.reserve(node->transitions.size());
    for (const auto& [label, _] : node->transitions) {
        labels.push_back(label);
    }
    return labels;
}

std::optional<NodeId> NodeGraph::transitionTarget(NodeId id, const std::string& label) const {
    const Node* node = getNode(id);
    if (!node) return std::nullopt;
    auto it = node->transitions.find(label);
    if (it == node->transitions.end()) return std::nullopt;
    return it->second;
}

void NodeGraph::setEquivalenceClass(NodeId id, ClassId class_id) {
    Node* node = getNode(id);
    if (node) node->equivalence_class = class_id;
}

void NodeGraph::clearEquivalenceClasses() {
    for (auto& [_, node] : nodes_) {
        node.equivalence_class.reset();
    }
}

// ─── Cloning ───────────────────────────────────────────────────

NodeGraph NodeGraph::clone() const {
    NodeGraph copy;
    copy.next_node_id_ = next_node_id_;
    copy.nodes_ = nodes_;
    copy.incoming_ = incoming_;
    return copy;
}

// ─── Iteration ─────────────────────────────────────────────────

void NodeGraph::forEachNode(const std::function<void(const Node&)>& fn) const {
    for (NodeId id : getNodeIds()) {
        fn(nodes_.at(id));
    }
}

} // namespace obix
