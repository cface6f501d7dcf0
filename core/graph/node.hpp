#pragma once

#include "graph/minimizable_graph.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>

namespace obix {

/// A vertex of an upstream node graph (AST element, parse state, ...).
/// Kind and attributes make up its structural signature; transitions are
/// labeled handles into the owning NodeGraph.
struct Node {
    NodeId id = 0;
    std::string type;
    std::unordered_map<std::string, std::string> attributes;
    std::map<std::string, NodeId> transitions;
    std::optional<ClassId> equivalence_class;

    Node() = default;
    Node(NodeId id, std::string type)
        : id(id), type(std::move(type)) {}

    void setAttribute(const std::string& key, const std::string& value) {
        attributes[key] = value;
    }

    std::string getAttribute(const std::string& key, const std::string& default_val = "") const {
        auto it = attributes.find(key);
        return it != attributes.end() ? it->second : default_val;
    }

    bool hasAttribute(const std::string& key) const {
        return attributes.count(key) > 0;
    }
};

} // namespace obix
