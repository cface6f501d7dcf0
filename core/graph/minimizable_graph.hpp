#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace obix {

using NodeId = uint64_t;
using ClassId = int64_t;

/// Class id given to successors that fall outside the visited node set.
constexpr ClassId kUnknownClass = -1;

// ─── MinimizableGraph ──────────────────────────────────────────
// The view an upstream producer (parser, AST builder, state machine)
// exposes to the equivalence class computer. Nodes are addressed by
// handle; successors are shared references, never owned.

class MinimizableGraph {
public:
    virtual ~MinimizableGraph() = default;

    virtual bool contains(NodeId id) const = 0;

    /// Structural signature from intrinsic properties only.
    /// Throws StructuralError when the node cannot produce one.
    virtual std::string signature(NodeId id) const = 0;

    virtual std::vector<std::string> transitionLabels(NodeId id) const = 0;

    /// Successor handle for a label. The handle may be stale.
    virtual std::optional<NodeId> transitionTarget(NodeId id, const std::string& label) const = 0;

    virtual void setEquivalenceClass(NodeId id, ClassId class_id) = 0;
};

} // namespace obix
