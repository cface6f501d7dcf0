#pragma once

#include "graph/node.hpp"

#include <string>
#include <unordered_map>

namespace obix {

// ─── Node Signature ────────────────────────────────────────────
// Structural fingerprint of a single node from its intrinsic
// properties: kind plus the sorted attribute set. Transitions are
// never part of it; the equivalence class computer refines on those.
//
// Format: "<n>:<type>|<n>:<key>=<n>:<value>,..." where each <n> is the
// byte length of the component after it, so delimiters inside a type,
// key or value can never make two different nodes read alike.

class NodeSignature {
public:
    /// Throws StructuralError if the node has no type.
    static std::string compute(const Node& node);

    static std::string compute(const std::string& type,
                               const std::unordered_map<std::string, std::string>& attributes);

private:
    static std::string lengthPrefixed(const std::string& text);
    static std::string encodeAttributes(
        const std::unordered_map<std::string, std::string>& attributes);
};

} // namespace obix
