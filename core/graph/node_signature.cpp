#include "graph/node_signature.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <sstream>
#include <utility>
#include <vector>

namespace obix {

std::string NodeSignature::compute(const Node& node) {
    if (node.type.empty()) {
        throw StructuralError(node.id, "node has empty type");
    }
    return compute(node.type, node.attributes);
}

std::string NodeSignature::compute(
    const std::string& type,
    const std::unordered_map<std::string, std::string>& attributes) {
    std::ostringstream sig;
    sig << lengthPrefixed(type) << "|" << encodeAttributes(attributes);
    return sig.str();
}

std::string NodeSignature::lengthPrefixed(const std::string& text) {
    return std::to_string(text.size()) + ":" + text;
}

std::string NodeSignature::encodeAttributes(
    const std::unordered_map<std::string, std::string>& attributes) {
    // Sort by key for deterministic output
    std::vector<std::pair<std::string, std::string>> sorted(attributes.begin(), attributes.end());
    std::sort(sorted.begin(), sorted.end());

    std::ostringstream oss;
    for (size_t i = 0; i < sorted.size(); i++) {
        if (i > 0) oss << ",";
        oss << lengthPrefixed(sorted[i].first) << "=" << lengthPrefixed(sorted[i].second);
    }
    return oss.str();
}

} // namespace obix
