#pragma once

#include <nlohmann/json.hpp>

#include "automaton/machine.hpp"

namespace obix {

/// Current version of the persisted machine record.
constexpr int kMachineFormatVersion = 1;

// Record layout:
//   { "version": 1, "initial": id, "current": id, "minimized": bool,
//     "alphabet": [label...],
//     "states": [ { "id", "name", "value", "accepting",
//                   "transitions": { label: id }, "class": id|null } ] }

void to_json(nlohmann::json& j, const State& state);
void to_json(nlohmann::json& j, const Machine& machine);

/// Throws std::runtime_error on an unknown version, and whatever
/// Machine throws on inconsistent content (duplicate ids or names,
/// transitions to missing states).
void from_json(const nlohmann::json& j, Machine& machine);

nlohmann::json machineToJson(const Machine& machine);
Machine machineFromJson(const nlohmann::json& j);

} // namespace obix
