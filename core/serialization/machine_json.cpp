#include "serialization/machine_json.hpp"

#include <stdexcept>
#include <string>

namespace obix {

void to_json(nlohmann::json& j, const State& state) {
    j = nlohmann::json{
        {"id", state.id},
        {"name", state.name},
        {"value", state.value},
        {"accepting", state.accepting},
        {"transitions", state.transitions},
    };
    if (state.equivalence_class) {
        j["class"] = *state.equivalence_class;
    } else {
        j["class"] = nullptr;
    }
}

void to_json(nlohmann::json& j, const Machine& machine) {
    nlohmann::json states = nlohmann::json::array();
    machine.forEachState([&states](const State& s) { states.push_back(s); });

    j = nlohmann::json{
        {"version", kMachineFormatVersion},
        {"initial", machine.initialState()},
        {"current", machine.currentState()},
        {"minimized", machine.isMinimized()},
        {"alphabet", machine.alphabet()},
        {"states", std::move(states)},
    };
}

void from_json(const nlohmann::json& j, Machine& machine) {
    int version = j.at("version").get<int>();
    if (version != kMachineFormatVersion) {
        throw std::runtime_error("Unsupported machine format version: " +
                                 std::to_string(version));
    }

    Machine result;
    const auto& states = j.at("states");
    for (const auto& s : states) {
        result.addStateWithId(s.at("id").get<StateId>(),
                              s.at("name").get<std::string>(),
                              s.value("value", std::string()),
                              s.value("accepting", false));
    }

    // Second sweep: every target exists by now
    for (const auto& s : states) {
        StateId id = s.at("id").get<StateId>();
        for (const auto& [label, target] : s.at("transitions").items()) {
            result.addTransition(id, label, target.get<StateId>());
        }
        if (s.contains("class") && !s.at("class").is_null()) {
            result.setEquivalenceClass(id, s.at("class").get<ClassId>());
        }
    }

    StateId initial = j.value("initial", kNoState);
    if (initial != kNoState) result.setInitialState(initial);
    result.setCurrentState(j.value("current", initial));
    result.setMinimized(j.value("minimized", false));

    machine = std::move(result);
}

nlohmann::json machineToJson(const Machine& machine) {
    return nlohmann::json(machine);
}

Machine machineFromJson(const nlohmann::json& j) {
    return j.get<Machine>();
}

} // namespace obix
