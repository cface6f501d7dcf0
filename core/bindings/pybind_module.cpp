// PyBind11 bindings for the OBIX automaton core.
// Exposes NodeGraph, Machine, minimization, the transition cache and the
// runtime optimizer to Python.

// NOTE: Requires pybind11 to be installed.
// Build with: cmake -DBUILD_PYTHON_BINDINGS=ON

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>
#include <pybind11/chrono.h>

#include "automaton/machine.hpp"
#include "cache/transition_cache.hpp"
#include "common/config.hpp"
#include "common/errors.hpp"
#include "equivalence/equivalence_class_computer.hpp"
#include "graph/node_graph.hpp"
#include "minimizer/machine_minimizer.hpp"
#include "runtime/optimized_machine.hpp"
#include "serialization/machine_json.hpp"
#include "verification/verification.hpp"

#include <nlohmann/json.hpp>

namespace py = pybind11;

PYBIND11_MODULE(obix_bindings, m) {
    m.doc() = "OBIX automaton core bindings";

    // ── Errors ──
    auto automaton_error = py::register_exception<obix::AutomatonError>(m, "AutomatonError");
    py::register_exception<obix::NoCurrentStateError>(m, "NoCurrentStateError", automaton_error);
    py::register_exception<obix::UndefinedTransitionError>(m, "UndefinedTransitionError",
                                                           automaton_error);
    py::register_exception<obix::StructuralError>(m, "StructuralError", automaton_error);

    // ── Enums ──
    py::enum_<obix::CacheStrategy>(m, "CacheStrategy")
        .value("LRU", obix::CacheStrategy::LRU)
        .value("FREQUENCY", obix::CacheStrategy::FREQUENCY)
        .value("HYBRID", obix::CacheStrategy::HYBRID);

    py::enum_<obix::OptimizationLevel>(m, "OptimizationLevel")
        .value("MINIMAL", obix::OptimizationLevel::MINIMAL)
        .value("STANDARD", obix::OptimizationLevel::STANDARD)
        .value("AGGRESSIVE", obix::OptimizationLevel::AGGRESSIVE)
        .value("MAXIMUM", obix::OptimizationLevel::MAXIMUM);

    // ── Node ──
    py::class_<obix::Node>(m, "Node")
        .def(py::init<>())
        .def(py::init<uint64_t, std::string>())
        .def_readwrite("id", &obix::Node::id)
        .def_readwrite("type", &obix::Node::type)
        .def_readwrite("transitions", &obix::Node::transitions)
        .def_readwrite("equivalence_class", &obix::Node::equivalence_class)
        .def("set_attribute", &obix::Node::setAttribute)
        .def("get_attribute", &obix::Node::getAttribute,
             py::arg("key"), py::arg("default_val") = "")
        .def("has_attribute", &obix::Node::hasAttribute);

    // ── NodeGraph ──
    py::class_<obix::NodeGraph>(m, "NodeGraph")
        .def(py::init<>())
        .def("add_node", &obix::NodeGraph::addNode)
        .def("add_node_with_id", &obix::NodeGraph::addNodeWithId)
        .def("remove_node", &obix::NodeGraph::removeNode,
             py::arg("id"), py::arg("cascade") = true)
        .def("get_node", py::overload_cast<uint64_t>(&obix::NodeGraph::getNode),
             py::return_value_policy::reference)
        .def("get_node_ids", &obix::NodeGraph::getNodeIds)
        .def("node_count", &obix::NodeGraph::nodeCount)
        .def("add_transition", &obix::NodeGraph::addTransition)
        .def("remove_transition", &obix::NodeGraph::removeTransition)
        .def("transition_count", &obix::NodeGraph::transitionCount)
        .def("clone", &obix::NodeGraph::clone);

    // ── State ──
    py::class_<obix::State>(m, "State")
        .def(py::init<>())
        .def_readonly("id", &obix::State::id)
        .def_readonly("name", &obix::State::name)
        .def_readonly("value", &obix::State::value)
        .def_readonly("accepting", &obix::State::accepting)
        .def_readonly("transitions", &obix::State::transitions)
        .def_readonly("equivalence_class", &obix::State::equivalence_class);

    // ── Machine ──
    py::class_<obix::Machine>(m, "Machine")
        .def(py::init<>())
        .def(py::init<std::string>())
        .def("add_state", &obix::Machine::addState,
             py::arg("name"), py::arg("value") = "", py::arg("accepting") = false)
        .def("remove_state", &obix::Machine::removeState)
        .def("get_state", py::overload_cast<uint64_t>(&obix::Machine::getState),
             py::return_value_policy::reference)
        .def("find_state", &obix::Machine::findState)
        .def("state_ids", &obix::Machine::stateIds)
        .def("state_count", &obix::Machine::stateCount)
        .def("add_transition", &obix::Machine::addTransition)
        .def("add_transition_by_name", &obix::Machine::addTransitionByName)
        .def("count_transitions", &obix::Machine::countTransitions)
        .def("alphabet", &obix::Machine::alphabet)
        .def("initial_state", &obix::Machine::initialState)
        .def("current_state", &obix::Machine::currentState)
        .def("set_initial_state", &obix::Machine::setInitialState)
        .def("reset", &obix::Machine::reset)
        .def("reset_to_state", &obix::Machine::resetToState)
        .def("transition", &obix::Machine::transition, py::return_value_policy::copy)
        .def("process_sequence", &obix::Machine::processSequence, py::return_value_policy::copy)
        .def("accepts", &obix::Machine::accepts)
        .def("reachable_states", &obix::Machine::reachableStates)
        .def("remove_unreachable_states", &obix::Machine::removeUnreachableStates)
        .def("to_json", [](const obix::Machine& self) {
            return obix::machineToJson(self).dump();
        })
        .def_static("from_json", [](const std::string& text) {
            return obix::machineFromJson(nlohmann::json::parse(text));
        });

    // ── Equivalence ──
    py::class_<obix::EquivalenceResult>(m, "EquivalenceResult")
        .def(py::init<>())
        .def_readonly("class_of", &obix::EquivalenceResult::class_of)
        .def_readonly("classes", &obix::EquivalenceResult::classes)
        .def_readonly("refinement_passes", &obix::EquivalenceResult::refinement_passes)
        .def("class_count", &obix::EquivalenceResult::classCount)
        .def("same_class", &obix::EquivalenceResult::sameClass);

    m.def("compute_equivalence_classes", [](obix::NodeGraph& graph, uint64_t root) {
        return obix::EquivalenceClassComputer::computeEquivalenceClasses(graph, root);
    }, py::arg("graph"), py::arg("root"));

    // ── Minimizer ──
    py::class_<obix::MinimizationMetrics>(m, "MinimizationMetrics")
        .def(py::init<>())
        .def_readonly("original_state_count", &obix::MinimizationMetrics::original_state_count)
        .def_readonly("minimized_state_count", &obix::MinimizationMetrics::minimized_state_count)
        .def_readonly("equivalence_class_count", &obix::MinimizationMetrics::equivalence_class_count)
        .def_readonly("reduction_percentage", &obix::MinimizationMetrics::reduction_percentage)
        .def_readonly("processing_time_ms", &obix::MinimizationMetrics::processing_time_ms);

    m.def("minimize", &obix::OptimizedMachine::minimize, py::arg("machine"));

    // ── VerificationResult ──
    py::class_<obix::VerificationResult>(m, "VerificationResult")
        .def(py::init<>())
        .def_readwrite("passed", &obix::VerificationResult::passed)
        .def_readwrite("check_name", &obix::VerificationResult::check_name)
        .def_readwrite("message", &obix::VerificationResult::message)
        .def_readwrite("node_id", &obix::VerificationResult::node_id);

    py::class_<obix::MachineChecker>(m, "MachineChecker")
        .def(py::init<>())
        .def("check", &obix::MachineChecker::check);

    // ── Config ──
    py::class_<obix::CacheConfig>(m, "CacheConfig")
        .def(py::init<>())
        .def_readwrite("strategy", &obix::CacheConfig::strategy)
        .def_readwrite("max_size", &obix::CacheConfig::max_size)
        .def_readwrite("ttl", &obix::CacheConfig::ttl)
        .def_readwrite("predictive_prefetch", &obix::CacheConfig::predictive_prefetch)
        .def_readwrite("multi_tier", &obix::CacheConfig::multi_tier)
        .def_readwrite("frequency_threshold", &obix::CacheConfig::frequency_threshold)
        .def_readwrite("temporal_threshold", &obix::CacheConfig::temporal_threshold)
        .def_readwrite("adaptive_size", &obix::CacheConfig::adaptive_size)
        .def_readwrite("hit_ratio_threshold", &obix::CacheConfig::hit_ratio_threshold)
        .def_readwrite("l2_enabled", &obix::CacheConfig::l2_enabled)
        .def_readwrite("l2_max_size", &obix::CacheConfig::l2_max_size);

    py::class_<obix::OptimizerConfig>(m, "OptimizerConfig")
        .def(py::init<>())
        .def_readwrite("cache_enabled", &obix::OptimizerConfig::cache_enabled)
        .def_readwrite("runtime_optimization", &obix::OptimizerConfig::runtime_optimization)
        .def_readwrite("background_optimization", &obix::OptimizerConfig::background_optimization)
        .def_readwrite("level", &obix::OptimizerConfig::level)
        .def_readwrite("interval", &obix::OptimizerConfig::interval)
        .def_readwrite("max_memory_usage", &obix::OptimizerConfig::max_memory_usage)
        .def_readwrite("compaction_threshold", &obix::OptimizerConfig::compaction_threshold)
        .def_readwrite("cache", &obix::OptimizerConfig::cache);

    m.def("config_from_json", [](const std::string& text) {
        return obix::configFromJson(nlohmann::json::parse(text));
    });

    // ── Stats ──
    py::class_<obix::CacheStats>(m, "CacheStats")
        .def(py::init<>())
        .def_readonly("hits", &obix::CacheStats::hits)
        .def_readonly("misses", &obix::CacheStats::misses)
        .def_readonly("evictions", &obix::CacheStats::evictions)
        .def_readonly("prefetches", &obix::CacheStats::prefetches)
        .def_readonly("predictive_hits", &obix::CacheStats::predictive_hits)
        .def_readonly("l2_hits", &obix::CacheStats::l2_hits)
        .def_readonly("capacity_adjustments", &obix::CacheStats::capacity_adjustments)
        .def_readonly("hit_ratio", &obix::CacheStats::hit_ratio)
        .def_readonly("size", &obix::CacheStats::size)
        .def_readonly("capacity", &obix::CacheStats::capacity)
        .def_readonly("l2_size", &obix::CacheStats::l2_size)
        .def_readonly("l2_capacity", &obix::CacheStats::l2_capacity)
        .def_readonly("hot_size", &obix::CacheStats::hot_size)
        .def_readonly("frequent_size", &obix::CacheStats::frequent_size)
        .def_readonly("cold_size", &obix::CacheStats::cold_size);

    // ── Transition cache ──
    py::enum_<obix::CacheTier>(m, "CacheTier")
        .value("HOT", obix::CacheTier::HOT)
        .value("FREQUENT", obix::CacheTier::FREQUENT)
        .value("COLD", obix::CacheTier::COLD);

    py::class_<obix::TransitionKey>(m, "TransitionKey")
        .def(py::init<>())
        .def_readonly("state", &obix::TransitionKey::state)
        .def_readonly("label", &obix::TransitionKey::label);

    py::class_<obix::AdaptiveTransitionCache>(m, "AdaptiveTransitionCache")
        .def(py::init([](obix::CacheConfig config) {
                 return new obix::AdaptiveTransitionCache(std::move(config));
             }),
             py::arg("config") = obix::CacheConfig{})
        .def("get", [](obix::AdaptiveTransitionCache& self, uint64_t state,
                       const std::string& label) { return self.get(state, label); })
        .def("set", &obix::AdaptiveTransitionCache::set)
        .def("peek", &obix::AdaptiveTransitionCache::peek)
        .def("tier_of", &obix::AdaptiveTransitionCache::tierOf)
        .def("erase", &obix::AdaptiveTransitionCache::erase)
        .def("clear", &obix::AdaptiveTransitionCache::clear)
        .def("drop_tier", &obix::AdaptiveTransitionCache::dropTier)
        .def("drop_secondary", &obix::AdaptiveTransitionCache::dropSecondary)
        .def("remap_states", &obix::AdaptiveTransitionCache::remapStates)
        .def("hottest", &obix::AdaptiveTransitionCache::hottest)
        .def("precompute", &obix::AdaptiveTransitionCache::precompute)
        .def("rebalance", &obix::AdaptiveTransitionCache::rebalance)
        .def("get_stats", &obix::AdaptiveTransitionCache::getStats)
        .def("reset_stats", &obix::AdaptiveTransitionCache::resetStats)
        .def("size", &obix::AdaptiveTransitionCache::size)
        .def("secondary_size", &obix::AdaptiveTransitionCache::secondarySize)
        .def("capacity", &obix::AdaptiveTransitionCache::capacity);

    py::class_<obix::PassResult>(m, "PassResult")
        .def(py::init<>())
        .def_readonly("level", &obix::PassResult::level)
        .def_readonly("states_before", &obix::PassResult::states_before)
        .def_readonly("states_after", &obix::PassResult::states_after)
        .def_readonly("reduction_percentage", &obix::PassResult::reduction_percentage)
        .def_readonly("duration_ms", &obix::PassResult::duration_ms)
        .def_readonly("memory_delta", &obix::PassResult::memory_delta);

    py::class_<obix::OptimizationStats>(m, "OptimizationStats")
        .def(py::init<>())
        .def_readonly("transitions_processed", &obix::OptimizationStats::transitions_processed)
        .def_readonly("minimizations_performed", &obix::OptimizationStats::minimizations_performed)
        .def_readonly("states_removed", &obix::OptimizationStats::states_removed)
        .def_readonly("failed_optimizations", &obix::OptimizationStats::failed_optimizations)
        .def_readonly("deferred_triggers", &obix::OptimizationStats::deferred_triggers)
        .def_readonly("last_result", &obix::OptimizationStats::last_result);

    // ── OptimizedMachine ──
    py::class_<obix::OptimizedMachine>(m, "OptimizedMachine")
        .def(py::init<obix::Machine, obix::OptimizerConfig>(),
             py::arg("machine"), py::arg("config") = obix::OptimizerConfig{})
        .def("start", &obix::OptimizedMachine::start)
        .def("stop", &obix::OptimizedMachine::stop)
        .def("transition", &obix::OptimizedMachine::transition,
             py::call_guard<py::gil_scoped_release>())
        .def("process_sequence", &obix::OptimizedMachine::processSequence,
             py::call_guard<py::gil_scoped_release>())
        .def("reset", &obix::OptimizedMachine::reset)
        .def("current_state", &obix::OptimizedMachine::currentState)
        .def("run_optimization_pass",
             py::overload_cast<obix::OptimizationLevel>(
                 &obix::OptimizedMachine::runOptimizationPass),
             py::call_guard<py::gil_scoped_release>())
        .def("cache", &obix::OptimizedMachine::cache, py::return_value_policy::reference_internal)
        .def("get_cache_stats", &obix::OptimizedMachine::getCacheStats)
        .def("get_optimization_stats", &obix::OptimizedMachine::getOptimizationStats)
        .def("reset_stats", &obix::OptimizedMachine::resetStats)
        .def("estimate_memory_usage", &obix::OptimizedMachine::estimateMemoryUsage)
        .def("export_json", [](const obix::OptimizedMachine& self) {
            return self.exportToJson().dump();
        });
}
