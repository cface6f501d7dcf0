#include "runtime/compiled_dispatch.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <tuple>

namespace obix {

bool CompiledDispatchTable::compile(StateId source, const std::string& label, StateId target) {
    std::lock_guard<std::mutex> lock(mutex_);
    TransitionKey key{source, label};
    if (disabled_.count(key)) return false;

    auto it = table_.find(key);
    if (it != table_.end()) {
        it->second = target;
        return true;
    }
    if (table_.size() >= limit_) return false;
    table_.emplace(std::move(key), target);
    return true;
}

std::optional<StateId> CompiledDispatchTable::lookup(StateId source,
                                                     const std::string& label) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = table_.find(TransitionKey{source, label});
    if (it == table_.end()) return std::nullopt;
    return it->second;
}

std::optional<StateId> CompiledDispatchTable::dispatch(const Machine& machine, StateId source,
                                                       const std::string& label) const {
    auto target = lookup(source, label);
    if (!target) return std::nullopt;
    if (!machine.hasState(*target)) {
        throw CompiledDispatchStaleError(source, label, *target);
    }
    return target;
}

void CompiledDispatchTable::disable(StateId source, const std::string& label) {
    std::lock_guard<std::mutex> lock(mutex_);
    TransitionKey key{source, label};
    table_.erase(key);
    disabled_.insert(std::move(key));
}

bool CompiledDispatchTable::isDisabled(StateId source, const std::string& label) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return disabled_.count(TransitionKey{source, label}) > 0;
}

void CompiledDispatchTable::remap(const std::unordered_map<StateId, StateId>& mapping) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::unordered_map<TransitionKey, StateId, TransitionKeyHash> remapped;
    for (const auto& [key, target] : table_) {
        auto source = mapping.find(key.state);
        auto mapped = mapping.find(target);
        if (source == mapping.end() || mapped == mapping.end()) continue;
        remapped[TransitionKey{source->second, key.label}] = mapped->second;
    }
    table_ = std::move(remapped);
}

size_t CompiledDispatchTable::prune(const Machine& machine) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = table_.begin(); it != table_.end();) {
        if (!machine.hasState(it->first.state) || !machine.hasState(it->second)) {
            it = table_.erase(it);
            removed++;
        } else {
            ++it;
        }
    }
    return removed;
}

std::vector<std::pair<TransitionKey, StateId>> CompiledDispatchTable::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::pair<TransitionKey, StateId>> result(table_.begin(), table_.end());
    std::sort(result.begin(), result.end(), [](const auto& a, const auto& b) {
        return std::tie(a.first.state, a.first.label) < std::tie(b.first.state, b.first.label);
    });
    return result;
}

void CompiledDispatchTable::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    table_.clear();
}

size_t CompiledDispatchTable::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return table_.size();
}

} // namespace obix
