// src/core/state_manager.cpp
#include "trend_engine/core/state_manager.hpp"
#include <algorithm>
#include <iterator>
#include <utility>

namespace trend_engine {

namespace {

// Allowed targets per source state, indexed by ComponentState
const std::vector<std::vector<ComponentState>>& transition_table() {
    static const std::vector<std::vector<ComponentState>> table = {
        /* INITIALIZED */ {ComponentState::RUNNING, ComponentState::ERR_STATE},
        /* RUNNING     */ {ComponentState::STOPPED, ComponentState::ERR_STATE},
        /* STOPPED     */ {ComponentState::INITIALIZED},
        /* ERR_STATE   */ {ComponentState::INITIALIZED, ComponentState::STOPPED},
    };
    return table;
}

}  // namespace

Result<ComponentInfo*> StateManager::find_locked(const std::string& component_id) {
    auto it = components_.find(component_id);
    if (it == components_.end()) {
        return make_error<ComponentInfo*>(ErrorCode::INVALID_ARGUMENT,
                                          "No component registered as '" + component_id + "'",
                                          "StateManager");
    }
    return Result<ComponentInfo*>(&it->second);
}

Result<void> StateManager::register_component(const ComponentInfo& info) {
    if (info.id.empty()) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT, "Component id is empty",
                                "StateManager");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!components_.emplace(info.id, info).second) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Component id '" + info.id + "' is already in use",
                                "StateManager");
    }
    return Result<void>();
}

Result<void> StateManager::unregister_component(const std::string& component_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (components_.erase(component_id) == 0) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "No component registered as '" + component_id + "'",
                                "StateManager");
    }
    return Result<void>();
}

Result<ComponentInfo> StateManager::get_state(const std::string& component_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = components_.find(component_id);
    if (it == components_.end()) {
        return make_error<ComponentInfo>(ErrorCode::INVALID_ARGUMENT,
                                         "No component registered as '" + component_id + "'",
                                         "StateManager");
    }
    return Result<ComponentInfo>(it->second);
}

Result<void> StateManager::update_state(const std::string& component_id,
                                        ComponentState new_state,
                                        const std::string& error_message) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto found = find_locked(component_id);
    if (found.is_error()) {
        return make_error<void>(found.error()->code(), found.error()->what(), "StateManager");
    }
    ComponentInfo& info = *found.value();

    auto allowed = validate_transition(info.state, new_state);
    if (allowed.is_error()) {
        return allowed;
    }

    info.state = new_state;
    info.error_message = new_state == ComponentState::ERR_STATE ? error_message : "";
    info.last_update = std::chrono::system_clock::now();
    return Result<void>();
}

Result<void> StateManager::validate_transition(ComponentState current_state,
                                               ComponentState new_state) const {
    const auto& targets = transition_table().at(static_cast<size_t>(current_state));
    if (std::find(targets.begin(), targets.end(), new_state) != targets.end()) {
        return Result<void>();
    }
    return make_error<void>(ErrorCode::INVALID_STATE,
                            "Cannot move from " + component_state_to_string(current_state) +
                                " to " + component_state_to_string(new_state),
                            "StateManager");
}

Result<void> StateManager::update_metrics(const std::string& component_id,
                                          const std::unordered_map<std::string, double>& metrics) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto found = find_locked(component_id);
    if (found.is_error()) {
        return make_error<void>(found.error()->code(), found.error()->what(), "StateManager");
    }
    ComponentInfo& info = *found.value();

    for (const auto& entry : metrics) {
        info.metrics[entry.first] = entry.second;
    }
    info.last_update = std::chrono::system_clock::now();
    return Result<void>();
}

bool StateManager::is_healthy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (components_.empty()) {
        return false;
    }
    for (const auto& entry : components_) {
        if (entry.second.state == ComponentState::ERR_STATE) {
            return false;
        }
    }
    return true;
}

std::vector<std::string> StateManager::get_all_components() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(components_.size());
    std::transform(components_.begin(), components_.end(), std::back_inserter(ids),
                   [](const auto& entry) { return entry.first; });
    std::sort(ids.begin(), ids.end());
    return ids;
}

}  // namespace trend_engine
