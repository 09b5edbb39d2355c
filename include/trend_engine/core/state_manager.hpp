// include/trend_engine/core/state_manager.hpp
#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "trend_engine/core/error.hpp"
#include "trend_engine/core/types.hpp"

namespace trend_engine {

enum class ComponentState { INITIALIZED, RUNNING, STOPPED, ERR_STATE };

inline std::string component_state_to_string(ComponentState state) {
    switch (state) {
        case ComponentState::INITIALIZED:
            return "INITIALIZED";
        case ComponentState::RUNNING:
            return "RUNNING";
        case ComponentState::STOPPED:
            return "STOPPED";
        case ComponentState::ERR_STATE:
            return "ERR_STATE";
        default:
            return "UNKNOWN";
    }
}

enum class ComponentType {
    INDICATOR_ENGINE,
    UNIVERSE_SELECTOR,
    SIGNAL_DETECTOR,
    RISK_MANAGER,
    PORTFOLIO_TRACKER,
    ORCHESTRATOR
};

struct ComponentInfo {
    ComponentType type{ComponentType::ORCHESTRATOR};
    ComponentState state{ComponentState::INITIALIZED};
    std::string id;
    std::string error_message;
    Timestamp last_update;
    std::unordered_map<std::string, double> metrics;
};

/**
 * @brief Registry of component lifecycles and run metrics
 *
 * Transitions: INITIALIZED -> RUNNING | ERR_STATE, RUNNING -> STOPPED | ERR_STATE,
 * STOPPED -> INITIALIZED, ERR_STATE -> INITIALIZED | STOPPED.
 */
class StateManager {
public:
    static StateManager& instance() {
        static StateManager instance;
        return instance;
    }

    Result<ComponentInfo> get_state(const std::string& component_id) const;
    Result<void> register_component(const ComponentInfo& info);
    Result<void> unregister_component(const std::string& component_id);
    Result<void> update_state(const std::string& component_id, ComponentState new_state,
                              const std::string& error_message = "");
    Result<void> update_metrics(const std::string& component_id,
                                const std::unordered_map<std::string, double>& metrics);
    bool is_healthy() const;
    std::vector<std::string> get_all_components() const;

    static void reset_instance() {
        auto& inst = instance();
        std::lock_guard<std::mutex> lock(inst.mutex_);
        inst.components_.clear();
    }

private:
    StateManager() = default;
    StateManager(const StateManager&) = delete;
    StateManager& operator=(const StateManager&) = delete;

    Result<void> validate_transition(ComponentState current_state,
                                     ComponentState new_state) const;

    // Caller holds mutex_
    Result<ComponentInfo*> find_locked(const std::string& component_id);

    std::unordered_map<std::string, ComponentInfo> components_;
    mutable std::mutex mutex_;
};

}  // namespace trend_engine
