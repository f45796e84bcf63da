#pragma once

#include "dojo/core/Log.hh"
#include "dojo/utils/ErrorHandling.hh"
#include "dojo/utils/Utils.hh"
#include <algorithm>
#include <functional>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace dojo {

// Transition-table state machine with entry/transition hooks and a per-state
// elapsed-time clock. Single-writer: owned and driven by one tick loop.
// Self-transitions are no-ops; undeclared transitions throw.
template <typename StateEnum> class StateMachine {
  public:
    using Hook = std::function<void()>;
    using ToStringFn = std::function<std::string(StateEnum)>;

    StateMachine(StateEnum initialState, ToStringFn toStringFn)
        : currentState_(initialState), toStringFn_(std::move(toStringFn)) {}

    void addTransition(StateEnum from, StateEnum to) { transitions_.insert({from, to}); }

    void setState(StateEnum state) {
        if (currentState_ == state) {
            return;
        }

        if (transitions_.count({currentState_, state}) == 0) {
            throwError("Invalid state transition from " + toStringFn_(currentState_) + " to " + toStringFn_(state));
        }

        StateEnum oldState = currentState_;
        currentState_ = state;
        timeInState_ = 0.0f;

        DOJO_LOG_DEBUG("State transition: {} -> {}", toStringFn_(oldState), toStringFn_(state));

        // Copy first: a hook may add or remove hooks.
        std::vector<Hook> stateHooksToInvoke;
        std::vector<Hook> transHooksToInvoke;

        auto it = stateHooks_.find(state);
        if (it != stateHooks_.end()) {
            for (const auto& entry : it->second) {
                stateHooksToInvoke.push_back(entry.hook);
            }
        }

        auto transIt = transitionHooks_.find(transitionKey(oldState, state));
        if (transIt != transitionHooks_.end()) {
            for (const auto& entry : transIt->second) {
                transHooksToInvoke.push_back(entry.hook);
            }
        }

        for (const auto& hook : stateHooksToInvoke) {
            hook();
        }
        for (const auto& hook : transHooksToInvoke) {
            hook();
        }
    }

    StateEnum getState() const { return currentState_; }

    bool is(StateEnum state) const { return currentState_ == state; }

    // Advance the clock of the current state (milliseconds).
    void tick(float dtMs) { timeInState_ += dtMs; }

    float timeInState() const { return timeInState_; }

    bool isValidTransition(StateEnum from, StateEnum to) const {
        if (from == to)
            return true;
        return transitions_.count({from, to}) > 0;
    }

    std::string stateName() const { return toStringFn_(currentState_); }

    std::string addHook(StateEnum state, const Hook& hook) {
        if (!hook) {
            throwError("State hook cannot be null");
        }

        auto id = Utils::generateUniqueId("hook_");
        stateHooks_[state].push_back(HookEntry{id, hook});
        return id;
    }

    std::string addTransitionHook(StateEnum from, StateEnum to, const Hook& hook) {
        if (!hook) {
            throwError("Transition hook cannot be null");
        }

        auto id = Utils::generateUniqueId("transition_");
        transitionHooks_[transitionKey(from, to)].push_back(HookEntry{id, hook});
        return id;
    }

    bool removeHook(const std::string& hookId) {
        auto matches = [&hookId](const HookEntry& e) { return e.id == hookId; };

        for (auto& [state, hooks] : stateHooks_) {
            auto it = std::find_if(hooks.begin(), hooks.end(), matches);
            if (it != hooks.end()) {
                hooks.erase(it);
                return true;
            }
        }

        for (auto& [key, hooks] : transitionHooks_) {
            auto it = std::find_if(hooks.begin(), hooks.end(), matches);
            if (it != hooks.end()) {
                hooks.erase(it);
                return true;
            }
        }

        return false;
    }

  private:
    struct HookEntry {
        std::string id;
        Hook hook;
    };

    static std::string transitionKey(StateEnum from, StateEnum to) {
        return std::to_string(static_cast<int>(from)) + ":" + std::to_string(static_cast<int>(to));
    }

    StateEnum currentState_;
    ToStringFn toStringFn_;
    float timeInState_ = 0.0f;
    std::set<std::pair<StateEnum, StateEnum>> transitions_;

    std::unordered_map<StateEnum, std::vector<HookEntry>> stateHooks_;
    std::unordered_map<std::string, std::vector<HookEntry>> transitionHooks_;
};

} // namespace dojo
