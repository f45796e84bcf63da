#include "dojo/core/InputManager.hh"
#include "dojo/core/Log.hh"

namespace dojo {

InputManager::InputManager() {
    bindDefaults();
}

void InputManager::bindDefaults() {
    keyBindings_.clear();
    bindKey(action::kMoveLeft, SDLK_LEFT);
    bindKey(action::kMoveRight, SDLK_RIGHT);
    bindKey(action::kStanceUp, SDLK_W);
    bindKey(action::kStanceDown, SDLK_S);
    bindKey(action::kPunch, SDLK_J);
    bindKey(action::kKick, SDLK_K);
    bindKey(action::kToggleFlurry, SDLK_H);
    bindKey(action::kReset, SDLK_R);
}

void InputManager::bindKey(const std::string& action, SDL_Keycode key) {
    keyBindings_[key] = action;
}

void InputManager::unbindKey(const std::string& action) {
    for (auto it = keyBindings_.begin(); it != keyBindings_.end();) {
        if (it->second == action) {
            it = keyBindings_.erase(it);
        } else {
            ++it;
        }
    }
}

bool InputManager::processEvent(const SDL_Event& event) {
    switch (event.type) {
        case SDL_EVENT_QUIT: {
            quitRequested_ = true;
            return true;
        }

        case SDL_EVENT_KEY_DOWN: {
            if (event.key.repeat)
                return false;

            auto it = keyBindings_.find(event.key.key);
            if (it == keyBindings_.end())
                return false;

            press(it->second);
            return true;
        }

        case SDL_EVENT_KEY_UP: {
            auto it = keyBindings_.find(event.key.key);
            if (it == keyBindings_.end())
                return false;

            release(it->second);
            return true;
        }

        default:
            return false;
    }
}

const InputState& InputManager::state() const {
    return state_;
}

void InputManager::consumeEdges() {
    state_.consumeEdges();
}

bool InputManager::isActionActive(const std::string& action) const {
    return activeActions_.count(action) > 0;
}

bool InputManager::quitRequested() const {
    return quitRequested_;
}

void InputManager::press(const std::string& action) {
    activeActions_.insert(action);

    if (action == action::kMoveLeft) {
        state_.left = true;
    } else if (action == action::kMoveRight) {
        state_.right = true;
    } else if (action == action::kStanceUp) {
        state_.stanceUp = true;
    } else if (action == action::kStanceDown) {
        state_.stanceDown = true;
    } else if (action == action::kPunch) {
        state_.punch = true;
    } else if (action == action::kKick) {
        state_.kick = true;
    } else if (action == action::kToggleFlurry) {
        state_.toggleFlurry = true;
    } else if (action == action::kReset) {
        state_.reset = true;
    } else {
        DOJO_LOG_WARN("Unknown input action '{}'", action);
    }
}

void InputManager::release(const std::string& action) {
    activeActions_.erase(action);

    // Edge flags stay latched until consumeEdges()
    if (action == action::kMoveLeft) {
        state_.left = false;
    } else if (action == action::kMoveRight) {
        state_.right = false;
    }
}

} // namespace dojo
