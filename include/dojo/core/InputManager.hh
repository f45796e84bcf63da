#pragma once

#include "dojo/core/InputState.hh"
#include <SDL3/SDL.h>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace dojo {

// Action names understood by InputManager
namespace action {
inline constexpr const char* kMoveLeft = "move_left";
inline constexpr const char* kMoveRight = "move_right";
inline constexpr const char* kStanceUp = "stance_up";
inline constexpr const char* kStanceDown = "stance_down";
inline constexpr const char* kPunch = "punch";
inline constexpr const char* kKick = "kick";
inline constexpr const char* kToggleFlurry = "toggle_flurry";
inline constexpr const char* kReset = "reset";
} // namespace action

// Translates SDL3 keyboard events into the per-tick InputState.
class InputManager {
public:
    InputManager();

    // Left/Right move, W/S stance, J punch, K kick, H flurry, R reset
    void bindDefaults();

    // Bind an action name to an SDL keycode
    void bindKey(const std::string& action, SDL_Keycode key);
    void unbindKey(const std::string& action);

    // Process a single SDL event. Returns true if consumed.
    bool processEvent(const SDL_Event& event);

    // Snapshot for the next Game::advance
    const InputState& state() const;

    // Clear edge flags after the tick that consumed them
    void consumeEdges();

    // Query if action is currently active (key held)
    bool isActionActive(const std::string& action) const;

    bool quitRequested() const;

private:
    void press(const std::string& action);
    void release(const std::string& action);

    std::unordered_map<SDL_Keycode, std::string> keyBindings_;
    std::unordered_set<std::string> activeActions_;
    InputState state_;
    bool quitRequested_ = false;
};

} // namespace dojo
