#pragma once

namespace dojo {

// Per-tick input snapshot handed to Game::advance. Movement is level
// triggered (held); everything else is an edge that the caller clears with
// consumeEdges() right after the tick that saw it.
struct InputState {
    bool left = false;
    bool right = false;

    bool stanceUp = false;
    bool stanceDown = false;
    bool punch = false;
    bool kick = false;
    bool toggleFlurry = false;
    bool reset = false;

    void consumeEdges() {
        stanceUp = false;
        stanceDown = false;
        punch = false;
        kick = false;
        toggleFlurry = false;
        reset = false;
    }

    // -1, 0 or +1
    int moveAxis() const { return (right ? 1 : 0) - (left ? 1 : 0); }

    bool operator==(const InputState& other) const = default;
};

} // namespace dojo
