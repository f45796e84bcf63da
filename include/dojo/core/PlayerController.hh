#pragma once

#include "dojo/core/Fighter.hh"
#include "dojo/core/InputState.hh"

namespace dojo {

// Maps one tick of InputState onto the player's intent. Built per tick by
// the encounter loop; holds references only for that tick.
class PlayerController : public FighterController {
  public:
    PlayerController(const InputState& input, const Fighter* opponent);

    // Post-greeting guard pause: stance changes only.
    void setGuardOnly(bool guardOnly);

    FighterIntent decide(const Fighter& self, float dtMs) override;

  private:
    const InputState& input_;
    const Fighter* opponent_;
    bool guardOnly_ = false;
};

} // namespace dojo
