#include "dojo/core/PlayerController.hh"

#include <algorithm>

namespace dojo {

PlayerController::PlayerController(const InputState& input, const Fighter* opponent)
    : input_(input), opponent_(opponent) {}

void PlayerController::setGuardOnly(bool guardOnly) {
    guardOnly_ = guardOnly;
}

FighterIntent PlayerController::decide(const Fighter& self, float /*dtMs*/) {
    FighterIntent intent;

    if (input_.stanceUp)
        intent.stanceStep += 1;
    if (input_.stanceDown)
        intent.stanceStep -= 1;

    if (guardOnly_)
        return intent;

    intent.moveDir = input_.moveAxis();

    bool engaged = opponent_ && opponent_->alive();
    if (engaged) {
        // No running through the opponent: keep a gap between the bodies.
        float spacing = self.config().playerSpacing;
        Rect me = self.bounds();
        Rect foe = opponent_->bounds();
        if (self.facing() == 1 && me.right() + spacing > foe.left())
            intent.moveDir = std::min(0, intent.moveDir);
        if (self.facing() == -1 && me.left() - spacing < foe.right())
            intent.moveDir = std::max(0, intent.moveDir);
    }

    if (input_.punch) {
        intent.attack = AttackRequest{AttackKind::Punch, std::nullopt};
    } else if (input_.kick) {
        intent.attack = AttackRequest{AttackKind::Kick, std::nullopt};
    }

    if (engaged)
        intent.facing = opponent_->x() >= self.x() ? 1 : -1;
    else
        intent.facing = 1;

    return intent;
}

} // namespace dojo
