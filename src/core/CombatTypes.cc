#include "dojo/core/CombatTypes.hh"

#include <algorithm>

namespace dojo {

const AttackSpec& attackSpec(AttackKind kind) {
    return kAttackSpecTable[static_cast<std::size_t>(kind)];
}

Height heightFromIndex(int index) {
    return static_cast<Height>(std::clamp(index, 0, static_cast<int>(kHeightCount) - 1));
}

int heightIndex(Height height) {
    return static_cast<int>(height);
}

std::string heightToString(Height height) {
    switch (height) {
        case Height::Low:  return "low";
        case Height::Mid:  return "mid";
        case Height::High: return "high";
        default:           return "unknown";
    }
}

std::string attackKindToString(AttackKind kind) {
    switch (kind) {
        case AttackKind::Punch: return "punch";
        case AttackKind::Kick:  return "kick";
        default:                return "unknown";
    }
}

std::string sideToString(Side side) {
    return side == Side::Player ? "player" : "enemy";
}

std::string fighterStateToString(FighterState state) {
    switch (state) {
        case FighterState::Idle:   return "Idle";
        case FighterState::Walk:   return "Walk";
        case FighterState::Attack: return "Attack";
        case FighterState::Hit:    return "Hit";
        case FighterState::Block:  return "Block";
        case FighterState::Dead:   return "Dead";
        case FighterState::Bow:    return "Bow";
        case FighterState::Fall:   return "Fall";
        default:                   return "Unknown";
    }
}

std::string bowPhaseToString(BowPhase phase) {
    switch (phase) {
        case BowPhase::Down: return "Down";
        case BowPhase::Hold: return "Hold";
        case BowPhase::Up:   return "Up";
        default:             return "Unknown";
    }
}

} // namespace dojo
