#include "dojo/core/AttackTimeline.hh"

#include <algorithm>

namespace dojo {

std::string attackPhaseToString(AttackPhase phase) {
    switch (phase) {
        case AttackPhase::Windup:   return "Windup";
        case AttackPhase::Active:   return "Active";
        case AttackPhase::Recover:  return "Recover";
        case AttackPhase::Finished: return "Finished";
        default:                    return "Unknown";
    }
}

Attack Attack::fromSpec(AttackKind kind, Height height) {
    const auto& spec = attackSpec(kind);
    Attack attack;
    attack.kind = kind;
    attack.height = height;
    attack.windupMs = spec.windupMs;
    attack.activeMs = spec.activeMs;
    attack.recoverMs = spec.recoverMs;
    attack.damage = spec.damage;
    attack.reach = spec.reach;
    return attack;
}

float Attack::activeStartMs() const {
    return windupMs;
}

float Attack::activeEndMs() const {
    return windupMs + activeMs;
}

float Attack::totalMs() const {
    return windupMs + activeMs + recoverMs;
}

AttackPhase Attack::phase() const {
    if (elapsedMs < activeStartMs())
        return AttackPhase::Windup;
    if (elapsedMs < activeEndMs())
        return AttackPhase::Active;
    if (elapsedMs < totalMs())
        return AttackPhase::Recover;
    return AttackPhase::Finished;
}

bool Attack::isActive() const {
    return phase() == AttackPhase::Active;
}

float Attack::extension() const {
    switch (phase()) {
        case AttackPhase::Windup:
            return windupMs > 0.0f ? elapsedMs / windupMs : 1.0f;
        case AttackPhase::Active:
            return 1.0f;
        case AttackPhase::Recover:
            return recoverMs > 0.0f ? 1.0f - (elapsedMs - activeEndMs()) / recoverMs : 0.0f;
        case AttackPhase::Finished:
            return 0.0f;
    }
    return 0.0f;
}

TimelineStep Attack::advance(float dtMs) {
    TimelineStep step;
    float previous = elapsedMs;
    elapsedMs += std::max(0.0f, dtMs);

    if (elapsedMs >= activeStartMs() && previous < activeEndMs()) {
        step.touchesActive = true;
        step.activeOverlapMs =
            std::max(0.0f, std::min(elapsedMs, activeEndMs()) - std::max(previous, activeStartMs()));
    }

    step.finished = elapsedMs >= totalMs();
    return step;
}

} // namespace dojo
