#pragma once

#include "dojo/core/CombatTypes.hh"

#include <cstdint>
#include <string>

namespace dojo {

enum class AttackPhase : uint8_t {
    Windup,
    Active,
    Recover,
    Finished
};

std::string attackPhaseToString(AttackPhase phase);

// What a single advance() of the timeline crossed.
struct TimelineStep {
    // The interval (previous elapsed, new elapsed] touches the active window.
    bool touchesActive = false;
    // Length of that interval lying inside the active window.
    float activeOverlapMs = 0.0f;
    // Recover elapsed on this step; the owner tears the attack down.
    bool finished = false;
};

// In-progress strike owned by a Fighter. Phase boundaries sit at cumulative
// windup, windup+active and windup+active+recover.
struct Attack {
    AttackKind kind = AttackKind::Punch;
    Height height = Height::Mid;
    float elapsedMs = 0.0f;
    float windupMs = 0.0f;
    float activeMs = 0.0f;
    float recoverMs = 0.0f;
    float damage = 0.0f;
    float reach = 0.0f;

    // One-shot guard for the default single hit.
    bool applied = false;
    // Flurry mode: active time not yet spent on periodic hits.
    float flurryAccumMs = 0.0f;

    static Attack fromSpec(AttackKind kind, Height height);

    float activeStartMs() const;
    float activeEndMs() const;
    float totalMs() const;

    AttackPhase phase() const;
    bool isActive() const;

    // Limb extension in [0,1]: rises over windup, full while active, falls over recover.
    float extension() const;

    TimelineStep advance(float dtMs);
};

} // namespace dojo
