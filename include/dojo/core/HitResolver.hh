#pragma once

#include "dojo/core/AttackTimeline.hh"
#include "dojo/core/CombatTypes.hh"
#include "dojo/core/Geometry.hh"

namespace dojo {

// Feet-anchored body placement: x is the body center, groundY the feet line.
struct BodyFrame {
    float x = 0.0f;
    float groundY = 0.0f;
    float width = 36.0f;
    float height = 120.0f;
    int facing = 1;
};

// What the resolver needs to know about the fighter being struck.
struct DefenderView {
    BodyFrame body;
    Height stance = Height::Mid;
    bool attacking = false;
};

struct HitRules {
    float chipFactor = 0.2f;
    float blockHitLagMs = 80.0f;
    float hitLagMs = 160.0f;
    float knockbackFactor = 0.6f; // default knockback = reach * factor
};

// Damage/knockback carried by one resolution attempt.
struct StrikeParams {
    float damage = 0.0f;
    float knockback = 0.0f;
};

struct HitOutcome {
    bool contact = false;
    bool blocked = false;
    float damage = 0.0f;
    float hitLagMs = 0.0f;
    // Signed x displacement for the defender (0 when blocked).
    float displacement = 0.0f;
};

Rect bodyRect(const BodyFrame& body);

// One of three equal vertical slices of the body; independent of stance.
Rect hurtbox(const BodyFrame& body, Height band);

// Attack hitbox in front of the attacker. Reach grows with limb extension.
Rect attackHitbox(const BodyFrame& attacker, const Attack& attack, float extension);

// Block iff the defender is not mid-attack and its stance equals the aim. Strict.
bool isBlocking(bool defenderAttacking, Height defenderStance, Height attackHeight);

// Default damage/knockback of an attack (knockback = reach * rules.knockbackFactor).
StrikeParams defaultStrike(const Attack& attack, const HitRules& rules);

// Compare the hitbox with the defender's hurtbox for the attacked band and
// adjudicate block versus clean hit. No overlap yields contact == false.
// A clean hit pushes the defender along attackerFacing, which is
// -defender facing while the two face each other. Blocks never push.
HitOutcome resolveHit(const Rect& hitbox, Height attackHeight, int attackerFacing, const DefenderView& defender,
                      const StrikeParams& strike, const HitRules& rules);

} // namespace dojo
