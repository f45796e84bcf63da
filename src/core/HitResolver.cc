#include "dojo/core/HitResolver.hh"

#include <algorithm>
#include <cmath>

namespace dojo {

namespace {

constexpr float kLowPunchLift = 6.0f;

} // namespace

Rect bodyRect(const BodyFrame& body) {
    return Rect(body.x - body.width * 0.5f, body.groundY - body.height, body.width, body.height);
}

Rect hurtbox(const BodyFrame& body, Height band) {
    Rect b = bodyRect(body);
    float seg = b.h / 3.0f;
    switch (band) {
        case Height::High:
            return Rect(b.x, b.y, b.w, seg);
        case Height::Mid:
            return Rect(b.x, b.y + seg, b.w, seg);
        case Height::Low:
            return Rect(b.x, b.y + seg * 2.0f, b.w, seg);
    }
    return Rect(b.x, b.y + seg, b.w, seg);
}

Rect attackHitbox(const BodyFrame& attacker, const Attack& attack, float extension) {
    const auto& spec = attackSpec(attack.kind);
    Rect b = bodyRect(attacker);
    float seg = b.h / 3.0f;

    float reach = attack.reach * (spec.reachBase + spec.reachGain * std::clamp(extension, 0.0f, 1.0f));
    float w = spec.hitboxWidth;
    float h = attack.kind == AttackKind::Punch ? spec.hitboxHeight : std::max(spec.hitboxHeight, seg * 0.6f);

    float yOffset = 0.0f;
    if (attack.height == Height::Mid) {
        yOffset = seg;
    } else if (attack.height == Height::Low) {
        yOffset = seg * 2.0f - (attack.kind == AttackKind::Punch ? kLowPunchLift : 0.0f);
    }

    float x = attacker.facing >= 0 ? (b.right() + reach - w * 0.5f) : (b.left() - reach - w * 0.5f);
    float y = b.y + yOffset + (seg - h) * 0.5f;
    return Rect(x, y, w, h);
}

bool isBlocking(bool defenderAttacking, Height defenderStance, Height attackHeight) {
    return !defenderAttacking && defenderStance == attackHeight;
}

StrikeParams defaultStrike(const Attack& attack, const HitRules& rules) {
    return StrikeParams{attack.damage, attack.reach * rules.knockbackFactor};
}

HitOutcome resolveHit(const Rect& hitbox, Height attackHeight, int attackerFacing, const DefenderView& defender,
                      const StrikeParams& strike, const HitRules& rules) {
    HitOutcome outcome;
    if (!hitbox.intersects(hurtbox(defender.body, attackHeight))) {
        return outcome;
    }

    outcome.contact = true;
    outcome.blocked = isBlocking(defender.attacking, defender.stance, attackHeight);
    if (outcome.blocked) {
        outcome.damage = std::max(1.0f, std::round(strike.damage * rules.chipFactor));
        outcome.hitLagMs = rules.blockHitLagMs;
    } else {
        outcome.damage = strike.damage;
        outcome.hitLagMs = rules.hitLagMs;
        // Pushed along the attacker's facing.
        outcome.displacement = (attackerFacing >= 0 ? 1.0f : -1.0f) * strike.knockback;
    }
    return outcome;
}

} // namespace dojo
