#pragma once

#include "dojo/core/AttackTimeline.hh"
#include "dojo/core/CombatTypes.hh"
#include "dojo/core/Geometry.hh"
#include "dojo/core/HitResolver.hh"

#include <optional>
#include <string>

namespace dojo {

class Fighter;
class Hazard;

struct BowConfig {
    float downMs = 320.0f;
    float holdMs = 360.0f;
    float upMs = 320.0f;
    // Time constant of the bend blend chasing its target.
    float blendTauMs = 60.0f;
};

// Debug multi-hit punch mode (player only).
struct FlurryConfig {
    float periodMs = 45.0f;
    float damage = 8.0f;
    float knockback = 3.0f;
    float minActiveMs = 800.0f;
    float maxRecoverMs = 120.0f;
};

struct FighterConfig {
    float maxHealth = 100.0f;
    float walkSpeed = 180.0f; // units per second
    float enemySpeedScale = 0.85f;
    float lowStanceSpeedScale = 0.9f;
    float highStanceSpeedScale = 1.05f;

    float width = 36.0f;
    float height = 120.0f;
    float groundY = 600.0f;
    float worldWidth = 3200.0f;
    float edgeMargin = 20.0f;

    float attackCooldownMs = 120.0f;
    // Minimum edge-to-edge gap the player keeps to an engaged opponent.
    float playerSpacing = 32.0f;

    HitRules hit;
    FlurryConfig flurry;
    BowConfig bow;
};

struct AttackRequest {
    AttackKind kind = AttackKind::Punch;
    // Unset aims at the stance held after this tick's stance change.
    std::optional<Height> height;
};

// What a controller wants a fighter to do this tick.
struct FighterIntent {
    int moveDir = 0;
    int stanceStep = 0;
    std::optional<Height> stance;
    std::optional<int> facing;
    std::optional<AttackRequest> attack;
};

// Decision source for a fighter: keyboard for the player, a behavior tree
// for enemies. Called once per tick while the fighter is free to act.
class FighterController {
  public:
    virtual ~FighterController() = default;
    virtual FighterIntent decide(const Fighter& self, float dtMs) = 0;
};

// Who an active attack may connect with. Null members mean "no target".
struct StrikeTargets {
    Fighter* opponent = nullptr;
    Hazard* hazard = nullptr;
};

struct BowState {
    BowPhase phase = BowPhase::Down;
    float elapsedMs = 0.0f;
};

class Fighter {
  public:
    Fighter(std::string name, Side side, float x, const FighterConfig& config = FighterConfig());

    const std::string& name() const;
    Side side() const;
    bool isPlayer() const;
    const FighterConfig& config() const;

    float x() const;
    float y() const;
    int facing() const;
    void setFacing(int dir);
    void faceToward(float targetX);
    // Moves without the edge clamp; set-pieces only.
    void setPosition(float x, float y);

    float health() const;
    float maxHealth() const;
    float healthFraction() const;
    bool alive() const;
    // Clamped to [0, maxHealth]; reaching 0 is a defeat.
    void setHealth(float health);
    void forceDefeat();

    Height stance() const;
    void setStance(Height stance);
    void stepStance(int delta);

    FighterState state() const;

    const std::optional<Attack>& attack() const;
    bool isAttacking() const;
    bool canAct() const;
    float hitLagMs() const;
    float attackCooldownMs() const;

    // Fails without side effects unless alive, idle-handed, out of hit-lag
    // and off cooldown.
    bool startAttack(AttackKind kind, Height height);

    bool flurry() const;
    void setFlurry(bool enabled);

    bool greeted() const;
    void markGreeted();

    const std::optional<BowState>& bow() const;
    bool isBowing() const;
    float bowBlend() const;
    void beginBow();
    void updateBow(float dtMs);

    float opacity() const;
    void setOpacity(float opacity);
    void beginFall();

    float moveSpeed() const;

    BodyFrame body() const;
    Rect bounds() const;
    Rect hurtbox(Height band) const;
    // Only while the attack is in its active window.
    std::optional<Rect> activeHitbox() const;

    // Ignored while dead or bowing.
    void receiveHit(const HitOutcome& outcome);

    // One simulation step: timers, hit-lag freeze, controller intent,
    // movement, attack timeline and hit attempts against the targets.
    void update(float dtMs, FighterController* controller, const StrikeTargets& targets);

  private:
    void applyIntent(const FighterIntent& intent);
    void advanceAttack(float dtMs, const StrikeTargets& targets);
    bool flurryActive() const;
    void tryStrike(const StrikeTargets& targets, const StrikeParams& strike);
    void clampX();
    void die();

    std::string name_;
    Side side_;
    FighterConfig config_;

    float x_;
    float y_;
    int facing_ = 1;

    float health_;
    bool alive_ = true;
    Height stance_ = Height::Mid;
    FighterState state_ = FighterState::Idle;

    std::optional<Attack> attack_;
    float hitLagMs_ = 0.0f;
    float attackCooldownMs_ = 0.0f;

    bool flurry_ = false;
    bool greeted_ = false;
    std::optional<BowState> bow_;
    float bowBlend_ = 0.0f;
    float opacity_ = 1.0f;
};

} // namespace dojo
