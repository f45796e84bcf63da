#include "dojo/core/Fighter.hh"

#include "dojo/core/Hazard.hh"
#include "dojo/core/Log.hh"

#include <algorithm>
#include <cmath>
#include <utility>

namespace dojo {

Fighter::Fighter(std::string name, Side side, float x, const FighterConfig& config)
    : name_(std::move(name)), side_(side), config_(config), x_(x), y_(config.groundY), health_(config.maxHealth) {
    clampX();
}

const std::string& Fighter::name() const {
    return name_;
}

Side Fighter::side() const {
    return side_;
}

bool Fighter::isPlayer() const {
    return side_ == Side::Player;
}

const FighterConfig& Fighter::config() const {
    return config_;
}

float Fighter::x() const {
    return x_;
}

float Fighter::y() const {
    return y_;
}

int Fighter::facing() const {
    return facing_;
}

void Fighter::setFacing(int dir) {
    facing_ = dir >= 0 ? 1 : -1;
}

void Fighter::faceToward(float targetX) {
    facing_ = targetX >= x_ ? 1 : -1;
}

void Fighter::setPosition(float x, float y) {
    x_ = x;
    y_ = y;
}

float Fighter::health() const {
    return health_;
}

float Fighter::maxHealth() const {
    return config_.maxHealth;
}

float Fighter::healthFraction() const {
    return config_.maxHealth > 0.0f ? health_ / config_.maxHealth : 0.0f;
}

bool Fighter::alive() const {
    return alive_;
}

void Fighter::setHealth(float health) {
    if (!alive_)
        return;
    health_ = std::clamp(health, 0.0f, config_.maxHealth);
    if (health_ <= 0.0f) {
        die();
    }
}

void Fighter::forceDefeat() {
    health_ = 0.0f;
    if (alive_) {
        die();
    }
    state_ = FighterState::Dead;
}

Height Fighter::stance() const {
    return stance_;
}

void Fighter::setStance(Height stance) {
    stance_ = stance;
}

void Fighter::stepStance(int delta) {
    stance_ = heightFromIndex(heightIndex(stance_) + delta);
}

FighterState Fighter::state() const {
    return state_;
}

const std::optional<Attack>& Fighter::attack() const {
    return attack_;
}

bool Fighter::isAttacking() const {
    return attack_.has_value();
}

bool Fighter::canAct() const {
    return alive_ && !attack_ && hitLagMs_ <= 0.0f;
}

float Fighter::hitLagMs() const {
    return hitLagMs_;
}

float Fighter::attackCooldownMs() const {
    return attackCooldownMs_;
}

bool Fighter::startAttack(AttackKind kind, Height height) {
    if (!canAct() || attackCooldownMs_ > 0.0f)
        return false;
    if (bow_ || state_ == FighterState::Fall)
        return false;

    attack_ = Attack::fromSpec(kind, height);
    if (flurryActive()) {
        attack_->activeMs = std::max(attack_->activeMs, config_.flurry.minActiveMs);
        attack_->recoverMs = std::min(attack_->recoverMs, config_.flurry.maxRecoverMs);
    }
    state_ = FighterState::Attack;

    DOJO_LOG_TRACE("{} starts {} at {}", name_, attackKindToString(kind), heightToString(height));
    return true;
}

bool Fighter::flurry() const {
    return flurry_;
}

void Fighter::setFlurry(bool enabled) {
    flurry_ = enabled;
}

bool Fighter::greeted() const {
    return greeted_;
}

void Fighter::markGreeted() {
    greeted_ = true;
}

const std::optional<BowState>& Fighter::bow() const {
    return bow_;
}

bool Fighter::isBowing() const {
    return bow_.has_value();
}

float Fighter::bowBlend() const {
    return bowBlend_;
}

void Fighter::beginBow() {
    if (!alive_)
        return;
    attack_.reset();
    hitLagMs_ = 0.0f;
    bow_ = BowState{};
    state_ = FighterState::Bow;
}

void Fighter::updateBow(float dtMs) {
    if (bow_) {
        bow_->elapsedMs += dtMs;
        // Carry overshoot into the following phase.
        if (bow_->phase == BowPhase::Down && bow_->elapsedMs >= config_.bow.downMs) {
            bow_->elapsedMs -= config_.bow.downMs;
            bow_->phase = BowPhase::Hold;
        }
        if (bow_->phase == BowPhase::Hold && bow_->elapsedMs >= config_.bow.holdMs) {
            bow_->elapsedMs -= config_.bow.holdMs;
            bow_->phase = BowPhase::Up;
        }
        if (bow_->phase == BowPhase::Up && bow_->elapsedMs >= config_.bow.upMs) {
            bow_.reset();
            state_ = FighterState::Idle;
            DOJO_LOG_DEBUG("{} finished bowing", name_);
        }
    }

    float target = (bow_ && bow_->phase != BowPhase::Up) ? 1.0f : 0.0f;
    if (config_.bow.blendTauMs > 0.0f) {
        float k = 1.0f - std::exp(-std::max(0.0f, dtMs) / config_.bow.blendTauMs);
        bowBlend_ += (target - bowBlend_) * k;
    } else {
        bowBlend_ = target;
    }
    if (target == 0.0f && bowBlend_ < 1e-4f)
        bowBlend_ = 0.0f;
}

float Fighter::opacity() const {
    return opacity_;
}

void Fighter::setOpacity(float opacity) {
    opacity_ = std::clamp(opacity, 0.0f, 1.0f);
}

void Fighter::beginFall() {
    attack_.reset();
    bow_.reset();
    hitLagMs_ = 0.0f;
    state_ = FighterState::Fall;
}

float Fighter::moveSpeed() const {
    float speed = config_.walkSpeed;
    if (stance_ == Height::Low)
        speed *= config_.lowStanceSpeedScale;
    else if (stance_ == Height::High)
        speed *= config_.highStanceSpeedScale;
    if (side_ == Side::Enemy)
        speed *= config_.enemySpeedScale;
    return speed;
}

BodyFrame Fighter::body() const {
    return BodyFrame{x_, y_, config_.width, config_.height, facing_};
}

Rect Fighter::bounds() const {
    return bodyRect(body());
}

Rect Fighter::hurtbox(Height band) const {
    return dojo::hurtbox(body(), band);
}

std::optional<Rect> Fighter::activeHitbox() const {
    if (!attack_ || !attack_->isActive())
        return std::nullopt;
    return attackHitbox(body(), *attack_, attack_->extension());
}

void Fighter::receiveHit(const HitOutcome& outcome) {
    // A running bow cannot be interrupted.
    if (!alive_ || bow_ || !outcome.contact)
        return;

    health_ = std::max(0.0f, health_ - outcome.damage);
    hitLagMs_ = outcome.hitLagMs;
    x_ += outcome.displacement;
    clampX();

    if (health_ <= 0.0f) {
        die();
        return;
    }
    state_ = outcome.blocked ? FighterState::Block : FighterState::Hit;
}

void Fighter::update(float dtMs, FighterController* controller, const StrikeTargets& targets) {
    if (!alive_ || state_ == FighterState::Fall)
        return;

    if (bow_ || bowBlend_ > 0.0f) {
        updateBow(dtMs);
        if (bow_)
            return;
    }

    attackCooldownMs_ = std::max(0.0f, attackCooldownMs_ - dtMs);
    hitLagMs_ = std::max(0.0f, hitLagMs_ - dtMs);
    if (hitLagMs_ > 0.0f)
        return;

    if (state_ == FighterState::Hit || state_ == FighterState::Block) {
        state_ = attack_ ? FighterState::Attack : FighterState::Idle;
    }

    FighterIntent intent;
    if (controller) {
        intent = controller->decide(*this, dtMs);
    }
    applyIntent(intent);

    if (state_ != FighterState::Attack && state_ != FighterState::Hit && state_ != FighterState::Block) {
        if (intent.moveDir != 0) {
            float dir = intent.moveDir > 0 ? 1.0f : -1.0f;
            x_ += dir * moveSpeed() * dtMs / 1000.0f;
            state_ = FighterState::Walk;
        } else if (!attack_) {
            state_ = FighterState::Idle;
        }
    }
    clampX();

    if (attack_) {
        advanceAttack(dtMs, targets);
    }
}

void Fighter::applyIntent(const FighterIntent& intent) {
    if (intent.stance)
        setStance(*intent.stance);
    if (intent.stanceStep != 0)
        stepStance(intent.stanceStep);
    if (intent.facing)
        setFacing(*intent.facing);
    if (intent.attack) {
        startAttack(intent.attack->kind, intent.attack->height.value_or(stance_));
    }
}

void Fighter::advanceAttack(float dtMs, const StrikeTargets& targets) {
    TimelineStep step = attack_->advance(dtMs);

    if (step.touchesActive) {
        if (flurryActive()) {
            const auto& flurry = config_.flurry;
            attack_->flurryAccumMs += step.activeOverlapMs;
            StrikeParams strike{flurry.damage, flurry.knockback};
            while (flurry.periodMs > 0.0f && attack_->flurryAccumMs >= flurry.periodMs) {
                attack_->flurryAccumMs -= flurry.periodMs;
                tryStrike(targets, strike);
            }
        } else if (!attack_->applied) {
            attack_->applied = true;
            tryStrike(targets, defaultStrike(*attack_, config_.hit));
        }
    }

    if (step.finished) {
        attack_.reset();
        attackCooldownMs_ = config_.attackCooldownMs;
        state_ = FighterState::Idle;
    }
}

bool Fighter::flurryActive() const {
    return flurry_ && isPlayer() && attack_ && attack_->kind == AttackKind::Punch;
}

void Fighter::tryStrike(const StrikeTargets& targets, const StrikeParams& strike) {
    // Only ever called inside the active window, where the limb is fully out.
    Rect hitbox = attackHitbox(body(), *attack_, 1.0f);

    if (targets.hazard && targets.hazard->tryStrike(hitbox)) {
        DOJO_LOG_DEBUG("{} struck the hazard", name_);
        return;
    }

    Fighter* foe = targets.opponent;
    if (!foe || !foe->alive())
        return;

    DefenderView view{foe->body(), foe->stance(), foe->isAttacking()};
    HitOutcome outcome = resolveHit(hitbox, attack_->height, facing_, view, strike, config_.hit);
    if (!outcome.contact)
        return;

    DOJO_LOG_DEBUG("{} {} {} at {} for {}", name_, outcome.blocked ? "chipped" : "hit", foe->name(),
                   heightToString(attack_->height), outcome.damage);
    foe->receiveHit(outcome);
}

void Fighter::clampX() {
    x_ = std::clamp(x_, config_.edgeMargin, config_.worldWidth - config_.edgeMargin);
}

void Fighter::die() {
    alive_ = false;
    health_ = 0.0f;
    attack_.reset();
    bow_.reset();
    state_ = FighterState::Dead;
    DOJO_LOG_INFO("{} defeated", name_);
}

} // namespace dojo
