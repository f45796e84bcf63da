#include "dojo/core/Hazard.hh"

#include "dojo/core/Fighter.hh"
#include "dojo/core/HitResolver.hh"
#include "dojo/core/Log.hh"
#include "dojo/utils/Utils.hh"

#include <algorithm>

namespace dojo {

std::string hazardPhaseToString(HazardPhase phase) {
    switch (phase) {
        case HazardPhase::Enter:    return "Enter";
        case HazardPhase::Hover:    return "Hover";
        case HazardPhase::Dive:     return "Dive";
        case HazardPhase::Rise:     return "Rise";
        case HazardPhase::Dissolve: return "Dissolve";
        case HazardPhase::Gone:     return "Gone";
        default:                    return "Unknown";
    }
}

Hazard::Hazard(float playerX, const HazardConfig& config)
    : config_(config),
      machine_(HazardPhase::Enter, hazardPhaseToString),
      x_(playerX + config.entryOffsetX),
      y_(config.hoverY - config.entryLift),
      entryX_(x_),
      entryY_(y_) {
    machine_.addTransition(HazardPhase::Enter, HazardPhase::Hover);
    machine_.addTransition(HazardPhase::Hover, HazardPhase::Dive);
    machine_.addTransition(HazardPhase::Dive, HazardPhase::Rise);
    machine_.addTransition(HazardPhase::Rise, HazardPhase::Hover);
    for (auto from : {HazardPhase::Enter, HazardPhase::Hover, HazardPhase::Dive, HazardPhase::Rise}) {
        machine_.addTransition(from, HazardPhase::Dissolve);
    }
    machine_.addTransition(HazardPhase::Dissolve, HazardPhase::Gone);

    DOJO_LOG_INFO("Hazard spawned at x={}", x_);
}

void Hazard::update(float dtMs, Fighter& player) {
    if (gone())
        return;

    cooldownMs_ = std::max(0.0f, cooldownMs_ - dtMs);
    machine_.tick(dtMs);
    if (machine_.timeInState() >= phaseDuration(machine_.getState())) {
        nextPhase(player);
    }
    move(player);

    if (machine_.is(HazardPhase::Dive) && cooldownMs_ <= 0.0f && player.alive() && !player.isBowing() &&
        bounds().intersects(player.bounds())) {
        HitOutcome sting;
        sting.contact = true;
        sting.damage = config_.damage;
        sting.hitLagMs = config_.hitLagMs;
        player.receiveHit(sting);
        cooldownMs_ = config_.cooldownMs;
        DOJO_LOG_DEBUG("Hazard stung {} for {}", player.name(), config_.damage);
    }
}

bool Hazard::tryStrike(const Rect& hitbox) {
    if (!active() || !hitbox.intersects(bounds()))
        return false;

    machine_.setState(HazardPhase::Dissolve);
    DOJO_LOG_INFO("Hazard defeated");
    return true;
}

HazardPhase Hazard::phase() const {
    return machine_.getState();
}

float Hazard::timeInPhase() const {
    return machine_.timeInState();
}

bool Hazard::defeated() const {
    return machine_.is(HazardPhase::Dissolve) || machine_.is(HazardPhase::Gone);
}

bool Hazard::gone() const {
    return machine_.is(HazardPhase::Gone);
}

bool Hazard::active() const {
    return !defeated();
}

float Hazard::x() const {
    return x_;
}

float Hazard::y() const {
    return y_;
}

float Hazard::opacity() const {
    return opacity_;
}

float Hazard::cooldownMs() const {
    return cooldownMs_;
}

Rect Hazard::bounds() const {
    return Rect(x_ - config_.width * 0.5f, y_ - config_.height * 0.5f, config_.width, config_.height);
}

float Hazard::phaseDuration(HazardPhase phase) const {
    switch (phase) {
        case HazardPhase::Enter:    return config_.enterMs;
        case HazardPhase::Hover:    return config_.hoverMs;
        case HazardPhase::Dive:     return config_.diveMs;
        case HazardPhase::Rise:     return config_.riseMs;
        case HazardPhase::Dissolve: return config_.dissolveMs;
        case HazardPhase::Gone:     return 0.0f;
    }
    return 0.0f;
}

void Hazard::nextPhase(const Fighter& player) {
    switch (machine_.getState()) {
        case HazardPhase::Enter:
            machine_.setState(HazardPhase::Hover);
            break;
        case HazardPhase::Hover:
            // Dive at the spot the player occupied when it started.
            diveFromY_ = y_;
            diveToY_ = player.y() - player.config().height * 0.5f;
            machine_.setState(HazardPhase::Dive);
            break;
        case HazardPhase::Dive:
            machine_.setState(HazardPhase::Rise);
            break;
        case HazardPhase::Rise:
            machine_.setState(HazardPhase::Hover);
            break;
        case HazardPhase::Dissolve:
            opacity_ = 0.0f;
            machine_.setState(HazardPhase::Gone);
            break;
        case HazardPhase::Gone:
            break;
    }
}

void Hazard::move(const Fighter& player) {
    float duration = phaseDuration(machine_.getState());
    float t = duration > 0.0f ? machine_.timeInState() / duration : 1.0f;

    switch (machine_.getState()) {
        case HazardPhase::Enter:
            x_ = Utils::lerp(entryX_, player.x(), Utils::easeOutQuad(t));
            y_ = Utils::lerp(entryY_, config_.hoverY, Utils::easeOutQuad(t));
            break;
        case HazardPhase::Hover:
            x_ += (player.x() - x_) * config_.trackFactor;
            y_ = config_.hoverY;
            break;
        case HazardPhase::Dive:
            y_ = Utils::lerp(diveFromY_, diveToY_, Utils::easeInCubic(t));
            break;
        case HazardPhase::Rise:
            y_ = Utils::lerp(diveToY_, config_.hoverY, Utils::easeOutQuad(t));
            break;
        case HazardPhase::Dissolve:
            opacity_ = 1.0f - std::clamp(t, 0.0f, 1.0f);
            break;
        case HazardPhase::Gone:
            opacity_ = 0.0f;
            break;
    }
}

} // namespace dojo
