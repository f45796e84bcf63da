#include "dojo/core/Encounter.hh"

#include "dojo/core/Log.hh"

#include <cmath>
#include <limits>

namespace dojo {

std::string encounterPhaseToString(EncounterPhase phase) {
    switch (phase) {
        case EncounterPhase::Idle:    return "Idle";
        case EncounterPhase::Bowing:  return "Bowing";
        case EncounterPhase::PostBow: return "PostBow";
        case EncounterPhase::Fight:   return "Fight";
        default:                      return "Unknown";
    }
}

Encounter::Encounter(const EncounterConfig& config)
    : config_(config), machine_(EncounterPhase::Idle, encounterPhaseToString) {
    machine_.addTransition(EncounterPhase::Idle, EncounterPhase::Bowing);
    machine_.addTransition(EncounterPhase::Idle, EncounterPhase::PostBow);
    machine_.addTransition(EncounterPhase::Bowing, EncounterPhase::PostBow);
    machine_.addTransition(EncounterPhase::PostBow, EncounterPhase::Fight);
    machine_.addTransition(EncounterPhase::Bowing, EncounterPhase::Idle);
    machine_.addTransition(EncounterPhase::PostBow, EncounterPhase::Idle);
    machine_.addTransition(EncounterPhase::Fight, EncounterPhase::Idle);
}

void Encounter::selectOpponent(Fighter& player, std::vector<Fighter>& enemies) {
    if (Fighter* foe = opponent(enemies)) {
        if (!foe->alive()) {
            release("defeated");
        } else if (std::abs(foe->x() - player.x()) > config_.engageRadius) {
            release("out of range");
        }
    }

    if (opponent_ >= 0 || !player.alive())
        return;

    int best = -1;
    float bestDx = std::numeric_limits<float>::max();
    for (size_t i = 0; i < enemies.size(); ++i) {
        const Fighter& e = enemies[i];
        float dx = e.x() - player.x();
        if (!e.alive() || dx < 0.0f || dx > config_.engageRadius)
            continue;
        if (dx < bestDx) {
            bestDx = dx;
            best = static_cast<int>(i);
        }
    }
    if (best < 0)
        return;

    opponent_ = best;
    Fighter& foe = enemies[static_cast<size_t>(best)];
    player.faceToward(foe.x());
    foe.faceToward(player.x());

    if (foe.greeted()) {
        DOJO_LOG_INFO("Re-engaging {}", foe.name());
        enter(EncounterPhase::PostBow);
        return;
    }

    DOJO_LOG_INFO("Engaging {}", foe.name());
    foe.markGreeted();
    player.beginBow();
    foe.beginBow();
    enter(EncounterPhase::Bowing);
}

void Encounter::updatePhase(float dtMs, const Fighter& player, const std::vector<Fighter>& enemies) {
    machine_.tick(dtMs);

    const Fighter* foe = opponent(enemies);
    switch (machine_.getState()) {
        case EncounterPhase::Bowing:
            if (foe && !player.isBowing() && !foe->isBowing() && player.bowBlend() < config_.bowExitThreshold &&
                foe->bowBlend() < config_.bowExitThreshold) {
                enter(EncounterPhase::PostBow);
            }
            break;
        case EncounterPhase::PostBow:
            if (machine_.timeInState() >= config_.postBowHoldMs) {
                enter(EncounterPhase::Fight);
            }
            break;
        case EncounterPhase::Idle:
        case EncounterPhase::Fight:
            break;
    }
}

EncounterPhase Encounter::phase() const {
    return machine_.getState();
}

float Encounter::timeInPhase() const {
    return machine_.timeInState();
}

bool Encounter::hasOpponent() const {
    return opponent_ >= 0;
}

int Encounter::opponentIndex() const {
    return opponent_;
}

Fighter* Encounter::opponent(std::vector<Fighter>& enemies) const {
    if (opponent_ < 0 || static_cast<size_t>(opponent_) >= enemies.size())
        return nullptr;
    return &enemies[static_cast<size_t>(opponent_)];
}

const Fighter* Encounter::opponent(const std::vector<Fighter>& enemies) const {
    if (opponent_ < 0 || static_cast<size_t>(opponent_) >= enemies.size())
        return nullptr;
    return &enemies[static_cast<size_t>(opponent_)];
}

const EncounterConfig& Encounter::config() const {
    return config_;
}

void Encounter::release(const char* reason) {
    DOJO_LOG_INFO("Releasing opponent #{} ({})", opponent_, reason);
    opponent_ = -1;
    enter(EncounterPhase::Idle);
}

void Encounter::enter(EncounterPhase phase) {
    if (machine_.is(phase))
        return;
    DOJO_LOG_INFO("Encounter: {} -> {}", machine_.stateName(), encounterPhaseToString(phase));
    machine_.setState(phase);
}

} // namespace dojo
