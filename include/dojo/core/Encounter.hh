#pragma once

#include "dojo/core/Fighter.hh"
#include "dojo/core/StateMachine.hh"

#include <cstdint>
#include <string>
#include <vector>

namespace dojo {

enum class EncounterPhase : uint8_t {
    Idle,
    Bowing,
    PostBow,
    Fight
};

std::string encounterPhaseToString(EncounterPhase phase);

struct EncounterConfig {
    float engageRadius = 360.0f;
    float postBowHoldMs = 480.0f;
    // Both bow blends must settle below this before the guard pause.
    float bowExitThreshold = 0.02f;
};

// Engagement with one enemy at a time: idle -> bowing -> postBow -> fight,
// back to idle when the opponent falls or the player walks away. An enemy
// is greeted once; re-engaging skips straight to the guard pause.
class Encounter {
  public:
    explicit Encounter(const EncounterConfig& config = EncounterConfig());

    // Release a defeated or distant opponent, then engage the nearest living
    // enemy ahead of the player within the engage radius.
    void selectOpponent(Fighter& player, std::vector<Fighter>& enemies);

    // Timed transitions (bow exit, end of the guard pause).
    void updatePhase(float dtMs, const Fighter& player, const std::vector<Fighter>& enemies);

    EncounterPhase phase() const;
    float timeInPhase() const;

    bool hasOpponent() const;
    int opponentIndex() const;
    Fighter* opponent(std::vector<Fighter>& enemies) const;
    const Fighter* opponent(const std::vector<Fighter>& enemies) const;

    const EncounterConfig& config() const;

  private:
    void release(const char* reason);
    void enter(EncounterPhase phase);

    EncounterConfig config_;
    StateMachine<EncounterPhase> machine_;
    int opponent_ = -1;
};

} // namespace dojo
