#pragma once

#include "dojo/core/Geometry.hh"
#include "dojo/core/StateMachine.hh"

#include <cstdint>
#include <string>

namespace dojo {

class Fighter;

enum class HazardPhase : uint8_t {
    Enter,
    Hover,
    Dive,
    Rise,
    Dissolve,
    Gone
};

std::string hazardPhaseToString(HazardPhase phase);

struct HazardConfig {
    // Roster index whose defeat launches the ambush.
    int triggerIndex = 1;

    float damage = 6.0f;
    float hitLagMs = 120.0f;
    float cooldownMs = 500.0f;

    float enterMs = 900.0f;
    float hoverMs = 700.0f;
    float diveMs = 450.0f;
    float riseMs = 600.0f;
    float dissolveMs = 600.0f;

    float hoverY = 380.0f;
    float entryOffsetX = 420.0f;
    float entryLift = 160.0f;
    // Fraction of the remaining gap closed per tick while hovering.
    float trackFactor = 0.06f;

    float width = 40.0f;
    float height = 24.0f;
};

// Aerial pest: enter -> hover -> dive -> rise -> hover ... until struck,
// then dissolve -> gone. Dives damage the player directly, ignoring guard.
class Hazard {
  public:
    // Enters from entryOffsetX ahead of the given player position.
    Hazard(float playerX, const HazardConfig& config = HazardConfig());

    void update(float dtMs, Fighter& player);

    // Player's attack hitbox against the pest. Returns true when it connects;
    // the pest is then defeated and starts dissolving.
    bool tryStrike(const Rect& hitbox);

    HazardPhase phase() const;
    float timeInPhase() const;
    bool defeated() const;
    bool gone() const;
    // Vulnerable and able to hurt.
    bool active() const;

    float x() const;
    float y() const;
    float opacity() const;
    float cooldownMs() const;
    Rect bounds() const;

  private:
    float phaseDuration(HazardPhase phase) const;
    void nextPhase(const Fighter& player);
    void move(const Fighter& player);

    HazardConfig config_;
    StateMachine<HazardPhase> machine_;

    float x_;
    float y_;
    float entryX_;
    float entryY_;
    float diveFromY_ = 0.0f;
    float diveToY_ = 0.0f;
    float cooldownMs_ = 0.0f;
    float opacity_ = 1.0f;
};

} // namespace dojo
