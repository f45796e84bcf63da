#pragma once

#include "dojo/core/Encounter.hh"
#include "dojo/core/FallSequence.hh"
#include "dojo/core/Fighter.hh"
#include "dojo/core/GameConfig.hh"
#include "dojo/core/Hazard.hh"
#include "dojo/core/InputState.hh"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace dojo {

enum class SessionState : uint8_t {
    Playing,
    Falling,
    Won,
    Lost
};

enum class LoseReason : uint8_t {
    None,
    Combat,
    Fall
};

// HUD banner keys, highest priority first: outcome, hazard prompt,
// greeting, guard, advance, debug tag.
enum class StatusMessage : uint8_t {
    None,
    Greeting,
    Guard,
    Advance,
    HazardPrompt,
    DebugTag,
    Win,
    LoseCombat,
    LoseFall
};

std::string sessionStateToString(SessionState state);
std::string loseReasonToString(LoseReason reason);
std::string statusMessageToString(StatusMessage message);

// Everything the presentation layer reads after a tick.
struct HudSummary {
    float playerHealth = 1.0f;
    float opponentHealth = 0.0f;
    StatusMessage message = StatusMessage::None;
    float messageOpacity = 0.0f;
    bool debugTag = false;
    float cameraOffset = 0.0f;
    SessionState session = SessionState::Playing;
    LoseReason loseReason = LoseReason::None;

    bool operator==(const HudSummary& other) const = default;
};

// Encounter orchestrator. Owns the roster, the active-opponent selection,
// the set-pieces and the session outcome. One advance() per frame, fixed
// order inside: toggles/reset, selection, player, enemy, hazard, phase,
// camera, terminal checks, summary.
class Game {
  public:
    explicit Game(const GameConfig& config = GameConfig());
    ~Game();

    Game(const Game&) = delete;
    Game& operator=(const Game&) = delete;

    const HudSummary& advance(float dtMs, const InputState& input);

    // Discards and rebuilds the whole world with the session seed.
    void reset();

    const HudSummary& summary() const;
    SessionState session() const;
    LoseReason loseReason() const;
    EncounterPhase encounterPhase() const;
    bool flurry() const;

    Fighter& player();
    const Fighter& player() const;
    std::vector<Fighter>& enemies();
    const std::vector<Fighter>& enemies() const;
    const Fighter* opponent() const;
    const Hazard* hazard() const;
    bool hazardSpawned() const;
    const FallSequence* fall() const;
    float cameraOffset() const;

    const GameConfig& config() const;
    uint64_t seed() const;
    uint64_t tickCount() const;

    // Negative steps become 0; long frames are cut to maxStepMs.
    static float clampStep(float dtMs, float maxStepMs);

  private:
    struct World;

    void updateHazard(float dtMs);
    void checkTerminal();
    void setSession(SessionState state, LoseReason reason = LoseReason::None);
    void refreshSummary();

    GameConfig config_;
    uint64_t seed_;
    uint64_t tickCount_ = 0;
    std::unique_ptr<World> world_;
    HudSummary summary_;
};

} // namespace dojo
