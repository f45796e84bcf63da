#include "dojo/core/Game.hh"

#include "dojo/core/EnemyAI.hh"
#include "dojo/core/Log.hh"
#include "dojo/core/PlayerController.hh"
#include "dojo/core/ScrollCamera.hh"
#include "dojo/core/StateMachine.hh"
#include "dojo/utils/ErrorHandling.hh"
#include "dojo/utils/Random.hh"

#include <algorithm>
#include <optional>

namespace dojo {

std::string sessionStateToString(SessionState state) {
    switch (state) {
        case SessionState::Playing: return "Playing";
        case SessionState::Falling: return "Falling";
        case SessionState::Won:     return "Won";
        case SessionState::Lost:    return "Lost";
        default:                    return "Unknown";
    }
}

std::string loseReasonToString(LoseReason reason) {
    switch (reason) {
        case LoseReason::None:   return "None";
        case LoseReason::Combat: return "Combat";
        case LoseReason::Fall:   return "Fall";
        default:                 return "Unknown";
    }
}

std::string statusMessageToString(StatusMessage message) {
    switch (message) {
        case StatusMessage::None:         return "None";
        case StatusMessage::Greeting:     return "Greeting";
        case StatusMessage::Guard:        return "Guard";
        case StatusMessage::Advance:      return "Advance";
        case StatusMessage::HazardPrompt: return "HazardPrompt";
        case StatusMessage::DebugTag:     return "DebugTag";
        case StatusMessage::Win:          return "Win";
        case StatusMessage::LoseCombat:   return "LoseCombat";
        case StatusMessage::LoseFall:     return "LoseFall";
        default:                          return "Unknown";
    }
}

// Session-scoped state. Rebuilt wholesale on reset.
struct Game::World {
    World(const GameConfig& config, uint64_t seed)
        : rng(seed),
          player("Player", Side::Player, config.playerStartX, config.fighterConfig()),
          ai(rng, config.ai),
          encounter(config.encounter),
          camera(config.cameraConfig()),
          session(SessionState::Playing, sessionStateToString) {
        FighterConfig fighterConfig = config.fighterConfig();
        enemies.reserve(config.roster.size());
        for (const auto& spawn : config.roster) {
            enemies.emplace_back(spawn.name, Side::Enemy, spawn.x, fighterConfig);
            enemies.back().setFacing(-1);
            brains.push_back(ai.createBrain());
            brains.back()->setPlayer(&player);
        }

        session.addTransition(SessionState::Playing, SessionState::Falling);
        session.addTransition(SessionState::Playing, SessionState::Won);
        session.addTransition(SessionState::Playing, SessionState::Lost);
        session.addTransition(SessionState::Falling, SessionState::Lost);
    }

    Random rng;
    Fighter player;
    std::vector<Fighter> enemies;
    EnemyAI ai;
    std::vector<std::unique_ptr<EnemyBrain>> brains;
    Encounter encounter;
    ScrollCamera camera;
    StateMachine<SessionState> session;

    std::unique_ptr<Hazard> hazard;
    bool hazardSpawned = false;
    std::optional<FallSequence> fall;
    LoseReason loseReason = LoseReason::None;
    bool flurry = false;
};

Game::Game(const GameConfig& config) : config_(config) {
    auto valid = validateGameConfig(config_);
    if (valid.isError()) {
        throwError(valid.message());
    }

    seed_ = config_.seed != 0 ? config_.seed : Random().seed();
    world_ = std::make_unique<World>(config_, seed_);
    refreshSummary();
    DOJO_LOG_SESSION("Session started (seed {}, {} enemies)", seed_, config_.roster.size());
}

Game::~Game() = default;

float Game::clampStep(float dtMs, float maxStepMs) {
    return std::clamp(dtMs, 0.0f, maxStepMs);
}

const HudSummary& Game::advance(float dtMs, const InputState& input) {
    float dt = clampStep(dtMs, config_.world.maxStepMs);
    ++tickCount_;
    World& w = *world_;

    // Global toggles and reset
    SessionState state = w.session.getState();
    if (input.reset && state != SessionState::Playing) {
        reset();
        return summary_;
    }
    if (input.toggleFlurry && state == SessionState::Playing) {
        w.flurry = !w.flurry;
        w.player.setFlurry(w.flurry);
        DOJO_LOG_INFO("Flurry mode {}", w.flurry ? "on" : "off");
    }

    if (state == SessionState::Won || state == SessionState::Lost) {
        refreshSummary();
        return summary_;
    }

    if (state == SessionState::Falling) {
        w.session.tick(dt);
        if (w.fall && w.fall->update(dt, w.player)) {
            setSession(SessionState::Lost, LoseReason::Fall);
        }
        refreshSummary();
        return summary_;
    }

    w.session.tick(dt);

    // Opponent selection
    w.encounter.selectOpponent(w.player, w.enemies);
    Fighter* foe = w.encounter.opponent(w.enemies);
    EncounterPhase phase = w.encounter.phase();

    // Player
    if (phase == EncounterPhase::Bowing) {
        w.player.updateBow(dt);
    } else {
        PlayerController controller(input, foe);
        controller.setGuardOnly(phase == EncounterPhase::PostBow);
        StrikeTargets targets{foe, w.hazard && w.hazard->active() ? w.hazard.get() : nullptr};
        w.player.update(dt, &controller, targets);
    }

    // Active enemy; the rest of the roster stands still
    if (foe) {
        switch (phase) {
            case EncounterPhase::Bowing:
                foe->updateBow(dt);
                break;
            case EncounterPhase::PostBow:
                foe->update(dt, nullptr, StrikeTargets{});
                break;
            case EncounterPhase::Fight: {
                auto& brain = w.brains[static_cast<size_t>(w.encounter.opponentIndex())];
                foe->update(dt, brain.get(), StrikeTargets{&w.player, nullptr});
                break;
            }
            case EncounterPhase::Idle:
                break;
        }
    }

    updateHazard(dt);

    w.encounter.updatePhase(dt, w.player, w.enemies);

    w.camera.follow(w.player.x());

    checkTerminal();
    refreshSummary();
    return summary_;
}

void Game::updateHazard(float dtMs) {
    World& w = *world_;
    int trigger = config_.hazard.triggerIndex;
    if (!w.hazardSpawned && trigger >= 0 && static_cast<size_t>(trigger) < w.enemies.size() &&
        !w.enemies[static_cast<size_t>(trigger)].alive()) {
        w.hazard = std::make_unique<Hazard>(w.player.x(), config_.hazard);
        w.hazardSpawned = true;
    }

    if (!w.hazard)
        return;

    w.hazard->update(dtMs, w.player);
    if (w.hazard->gone()) {
        DOJO_LOG_DEBUG("Hazard dissolved");
        w.hazard.reset();
    }
}

void Game::checkTerminal() {
    World& w = *world_;

    if (!w.player.alive()) {
        setSession(SessionState::Lost, LoseReason::Combat);
        return;
    }

    bool allDown = std::none_of(w.enemies.begin(), w.enemies.end(), [](const Fighter& e) { return e.alive(); });
    if (allDown && w.player.x() > config_.world.width - config_.world.endMargin) {
        setSession(SessionState::Won);
        return;
    }

    if (FallSequence::shouldTrigger(w.player, w.encounter.hasOpponent(), w.camera.offset(), config_.fall)) {
        w.fall.emplace(w.player, config_.fall);
        setSession(SessionState::Falling);
    }
}

void Game::setSession(SessionState state, LoseReason reason) {
    World& w = *world_;
    w.session.setState(state);
    w.loseReason = reason;
    if (state == SessionState::Falling) {
        DOJO_LOG_SESSION("Session: falling");
    } else {
        DOJO_LOG_SESSION("Session: {} (reason {}) after {} ticks", sessionStateToString(state),
                         loseReasonToString(reason), tickCount_);
    }
}

void Game::reset() {
    DOJO_LOG_SESSION("Session reset");
    world_ = std::make_unique<World>(config_, seed_);
    refreshSummary();
}

void Game::refreshSummary() {
    const World& w = *world_;
    HudSummary s;

    s.playerHealth = w.player.healthFraction();

    const Fighter* foe = w.encounter.opponent(w.enemies);
    if (!foe || !foe->alive()) {
        auto it = std::find_if(w.enemies.begin(), w.enemies.end(), [](const Fighter& e) { return e.alive(); });
        foe = it != w.enemies.end() ? &*it : nullptr;
    }
    s.opponentHealth = foe ? foe->healthFraction() : 0.0f;

    s.debugTag = w.flurry;
    s.cameraOffset = w.camera.offset();
    s.session = w.session.getState();
    s.loseReason = w.loseReason;

    switch (s.session) {
        case SessionState::Won:
            s.message = StatusMessage::Win;
            s.messageOpacity = 1.0f;
            break;
        case SessionState::Lost:
            s.message = w.loseReason == LoseReason::Fall ? StatusMessage::LoseFall : StatusMessage::LoseCombat;
            s.messageOpacity = 1.0f;
            break;
        case SessionState::Falling:
            break;
        case SessionState::Playing:
            if (w.hazard && w.hazard->active()) {
                s.message = StatusMessage::HazardPrompt;
                s.messageOpacity = 0.85f;
            } else if (w.encounter.phase() == EncounterPhase::Bowing) {
                s.message = StatusMessage::Greeting;
                s.messageOpacity = 0.9f;
            } else if (w.encounter.phase() == EncounterPhase::PostBow) {
                s.message = StatusMessage::Guard;
                s.messageOpacity = 0.8f;
            } else if (w.encounter.phase() == EncounterPhase::Idle) {
                s.message = StatusMessage::Advance;
                s.messageOpacity = 0.5f;
            } else if (w.flurry) {
                s.message = StatusMessage::DebugTag;
                s.messageOpacity = 0.6f;
            }
            break;
    }

    summary_ = s;
}

const HudSummary& Game::summary() const {
    return summary_;
}

SessionState Game::session() const {
    return world_->session.getState();
}

LoseReason Game::loseReason() const {
    return world_->loseReason;
}

EncounterPhase Game::encounterPhase() const {
    return world_->encounter.phase();
}

bool Game::flurry() const {
    return world_->flurry;
}

Fighter& Game::player() {
    return world_->player;
}

const Fighter& Game::player() const {
    return world_->player;
}

std::vector<Fighter>& Game::enemies() {
    return world_->enemies;
}

const std::vector<Fighter>& Game::enemies() const {
    return world_->enemies;
}

const Fighter* Game::opponent() const {
    return world_->encounter.opponent(world_->enemies);
}

const Hazard* Game::hazard() const {
    return world_->hazard.get();
}

bool Game::hazardSpawned() const {
    return world_->hazardSpawned;
}

const FallSequence* Game::fall() const {
    return world_->fall ? &*world_->fall : nullptr;
}

float Game::cameraOffset() const {
    return world_->camera.offset();
}

const GameConfig& Game::config() const {
    return config_;
}

uint64_t Game::seed() const {
    return seed_;
}

uint64_t Game::tickCount() const {
    return tickCount_;
}

} // namespace dojo
