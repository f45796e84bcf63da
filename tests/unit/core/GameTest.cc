#include "dojo/core/Game.hh"
#include "dojo/core/InputRecorder.hh"
#include "dojo/utils/ErrorHandling.hh"
#include <gtest/gtest.h>

#include <functional>
#include <vector>

using namespace dojo;

class GameTest : public ::testing::Test {
  protected:
    void SetUp() override { config.seed = 1234; }

    // Advances with the given input until pred holds. Returns ticks used,
    // or -1 if maxTicks ran out first.
    int advanceUntil(Game& game, const std::function<bool()>& pred, InputState input = {}, float dtMs = 20.0f,
                     int maxTicks = 2000) {
        for (int i = 0; i < maxTicks; ++i) {
            if (pred())
                return i;
            game.advance(dtMs, input);
            input.consumeEdges();
        }
        return pred() ? maxTicks : -1;
    }

    static InputState holding(bool left, bool right) {
        InputState in;
        in.left = left;
        in.right = right;
        return in;
    }

    static InputState pressed(void (*set)(InputState&)) {
        InputState in;
        set(in);
        return in;
    }

    GameConfig config;
};

// Session start

TEST_F(GameTest, StartsPlayingWithAdvancePrompt) {
    Game game(config);
    const auto& hud = game.summary();

    EXPECT_EQ(game.seed(), 1234u);
    EXPECT_EQ(hud.session, SessionState::Playing);
    EXPECT_EQ(hud.loseReason, LoseReason::None);
    EXPECT_FLOAT_EQ(hud.playerHealth, 1.0f);
    EXPECT_FLOAT_EQ(hud.opponentHealth, 1.0f);
    EXPECT_EQ(hud.message, StatusMessage::Advance);
    EXPECT_FLOAT_EQ(hud.messageOpacity, 0.5f);
    EXPECT_FALSE(hud.debugTag);

    EXPECT_EQ(game.enemies().size(), 4u);
    EXPECT_FLOAT_EQ(game.player().x(), 80.0f);
    EXPECT_EQ(game.encounterPhase(), EncounterPhase::Idle);
    EXPECT_EQ(game.opponent(), nullptr);
}

TEST_F(GameTest, ZeroSeedResolvedOnce) {
    config.seed = 0;
    Game game(config);
    uint64_t seed = game.seed();
    EXPECT_NE(seed, 0u);

    game.player().setHealth(0.0f);
    game.advance(16.0f, {});
    game.advance(16.0f, pressed([](InputState& in) { in.reset = true; }));
    EXPECT_EQ(game.seed(), seed);
}

TEST_F(GameTest, InvalidConfigThrows) {
    config.world.width = -1.0f;
    EXPECT_THROW(Game game(config), DojoException);
}

TEST_F(GameTest, StepClamp) {
    EXPECT_FLOAT_EQ(Game::clampStep(-5.0f, 32.0f), 0.0f);
    EXPECT_FLOAT_EQ(Game::clampStep(16.0f, 32.0f), 16.0f);
    EXPECT_FLOAT_EQ(Game::clampStep(250.0f, 32.0f), 32.0f);

    Game game(config);
    float startX = game.player().x();
    game.advance(1000.0f, holding(false, true));
    EXPECT_NEAR(game.player().x() - startX, 180.0f * 0.032f, 1e-3f);
    EXPECT_EQ(game.tickCount(), 1u);
}

// Encounter flow

TEST_F(GameTest, WalkingUpToAnEnemyStartsTheGreeting) {
    Game game(config);
    int ticks = advanceUntil(game, [&] { return game.encounterPhase() != EncounterPhase::Idle; }, holding(false, true));
    ASSERT_GE(ticks, 0);

    EXPECT_EQ(game.encounterPhase(), EncounterPhase::Bowing);
    EXPECT_EQ(game.summary().message, StatusMessage::Greeting);
    EXPECT_FLOAT_EQ(game.summary().messageOpacity, 0.9f);
    ASSERT_NE(game.opponent(), nullptr);
    EXPECT_EQ(game.opponent()->name(), "Guard A");
    EXPECT_TRUE(game.player().isBowing());
    EXPECT_TRUE(game.opponent()->isBowing());
}

TEST_F(GameTest, BowPostBowFight) {
    Game game(config);
    ASSERT_GE(advanceUntil(game, [&] { return game.encounterPhase() == EncounterPhase::Bowing; }, holding(false, true)),
              0);

    // Attacks are swallowed while bowing
    float bowX = game.player().x();
    game.advance(20.0f, pressed([](InputState& in) { in.punch = true; }));
    EXPECT_FALSE(game.player().isAttacking());
    EXPECT_FLOAT_EQ(game.player().x(), bowX);

    ASSERT_GE(advanceUntil(game, [&] { return game.encounterPhase() == EncounterPhase::PostBow; }), 0);
    EXPECT_EQ(game.summary().message, StatusMessage::Guard);
    EXPECT_FLOAT_EQ(game.summary().messageOpacity, 0.8f);

    // Guard pause: stance changes only
    float pauseX = game.player().x();
    InputState in = holding(false, true);
    in.stanceUp = true;
    in.punch = true;
    game.advance(20.0f, in);
    EXPECT_FLOAT_EQ(game.player().x(), pauseX);
    EXPECT_FALSE(game.player().isAttacking());
    EXPECT_EQ(game.player().stance(), Height::High);

    int ticks = advanceUntil(game, [&] { return game.encounterPhase() == EncounterPhase::Fight; });
    ASSERT_GE(ticks, 0);
    EXPECT_LE(ticks * 20.0f, config.encounter.postBowHoldMs + 20.0f);
    EXPECT_EQ(game.summary().message, StatusMessage::None);
}

TEST_F(GameTest, DefeatingTheOpponentReturnsToIdle) {
    Game game(config);
    ASSERT_GE(advanceUntil(game, [&] { return game.encounterPhase() == EncounterPhase::Fight; }, holding(false, true)),
              0);

    game.enemies()[0].setHealth(0.0f);
    game.advance(20.0f, {});
    EXPECT_EQ(game.encounterPhase(), EncounterPhase::Idle);
    EXPECT_EQ(game.opponent(), nullptr);
    // HUD falls back to the next living enemy
    EXPECT_FLOAT_EQ(game.summary().opponentHealth, 1.0f);
}

// Outcomes

TEST_F(GameTest, PlayerDefeatLosesByCombat) {
    Game game(config);
    game.player().setHealth(0.0f);
    game.advance(16.0f, {});

    EXPECT_EQ(game.session(), SessionState::Lost);
    EXPECT_EQ(game.loseReason(), LoseReason::Combat);
    EXPECT_EQ(game.summary().message, StatusMessage::LoseCombat);
    EXPECT_FLOAT_EQ(game.summary().messageOpacity, 1.0f);
    EXPECT_FLOAT_EQ(game.summary().playerHealth, 0.0f);
}

TEST_F(GameTest, ClearingTheRosterAndReachingTheEndWins) {
    Game game(config);
    for (auto& e : game.enemies()) {
        e.setHealth(0.0f);
    }
    game.player().setPosition(3050.0f, game.player().y());
    game.advance(16.0f, {});

    EXPECT_EQ(game.session(), SessionState::Won);
    EXPECT_EQ(game.summary().message, StatusMessage::Win);
    EXPECT_FLOAT_EQ(game.summary().opponentHealth, 0.0f);
}

TEST_F(GameTest, ReachingTheEndWithEnemiesStandingDoesNotWin) {
    Game game(config);
    game.player().setPosition(3050.0f, game.player().y());
    game.advance(16.0f, {});
    EXPECT_EQ(game.session(), SessionState::Playing);
}

TEST_F(GameTest, WalkingOffTheLeftEdgeFallsAndLoses) {
    Game game(config);
    ASSERT_GE(advanceUntil(game, [&] { return game.session() == SessionState::Falling; }, holding(true, false)), 0);

    ASSERT_NE(game.fall(), nullptr);
    EXPECT_EQ(game.player().state(), FighterState::Fall);
    EXPECT_EQ(game.summary().message, StatusMessage::None);

    // Non-cancelable: input has no effect, ends after exactly the duration
    int ticks = advanceUntil(game, [&] { return game.session() != SessionState::Falling; }, holding(false, true));
    EXPECT_EQ(ticks, static_cast<int>(config.fall.durationMs / 20.0f));

    EXPECT_EQ(game.session(), SessionState::Lost);
    EXPECT_EQ(game.loseReason(), LoseReason::Fall);
    EXPECT_EQ(game.summary().message, StatusMessage::LoseFall);
    EXPECT_FLOAT_EQ(game.summary().playerHealth, 0.0f);
}

TEST_F(GameTest, ResetDuringTheFallRebuildsTheWorld) {
    Game game(config);
    ASSERT_GE(advanceUntil(game, [&] { return game.session() == SessionState::Falling; }, holding(true, false)), 0);

    for (int i = 0; i < 40; ++i) {
        game.advance(20.0f, {});
    }
    ASSERT_EQ(game.session(), SessionState::Falling);
    ASSERT_LT(game.player().opacity(), 1.0f);

    game.advance(20.0f, pressed([](InputState& in) { in.reset = true; }));
    EXPECT_EQ(game.session(), SessionState::Playing);
    EXPECT_EQ(game.loseReason(), LoseReason::None);
    EXPECT_EQ(game.fall(), nullptr);
    EXPECT_TRUE(game.player().alive());
    EXPECT_EQ(game.player().state(), FighterState::Idle);
    EXPECT_FLOAT_EQ(game.player().x(), 80.0f);
    EXPECT_FLOAT_EQ(game.player().y(), config.world.groundY);
    EXPECT_FLOAT_EQ(game.player().opacity(), 1.0f);
    EXPECT_FLOAT_EQ(game.player().health(), 100.0f);
}

TEST_F(GameTest, FallNeedsTheCameraAtTheOrigin) {
    Game game(config);
    // Between Guard A and Guard B without engaging either; the camera trails
    game.player().setPosition(700.0f, game.player().y());
    for (int i = 0; i < 40; ++i) {
        game.advance(20.0f, {});
    }
    game.player().setPosition(25.0f, game.player().y());
    game.advance(20.0f, {});
    EXPECT_GT(game.cameraOffset(), config.fall.cameraEpsilon);
    EXPECT_EQ(game.session(), SessionState::Playing);
}

TEST_F(GameTest, TerminalStatesFreezeUntilReset) {
    Game game(config);
    game.player().setHealth(0.0f);
    game.advance(16.0f, {});
    ASSERT_EQ(game.session(), SessionState::Lost);

    for (int i = 0; i < 50; ++i) {
        game.advance(16.0f, holding(false, true));
    }
    EXPECT_EQ(game.session(), SessionState::Lost);

    game.advance(16.0f, pressed([](InputState& in) { in.reset = true; }));
    EXPECT_EQ(game.session(), SessionState::Playing);
    EXPECT_FLOAT_EQ(game.player().health(), 100.0f);
    EXPECT_FLOAT_EQ(game.player().x(), 80.0f);
    for (const auto& e : game.enemies()) {
        EXPECT_TRUE(e.alive());
        EXPECT_FALSE(e.greeted());
    }
}

TEST_F(GameTest, ResetIgnoredWhilePlaying) {
    Game game(config);
    game.advance(20.0f, holding(false, true));
    float x = game.player().x();

    game.advance(20.0f, pressed([](InputState& in) { in.reset = true; }));
    EXPECT_FLOAT_EQ(game.player().x(), x);
    EXPECT_EQ(game.tickCount(), 2u);
}

// Hazard

TEST_F(GameTest, SecondEnemyDefeatLaunchesHazardOnce) {
    Game game(config);
    EXPECT_FALSE(game.hazardSpawned());

    game.enemies()[1].setHealth(0.0f);
    game.advance(16.0f, {});
    ASSERT_TRUE(game.hazardSpawned());
    ASSERT_NE(game.hazard(), nullptr);
    EXPECT_EQ(game.summary().message, StatusMessage::HazardPrompt);
    EXPECT_FLOAT_EQ(game.summary().messageOpacity, 0.85f);
}

TEST_F(GameTest, HazardStingsThePlayerEventually) {
    Game game(config);
    game.enemies()[1].setHealth(0.0f);
    game.advance(16.0f, {});

    ASSERT_GE(advanceUntil(game, [&] { return game.player().health() < 100.0f; }, {}, 16.0f, 1000), 0);
    EXPECT_FLOAT_EQ(game.player().health(), 100.0f - config.hazard.damage);
}

TEST_F(GameTest, StruckHazardIsDroppedAfterDissolving) {
    // Pest spawns on the player and covers the punch
    config.hazard.entryOffsetX = 0.0f;
    config.hazard.hoverY = 540.0f;
    config.hazard.entryLift = 0.0f;
    config.hazard.width = 300.0f;
    config.hazard.height = 400.0f;
    Game game(config);

    game.enemies()[1].setHealth(0.0f);
    game.advance(20.0f, {});
    ASSERT_NE(game.hazard(), nullptr);

    game.advance(20.0f, pressed([](InputState& in) { in.punch = true; }));
    ASSERT_GE(advanceUntil(game, [&] { return game.hazard() && game.hazard()->defeated(); }, {}, 20.0f, 50), 0);
    EXPECT_FLOAT_EQ(game.player().health(), 100.0f);

    ASSERT_GE(advanceUntil(game, [&] { return game.hazard() == nullptr; }, {}, 20.0f, 100), 0);
    EXPECT_TRUE(game.hazardSpawned());
    EXPECT_NE(game.summary().message, StatusMessage::HazardPrompt);

    // Never respawns
    for (int i = 0; i < 20; ++i) {
        game.advance(20.0f, {});
    }
    EXPECT_EQ(game.hazard(), nullptr);
}

// Flurry

TEST_F(GameTest, FlurryToggle) {
    Game game(config);
    game.advance(16.0f, pressed([](InputState& in) { in.toggleFlurry = true; }));
    EXPECT_TRUE(game.flurry());
    EXPECT_TRUE(game.player().flurry());
    EXPECT_TRUE(game.summary().debugTag);

    game.advance(16.0f, pressed([](InputState& in) { in.toggleFlurry = true; }));
    EXPECT_FALSE(game.flurry());
    EXPECT_FALSE(game.player().flurry());
}

TEST_F(GameTest, FlurryTagShownDuringFight) {
    Game game(config);
    game.advance(16.0f, pressed([](InputState& in) { in.toggleFlurry = true; }));
    ASSERT_GE(advanceUntil(game, [&] { return game.encounterPhase() == EncounterPhase::Fight; }, holding(false, true)),
              0);
    EXPECT_EQ(game.summary().message, StatusMessage::DebugTag);
    EXPECT_FLOAT_EQ(game.summary().messageOpacity, 0.6f);
}

TEST_F(GameTest, FlurryToggleIgnoredAfterTheSession) {
    Game game(config);
    game.player().setHealth(0.0f);
    game.advance(16.0f, {});
    game.advance(16.0f, pressed([](InputState& in) { in.toggleFlurry = true; }));
    EXPECT_FALSE(game.flurry());
}

// Determinism

TEST_F(GameTest, RecordedInputReplaysIdentically) {
    InputRecorder recorder;
    std::vector<HudSummary> live;
    {
        Game game(config);
        recorder.beginRecording(game.seed(), "scripted brawl");
        for (int i = 0; i < 1500; ++i) {
            InputState in;
            in.right = (i / 200) % 3 != 2;
            in.left = (i / 200) % 3 == 2;
            in.punch = i % 37 == 0;
            in.kick = i % 53 == 0;
            in.stanceUp = i % 97 == 0;
            in.stanceDown = i % 131 == 0;
            float dt = 10.0f + static_cast<float>(i % 7);
            recorder.recordFrame(in, dt);
            live.push_back(game.advance(dt, in));
        }
        recorder.stopRecording();
    }

    GameConfig replayConfig = config;
    replayConfig.seed = recorder.recording().metadata.seed;
    Game replay(replayConfig);
    ASSERT_TRUE(recorder.startPlayback());

    size_t i = 0;
    while (auto frame = recorder.nextFrame()) {
        ASSERT_LT(i, live.size());
        EXPECT_EQ(replay.advance(frame->deltaMs, frame->input), live[i]) << "tick " << i;
        ++i;
    }
    EXPECT_EQ(i, live.size());
}
