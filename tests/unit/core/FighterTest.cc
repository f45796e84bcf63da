#include "dojo/core/Fighter.hh"
#include "dojo/core/Hazard.hh"
#include <gtest/gtest.h>

#include <memory>

using namespace dojo;

namespace {

// Replays a fixed intent every tick.
class ScriptedController : public FighterController {
  public:
    FighterIntent decide(const Fighter& /*self*/, float /*dtMs*/) override {
        ++calls;
        FighterIntent out = next;
        if (once) {
            next = FighterIntent{};
        }
        return out;
    }

    FighterIntent next;
    bool once = false;
    int calls = 0;
};

void runAttack(Fighter& attacker, Fighter& defender, float dtMs) {
    StrikeTargets targets{&defender, nullptr};
    for (int i = 0; i < 1000 && attacker.isAttacking(); ++i) {
        attacker.update(dtMs, nullptr, targets);
    }
}

} // namespace

class FighterTest : public ::testing::Test {
  protected:
    void SetUp() override {
        player = std::make_unique<Fighter>("Player", Side::Player, 100.0f, config);
        enemy = std::make_unique<Fighter>("Guard A", Side::Enemy, 190.0f, config);
        enemy->setFacing(-1);
    }

    FighterConfig config;
    std::unique_ptr<Fighter> player;
    std::unique_ptr<Fighter> enemy;
};

TEST_F(FighterTest, SpawnsOnGroundWithFullHealth) {
    EXPECT_FLOAT_EQ(player->x(), 100.0f);
    EXPECT_FLOAT_EQ(player->y(), config.groundY);
    EXPECT_FLOAT_EQ(player->health(), 100.0f);
    EXPECT_FLOAT_EQ(player->healthFraction(), 1.0f);
    EXPECT_TRUE(player->alive());
    EXPECT_EQ(player->stance(), Height::Mid);
    EXPECT_EQ(player->state(), FighterState::Idle);
    EXPECT_TRUE(player->isPlayer());
    EXPECT_FALSE(enemy->isPlayer());
}

TEST_F(FighterTest, HealthStaysWithinBounds) {
    player->setHealth(500.0f);
    EXPECT_FLOAT_EQ(player->health(), 100.0f);

    player->setHealth(-20.0f);
    EXPECT_FLOAT_EQ(player->health(), 0.0f);
    EXPECT_FALSE(player->alive());
    EXPECT_EQ(player->state(), FighterState::Dead);

    // Dead stays dead
    player->setHealth(50.0f);
    EXPECT_FLOAT_EQ(player->health(), 0.0f);
}

TEST_F(FighterTest, StanceStepsClamp) {
    player->stepStance(1);
    EXPECT_EQ(player->stance(), Height::High);
    player->stepStance(1);
    EXPECT_EQ(player->stance(), Height::High);
    player->stepStance(-5);
    EXPECT_EQ(player->stance(), Height::Low);
}

TEST_F(FighterTest, OnlyOneAttackAtATime) {
    EXPECT_TRUE(player->startAttack(AttackKind::Punch, Height::Mid));
    EXPECT_FALSE(player->startAttack(AttackKind::Kick, Height::High));
    EXPECT_EQ(player->attack()->kind, AttackKind::Punch);
    EXPECT_EQ(player->state(), FighterState::Attack);
}

TEST_F(FighterTest, CooldownAfterAttackFinishes) {
    player->startAttack(AttackKind::Punch, Height::Mid);
    runAttack(*player, *enemy, 10.0f);

    EXPECT_FALSE(player->isAttacking());
    EXPECT_EQ(player->state(), FighterState::Idle);
    EXPECT_GT(player->attackCooldownMs(), 0.0f);
    EXPECT_FALSE(player->startAttack(AttackKind::Punch, Height::Mid));

    player->update(config.attackCooldownMs, nullptr, {});
    EXPECT_TRUE(player->startAttack(AttackKind::Punch, Height::Mid));
}

TEST_F(FighterTest, BlockedPunchChipsTwo) {
    enemy->setStance(Height::Mid);
    player->startAttack(AttackKind::Punch, Height::Mid);
    runAttack(*player, *enemy, 16.0f);

    EXPECT_FLOAT_EQ(enemy->health(), 98.0f);
    EXPECT_FLOAT_EQ(enemy->x(), 190.0f);
    EXPECT_EQ(enemy->state(), FighterState::Block);
}

TEST_F(FighterTest, UnblockedPunchDamagesAndKnocksBack) {
    enemy->setStance(Height::High);
    player->startAttack(AttackKind::Punch, Height::Mid);
    runAttack(*player, *enemy, 16.0f);

    EXPECT_FLOAT_EQ(enemy->health(), 90.0f);
    EXPECT_NEAR(enemy->x(), 190.0f + 56.0f * 0.6f, 1e-3f);
    EXPECT_EQ(enemy->state(), FighterState::Hit);
    EXPECT_FLOAT_EQ(enemy->hitLagMs(), 160.0f);
}

TEST_F(FighterTest, DefenderMidAttackCannotBlock) {
    enemy->setStance(Height::Mid);
    ASSERT_TRUE(enemy->startAttack(AttackKind::Kick, Height::High));

    player->startAttack(AttackKind::Punch, Height::Mid);
    runAttack(*player, *enemy, 16.0f);

    EXPECT_FLOAT_EQ(enemy->health(), 90.0f);
}

TEST_F(FighterTest, PunchLandsExactlyOnceForAnyTickSize) {
    for (float dt : {1.0f, 5.0f, 16.0f, 33.0f, 95.0f, 400.0f}) {
        Fighter attacker("Player", Side::Player, 100.0f, config);
        Fighter defender("Guard", Side::Enemy, 190.0f, config);
        defender.setStance(Height::Low);

        attacker.startAttack(AttackKind::Punch, Height::Mid);
        runAttack(attacker, defender, dt);

        EXPECT_FLOAT_EQ(defender.health(), 90.0f) << "dt=" << dt;
    }
}

TEST_F(FighterTest, FlurryLandsOneHitPerPeriod) {
    FighterConfig cfg = config;
    cfg.maxHealth = 1000.0f;
    cfg.flurry.knockback = 0.0f;

    for (float dt : {4.0f, 16.0f, 50.0f}) {
        Fighter attacker("Player", Side::Player, 100.0f, cfg);
        Fighter defender("Guard", Side::Enemy, 190.0f, cfg);
        defender.setStance(Height::High);
        attacker.setFlurry(true);

        ASSERT_TRUE(attacker.startAttack(AttackKind::Punch, Height::Mid));
        EXPECT_FLOAT_EQ(attacker.attack()->activeMs, 800.0f);
        EXPECT_FLOAT_EQ(attacker.attack()->recoverMs, 120.0f);

        runAttack(attacker, defender, dt);

        // floor(800 / 45) = 17 hits of 8
        EXPECT_FLOAT_EQ(defender.health(), 1000.0f - 17.0f * 8.0f) << "dt=" << dt;
    }
}

TEST_F(FighterTest, FlurryIgnoredForEnemiesAndKicks) {
    enemy->setFlurry(true);
    ASSERT_TRUE(enemy->startAttack(AttackKind::Punch, Height::Mid));
    EXPECT_FLOAT_EQ(enemy->attack()->activeMs, 90.0f);

    player->setFlurry(true);
    ASSERT_TRUE(player->startAttack(AttackKind::Kick, Height::Mid));
    EXPECT_FLOAT_EQ(player->attack()->activeMs, 110.0f);
}

TEST_F(FighterTest, HitLagFreezesControl) {
    ScriptedController controller;
    controller.next.moveDir = 1;

    HitOutcome outcome;
    outcome.contact = true;
    outcome.damage = 5.0f;
    outcome.hitLagMs = 160.0f;
    player->receiveHit(outcome);
    EXPECT_EQ(player->state(), FighterState::Hit);

    float startX = player->x();
    player->update(100.0f, &controller, {});
    EXPECT_FLOAT_EQ(player->x(), startX);
    EXPECT_EQ(controller.calls, 0);

    player->update(100.0f, &controller, {});
    EXPECT_EQ(controller.calls, 1);
    EXPECT_GT(player->x(), startX);
    EXPECT_EQ(player->state(), FighterState::Walk);
}

TEST_F(FighterTest, LethalHitKills) {
    HitOutcome outcome;
    outcome.contact = true;
    outcome.damage = 150.0f;
    outcome.hitLagMs = 160.0f;
    enemy->receiveHit(outcome);

    EXPECT_FALSE(enemy->alive());
    EXPECT_FLOAT_EQ(enemy->health(), 0.0f);
    EXPECT_EQ(enemy->state(), FighterState::Dead);
    EXPECT_FALSE(enemy->startAttack(AttackKind::Punch, Height::Mid));
}

TEST_F(FighterTest, HitsIgnoredWhileBowing) {
    player->beginBow();

    HitOutcome outcome;
    outcome.contact = true;
    outcome.damage = 6.0f;
    outcome.hitLagMs = 120.0f;
    player->receiveHit(outcome);

    EXPECT_FLOAT_EQ(player->health(), 100.0f);
    EXPECT_FLOAT_EQ(player->hitLagMs(), 0.0f);
    EXPECT_EQ(player->state(), FighterState::Bow);
    EXPECT_TRUE(player->isBowing());
}

TEST_F(FighterTest, HazardTakesTheStrikeBeforeTheOpponent) {
    // A pest large enough to cover the punch, hovering at chest height
    HazardConfig hazardConfig;
    hazardConfig.entryOffsetX = 60.0f;
    hazardConfig.hoverY = 540.0f;
    hazardConfig.entryLift = 0.0f;
    hazardConfig.width = 200.0f;
    hazardConfig.height = 300.0f;
    Hazard hazard(player->x(), hazardConfig);

    enemy->setStance(Height::High);
    player->startAttack(AttackKind::Punch, Height::Mid);
    StrikeTargets targets{enemy.get(), &hazard};
    for (int i = 0; i < 1000 && player->isAttacking(); ++i) {
        player->update(16.0f, nullptr, targets);
    }

    EXPECT_TRUE(hazard.defeated());
    EXPECT_EQ(hazard.phase(), HazardPhase::Dissolve);
    EXPECT_FLOAT_EQ(enemy->health(), 100.0f);
    EXPECT_FLOAT_EQ(enemy->x(), 190.0f);
}

TEST_F(FighterTest, WalkSpeedDependsOnStanceAndSide) {
    EXPECT_FLOAT_EQ(player->moveSpeed(), 180.0f);
    player->setStance(Height::Low);
    EXPECT_FLOAT_EQ(player->moveSpeed(), 180.0f * 0.9f);
    player->setStance(Height::High);
    EXPECT_FLOAT_EQ(player->moveSpeed(), 180.0f * 1.05f);

    EXPECT_FLOAT_EQ(enemy->moveSpeed(), 180.0f * 0.85f);
}

TEST_F(FighterTest, MovementClampedToWorldEdges) {
    ScriptedController controller;
    controller.next.moveDir = -1;
    for (int i = 0; i < 100; ++i) {
        player->update(32.0f, &controller, {});
    }
    EXPECT_FLOAT_EQ(player->x(), config.edgeMargin);
}

TEST_F(FighterTest, IntentAttackAimsAtNewStance) {
    ScriptedController controller;
    controller.once = true;
    controller.next.stanceStep = -1;
    controller.next.attack = AttackRequest{AttackKind::Kick, std::nullopt};

    player->update(16.0f, &controller, {});
    ASSERT_TRUE(player->isAttacking());
    EXPECT_EQ(player->stance(), Height::Low);
    EXPECT_EQ(player->attack()->height, Height::Low);
}

TEST_F(FighterTest, NoMovementWhileAttacking) {
    ScriptedController controller;
    controller.next.moveDir = 1;
    player->startAttack(AttackKind::Punch, Height::Mid);

    float startX = player->x();
    player->update(16.0f, &controller, {});
    EXPECT_FLOAT_EQ(player->x(), startX);
}

TEST_F(FighterTest, ActiveHitboxOnlyWhileActive) {
    player->startAttack(AttackKind::Punch, Height::Mid);
    EXPECT_FALSE(player->activeHitbox().has_value());

    player->update(120.0f, nullptr, {});
    EXPECT_TRUE(player->activeHitbox().has_value());

    player->update(100.0f, nullptr, {});
    EXPECT_FALSE(player->activeHitbox().has_value());
}

TEST_F(FighterTest, BowRunsDownHoldUp) {
    player->startAttack(AttackKind::Punch, Height::Mid);
    player->beginBow();
    EXPECT_TRUE(player->isBowing());
    EXPECT_FALSE(player->isAttacking());
    EXPECT_EQ(player->state(), FighterState::Bow);
    EXPECT_EQ(player->bow()->phase, BowPhase::Down);

    player->updateBow(330.0f);
    EXPECT_EQ(player->bow()->phase, BowPhase::Hold);
    EXPECT_NEAR(player->bow()->elapsedMs, 10.0f, 1e-3f);
    EXPECT_GT(player->bowBlend(), 0.9f);

    player->updateBow(360.0f);
    EXPECT_EQ(player->bow()->phase, BowPhase::Up);

    player->updateBow(320.0f);
    EXPECT_FALSE(player->isBowing());
    EXPECT_EQ(player->state(), FighterState::Idle);

    for (int i = 0; i < 200; ++i) {
        player->updateBow(16.0f);
    }
    EXPECT_FLOAT_EQ(player->bowBlend(), 0.0f);
}

TEST_F(FighterTest, CannotAttackWhileBowing) {
    player->beginBow();
    EXPECT_FALSE(player->startAttack(AttackKind::Punch, Height::Mid));
}

TEST_F(FighterTest, FallFreezesUpdates) {
    ScriptedController controller;
    controller.next.moveDir = 1;
    player->beginFall();
    EXPECT_EQ(player->state(), FighterState::Fall);

    float startX = player->x();
    player->update(16.0f, &controller, {});
    EXPECT_FLOAT_EQ(player->x(), startX);
    EXPECT_EQ(controller.calls, 0);

    player->forceDefeat();
    EXPECT_FALSE(player->alive());
    EXPECT_EQ(player->state(), FighterState::Dead);
}
