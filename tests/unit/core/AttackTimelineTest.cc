#include "dojo/core/AttackTimeline.hh"
#include <gtest/gtest.h>

using namespace dojo;

class AttackTimelineTest : public ::testing::Test {
  protected:
    Attack punch = Attack::fromSpec(AttackKind::Punch, Height::Mid);
};

TEST_F(AttackTimelineTest, FromSpecCopiesTable) {
    EXPECT_EQ(punch.kind, AttackKind::Punch);
    EXPECT_EQ(punch.height, Height::Mid);
    EXPECT_FLOAT_EQ(punch.activeStartMs(), 110.0f);
    EXPECT_FLOAT_EQ(punch.activeEndMs(), 200.0f);
    EXPECT_FLOAT_EQ(punch.totalMs(), 410.0f);
    EXPECT_FALSE(punch.applied);
}

TEST_F(AttackTimelineTest, PhaseBoundaries) {
    EXPECT_EQ(punch.phase(), AttackPhase::Windup);

    punch.elapsedMs = 109.9f;
    EXPECT_EQ(punch.phase(), AttackPhase::Windup);

    punch.elapsedMs = 110.0f;
    EXPECT_EQ(punch.phase(), AttackPhase::Active);
    EXPECT_TRUE(punch.isActive());

    punch.elapsedMs = 200.0f;
    EXPECT_EQ(punch.phase(), AttackPhase::Recover);
    EXPECT_FALSE(punch.isActive());

    punch.elapsedMs = 410.0f;
    EXPECT_EQ(punch.phase(), AttackPhase::Finished);
}

TEST_F(AttackTimelineTest, ExtensionRisesHoldsAndFalls) {
    punch.elapsedMs = 0.0f;
    EXPECT_FLOAT_EQ(punch.extension(), 0.0f);

    punch.elapsedMs = 55.0f;
    EXPECT_FLOAT_EQ(punch.extension(), 0.5f);

    punch.elapsedMs = 150.0f;
    EXPECT_FLOAT_EQ(punch.extension(), 1.0f);

    punch.elapsedMs = 305.0f;
    EXPECT_FLOAT_EQ(punch.extension(), 0.5f);

    punch.elapsedMs = 500.0f;
    EXPECT_FLOAT_EQ(punch.extension(), 0.0f);
}

TEST_F(AttackTimelineTest, AdvanceReportsActiveOverlap) {
    auto step = punch.advance(50.0f);
    EXPECT_FALSE(step.touchesActive);
    EXPECT_FALSE(step.finished);

    step = punch.advance(100.0f); // 50 -> 150
    EXPECT_TRUE(step.touchesActive);
    EXPECT_FLOAT_EQ(step.activeOverlapMs, 40.0f);

    step = punch.advance(100.0f); // 150 -> 250
    EXPECT_TRUE(step.touchesActive);
    EXPECT_FLOAT_EQ(step.activeOverlapMs, 50.0f);

    step = punch.advance(100.0f); // 250 -> 350
    EXPECT_FALSE(step.touchesActive);
    EXPECT_FALSE(step.finished);

    step = punch.advance(100.0f);
    EXPECT_TRUE(step.finished);
}

TEST_F(AttackTimelineTest, LargeStepStillTouchesActiveWindow) {
    punch.elapsedMs = 100.0f;
    auto step = punch.advance(150.0f);
    EXPECT_TRUE(step.touchesActive);
    EXPECT_FLOAT_EQ(step.activeOverlapMs, 90.0f);
}

TEST_F(AttackTimelineTest, NegativeStepIgnored) {
    punch.elapsedMs = 20.0f;
    punch.advance(-10.0f);
    EXPECT_FLOAT_EQ(punch.elapsedMs, 20.0f);
}

TEST_F(AttackTimelineTest, ActiveOverlapSumsToActiveDurationForAnyStep) {
    for (float dt : {1.0f, 7.0f, 16.0f, 33.0f}) {
        Attack kick = Attack::fromSpec(AttackKind::Kick, Height::Low);
        float total = 0.0f;
        bool finished = false;
        while (!finished) {
            auto step = kick.advance(dt);
            total += step.activeOverlapMs;
            finished = step.finished;
        }
        EXPECT_NEAR(total, 110.0f, 1e-3f) << "dt=" << dt;
    }
}
