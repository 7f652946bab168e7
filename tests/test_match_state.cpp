#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "matchstate.hpp"
#include "mocks/mock_random.hpp"
#include <cmath>

using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

class MatchStateTest : public ::testing::Test {
protected:
    void SetUp() override {
        ON_CALL(rng, uniformInt(_, _)).WillByDefault(Return(0));
    }

    // Active rally with the ball placed by the caller.
    MatchState rally(double x, double y, double vx, double vy) const {
        MatchState s = initialState(cfg);
        s.phase = Phase::Active;
        s.ball.body.x = x;
        s.ball.body.y = y;
        s.ball.velocity = glm::dvec2(vx, vy);
        return s;
    }

    MatchConfig cfg;
    NiceMock<MockRandom> rng;
    InputState none;
};

TEST_F(MatchStateTest, InitialStateIsIdleAndCentered) {
    MatchState s = initialState(cfg);
    EXPECT_EQ(s.phase, Phase::Idle);
    EXPECT_FALSE(s.started());
    EXPECT_TRUE(s.running());
    EXPECT_DOUBLE_EQ(s.ball.body.x, 390.0);
    EXPECT_DOUBLE_EQ(s.ball.body.y, 290.0);
    EXPECT_EQ(s.ball.velocity, glm::dvec2(0.0, 0.0));
    EXPECT_DOUBLE_EQ(s.playerPaddle.x, 50.0);
    EXPECT_DOUBLE_EQ(s.playerPaddle.y, 250.0);
    EXPECT_DOUBLE_EQ(s.aiPaddle.x, 735.0);
    EXPECT_DOUBLE_EQ(s.speedMultiplier, 1.0);
    EXPECT_EQ(s.playerScore, 0);
    EXPECT_EQ(s.aiScore, 0);
}

TEST_F(MatchStateTest, IdleTickDoesNothing) {
    MatchState s = initialState(cfg);
    InputState held;
    held.moveUp = true;
    EXPECT_CALL(rng, uniformInt(_, _)).Times(0);
    EXPECT_EQ(step(s, held, cfg, rng), s);
}

TEST_F(MatchStateTest, StartServesTowardOpponent) {
    EXPECT_CALL(rng, uniformInt(-1, 1)).WillOnce(Return(1));
    MatchState s = applyCommand(initialState(cfg), Command::Start, cfg, rng);
    EXPECT_EQ(s.phase, Phase::Active);
    EXPECT_TRUE(s.started());
    EXPECT_DOUBLE_EQ(s.ball.velocity.x, cfg.baseBallSpeed);
    EXPECT_DOUBLE_EQ(s.ball.velocity.y, 1.0);
}

TEST_F(MatchStateTest, StartInputAdvancesSameTick) {
    InputState in;
    in.start = true;
    MatchState s = step(initialState(cfg), in, cfg, rng);
    EXPECT_EQ(s.phase, Phase::Active);
    EXPECT_DOUBLE_EQ(std::abs(s.ball.velocity.x), cfg.baseBallSpeed);
    EXPECT_GT(s.ball.velocity.x, 0.0);
    EXPECT_DOUBLE_EQ(s.ball.body.x, 390.0 + cfg.baseBallSpeed);
}

TEST_F(MatchStateTest, StartIgnoredOutsideIdle) {
    MatchState active = rally(300.0, 300.0, -4.0, 2.0);
    EXPECT_EQ(applyCommand(active, Command::Start, cfg, rng), active);

    MatchState done = initialState(cfg);
    done.aiScore = cfg.winScore;
    done.phase = Phase::Finished;
    EXPECT_EQ(applyCommand(done, Command::Start, cfg, rng), done);
}

TEST_F(MatchStateTest, MoveCommandsDoNotTransition) {
    MatchState s = initialState(cfg);
    EXPECT_EQ(applyCommand(s, Command::MoveUp, cfg, rng), s);
    EXPECT_EQ(applyCommand(s, Command::MoveDown, cfg, rng), s);
}

TEST_F(MatchStateTest, TopWallBounce) {
    MatchState s = step(rally(400.0, 0.0, 4.0, -4.0), none, cfg, rng);
    EXPECT_DOUBLE_EQ(s.ball.velocity.y, 4.0);
    EXPECT_DOUBLE_EQ(s.ball.body.y, 0.0);
    EXPECT_DOUBLE_EQ(s.ball.body.x, 404.0);
    EXPECT_EQ(s.phase, Phase::Active);
}

TEST_F(MatchStateTest, BottomWallBounce) {
    MatchState s = step(rally(400.0, 578.0, 4.0, 4.0), none, cfg, rng);
    EXPECT_DOUBLE_EQ(s.ball.velocity.y, -4.0);
    EXPECT_DOUBLE_EQ(s.ball.body.y, 580.0);
}

TEST_F(MatchStateTest, PlayerPaddleCenterHitGoesStraightBack) {
    // Ball center at y=300 is band 2 of the paddle at y=250.
    MatchState s = step(rally(66.0, 290.0, -4.0, 0.0), none, cfg, rng);
    EXPECT_DOUBLE_EQ(s.speedMultiplier, 1.1);
    EXPECT_DOUBLE_EQ(s.ball.velocity.x, cfg.baseBallSpeed * 1.1);
    EXPECT_DOUBLE_EQ(s.ball.velocity.y, 0.0);

    // Still overlapping next tick, but already leaving: no second hit.
    MatchState t = step(s, none, cfg, rng);
    EXPECT_DOUBLE_EQ(t.speedMultiplier, 1.1);
    EXPECT_GT(t.ball.velocity.x, 0.0);
}

TEST_F(MatchStateTest, OpponentPaddleTopHitAnglesUpAndLeft) {
    // AI paddle spans y 250..350; ball center at 255 is band 0.
    MatchState s = step(rally(716.0, 245.0, 4.0, 0.0), none, cfg, rng);
    EXPECT_DOUBLE_EQ(s.speedMultiplier, 1.1);
    EXPECT_LT(s.ball.velocity.x, 0.0);
    EXPECT_LT(s.ball.velocity.y, 0.0);
    EXPECT_NEAR(glm::length(s.ball.velocity), cfg.baseBallSpeed * 1.1, 1e-9);
}

TEST_F(MatchStateTest, SpeedMultiplierIsCapped) {
    MatchState start = rally(66.0, 290.0, -4.0, 0.0);
    start.speedMultiplier = 2.95;
    MatchState s = step(start, none, cfg, rng);
    EXPECT_DOUBLE_EQ(s.speedMultiplier, cfg.maxSpeedMultiplier);
    EXPECT_NEAR(glm::length(s.ball.velocity), cfg.baseBallSpeed * cfg.maxSpeedMultiplier, 1e-9);

    start.speedMultiplier = 3.0;
    s = step(start, none, cfg, rng);
    EXPECT_DOUBLE_EQ(s.speedMultiplier, 3.0);
}

TEST_F(MatchStateTest, OpponentTracksNoisyTarget) {
    // Ball center 500, paddle center 300: move down.
    EXPECT_CALL(rng, uniformInt(-cfg.aiTargetNoise, cfg.aiTargetNoise)).WillOnce(Return(-20));
    MatchState s = step(rally(400.0, 490.0, 4.0, 0.0), none, cfg, rng);
    EXPECT_DOUBLE_EQ(s.aiPaddle.y, 250.0 + cfg.paddleSpeed);
}

TEST_F(MatchStateTest, OpponentHoldsInsideDeadZone) {
    // Target 300 + 10 = 310, paddle center 300: within 15.
    EXPECT_CALL(rng, uniformInt(_, _)).WillOnce(Return(10));
    MatchState s = step(rally(400.0, 290.0, 4.0, 0.0), none, cfg, rng);
    EXPECT_DOUBLE_EQ(s.aiPaddle.y, 250.0);
}

TEST_F(MatchStateTest, OpponentMovesUpAndStaysInBounds) {
    MatchState start = rally(400.0, 10.0, 4.0, 0.0);
    start.aiPaddle.y = 2.0;
    MatchState s = step(start, none, cfg, rng);
    EXPECT_DOUBLE_EQ(s.aiPaddle.y, 0.0);
}

TEST_F(MatchStateTest, PlayerPaddleFollowsHeldInput) {
    InputState in;
    in.moveDown = true;
    MatchState s = step(rally(400.0, 300.0, 4.0, 0.0), in, cfg, rng);
    EXPECT_DOUBLE_EQ(s.playerPaddle.y, 250.0 + cfg.paddleSpeed);

    in.moveUp = true;
    EXPECT_DOUBLE_EQ(step(s, in, cfg, rng).playerPaddle.y, s.playerPaddle.y);
}

TEST_F(MatchStateTest, OpponentScoresWhenBallPassesLeft) {
    MatchState start = rally(2.0, 100.0, -4.0, 0.0);
    start.speedMultiplier = 1.7;
    MatchState s = step(start, none, cfg, rng);
    EXPECT_EQ(s.aiScore, 1);
    EXPECT_EQ(s.playerScore, 0);
    EXPECT_EQ(s.phase, Phase::Idle);
    EXPECT_DOUBLE_EQ(s.ball.body.x, cfg.ballCenterX());
    EXPECT_DOUBLE_EQ(s.ball.body.y, cfg.ballCenterY());
    EXPECT_EQ(s.ball.velocity, glm::dvec2(0.0, 0.0));
    EXPECT_DOUBLE_EQ(s.speedMultiplier, 1.0);
}

TEST_F(MatchStateTest, PlayerScoresWhenBallPassesRight) {
    MatchState s = step(rally(798.0, 100.0, 4.0, 0.0), none, cfg, rng);
    EXPECT_EQ(s.playerScore, 1);
    EXPECT_EQ(s.aiScore, 0);
    EXPECT_EQ(s.phase, Phase::Idle);
    EXPECT_EQ(s.ball.velocity, glm::dvec2(0.0, 0.0));
}

TEST_F(MatchStateTest, WinningPointFinishesMatch) {
    MatchState start = rally(798.0, 100.0, 4.0, 0.0);
    start.playerScore = cfg.winScore - 1;
    MatchState s = step(start, none, cfg, rng);
    EXPECT_EQ(s.playerScore, cfg.winScore);
    EXPECT_EQ(s.phase, Phase::Finished);
    EXPECT_FALSE(s.running());
    EXPECT_EQ(winnerOf(s, cfg), Side::Player);
    EXPECT_EQ(snapshot(s, cfg).winner, Side::Player);
}

TEST_F(MatchStateTest, FinishedIgnoresTicksAndInput) {
    MatchState start = rally(2.0, 100.0, -4.0, 0.0);
    start.aiScore = cfg.winScore - 1;
    MatchState done = step(start, none, cfg, rng);
    ASSERT_EQ(done.phase, Phase::Finished);
    EXPECT_EQ(winnerOf(done, cfg), Side::Ai);

    InputState in;
    in.moveDown = true;
    in.start = true;
    MatchState s = done;
    for (int i = 0; i < 50; ++i) s = step(s, in, cfg, rng);
    EXPECT_EQ(s, done);
}

TEST_F(MatchStateTest, RestartIsIdempotent) {
    MatchState start = rally(2.0, 100.0, -4.0, 0.0);
    start.aiScore = cfg.winScore - 1;
    start.playerScore = 4;
    start.playerPaddle.y = 0.0;
    MatchState done = step(start, none, cfg, rng);
    ASSERT_EQ(done.phase, Phase::Finished);

    MatchState once  = applyCommand(done, Command::Restart, cfg, rng);
    MatchState twice = applyCommand(once, Command::Restart, cfg, rng);
    EXPECT_EQ(once, initialState(cfg));
    EXPECT_EQ(twice, once);

    InputState in;
    in.restart = true;
    EXPECT_EQ(step(done, in, cfg, rng), once);
}

TEST_F(MatchStateTest, RestartIgnoredWhileRunning) {
    MatchState active = rally(300.0, 300.0, -4.0, 2.0);
    active.playerScore = 3;
    EXPECT_EQ(applyCommand(active, Command::Restart, cfg, rng), active);
}

TEST_F(MatchStateTest, SnapshotMirrorsState) {
    MatchState s = rally(123.0, 45.0, 4.0, 1.0);
    s.playerScore = 2;
    s.aiScore = 5;
    Snapshot snap = snapshot(s, cfg);
    EXPECT_EQ(snap.ball, s.ball.body);
    EXPECT_EQ(snap.playerPaddle, s.playerPaddle);
    EXPECT_EQ(snap.aiPaddle, s.aiPaddle);
    EXPECT_EQ(snap.playerScore, 2);
    EXPECT_EQ(snap.aiScore, 5);
    EXPECT_EQ(snap.phase, Phase::Active);
    EXPECT_EQ(snap.winner, Side::None);
}

// Long seeded run with random input: the invariants hold on every tick.
TEST(MatchStateInvariants, HoldAcrossManyTicks) {
    MatchConfig cfg;
    SeededRandom rng(1234);
    SeededRandom keys(99);
    MatchState s = initialState(cfg);
    InputState in;
    double prevMult = s.speedMultiplier;
    Phase prevPhase = s.phase;
    int finishedCount = 0;

    for (int t = 0; t < 50000; ++t) {
        in.moveUp   = keys.uniformInt(0, 3) == 0;
        in.moveDown = keys.uniformInt(0, 2) == 0;
        in.start    = s.phase == Phase::Idle;
        in.restart  = s.phase == Phase::Finished;
        if (in.restart) ++finishedCount;

        s = step(s, in, cfg, rng);

        ASSERT_GE(s.playerPaddle.y, 0.0);
        ASSERT_LE(s.playerPaddle.y, cfg.arenaHeight - cfg.paddleHeight);
        ASSERT_GE(s.aiPaddle.y, 0.0);
        ASSERT_LE(s.aiPaddle.y, cfg.arenaHeight - cfg.paddleHeight);
        ASSERT_LE(s.speedMultiplier, cfg.maxSpeedMultiplier);
        ASSERT_LE(glm::length(s.ball.velocity), cfg.baseBallSpeed * cfg.maxSpeedMultiplier + 1e-9);
        if (prevPhase == Phase::Active && s.phase == Phase::Active)
            ASSERT_GE(s.speedMultiplier, prevMult);
        if (s.phase == Phase::Idle)
            ASSERT_EQ(s.ball.velocity, glm::dvec2(0.0, 0.0));

        prevMult = s.speedMultiplier;
        prevPhase = s.phase;
    }
    EXPECT_GT(finishedCount, 0);
}

TEST_F(MatchStateTest, SteepestServeRespectsSpeedCap) {
    cfg.maxSpeedMultiplier = 1.1;
    cfg.serveVerticalJitter = 1;
    ASSERT_NO_THROW(cfg.validate());
    EXPECT_CALL(rng, uniformInt(-1, 1)).WillOnce(Return(-1));
    MatchState s = applyCommand(initialState(cfg), Command::Start, cfg, rng);
    EXPECT_DOUBLE_EQ(s.ball.velocity.y, -1.0);
    EXPECT_LE(glm::length(s.ball.velocity), cfg.baseBallSpeed * cfg.maxSpeedMultiplier);
}
