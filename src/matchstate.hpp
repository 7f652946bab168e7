#pragma once
#include <algorithm>
#include <cmath>
#include "matchconfig.hpp"
#include "physics.hpp"
#include "random.hpp"

enum class Phase : int { Idle = 0, Active = 1, Finished = 2 };
enum class Side  : int { None = 0, Player = 1, Ai = 2 };

inline const char* phaseName(Phase p) {
    switch (p) {
        case Phase::Idle:     return "Idle";
        case Phase::Active:   return "Active";
        case Phase::Finished: return "Finished";
    }
    return "?";
}

inline const char* sideName(Side s) {
    switch (s) {
        case Side::None:   return "none";
        case Side::Player: return "player";
        case Side::Ai:     return "ai";
    }
    return "?";
}

struct Ball {
    Rect body;
    glm::dvec2 velocity = glm::dvec2(0.0);
};

inline bool operator==(const Ball& a, const Ball& b) { return a.body == b.body && a.velocity == b.velocity; }

struct MatchState {
    Rect   playerPaddle;
    Rect   aiPaddle;
    Ball   ball;
    int    playerScore     = 0;
    int    aiScore         = 0;
    double speedMultiplier = 1.0;
    Phase  phase           = Phase::Idle;

    bool started() const { return phase == Phase::Active; }
    bool running() const { return phase != Phase::Finished; }
};

inline bool operator==(const MatchState& a, const MatchState& b) {
    return a.playerPaddle == b.playerPaddle && a.aiPaddle == b.aiPaddle &&
           a.ball == b.ball && a.playerScore == b.playerScore &&
           a.aiScore == b.aiScore && a.speedMultiplier == b.speedMultiplier &&
           a.phase == b.phase;
}
inline bool operator!=(const MatchState& a, const MatchState& b) { return !(a == b); }

enum class Command : int { MoveUp, MoveDown, Start, Restart };

// Written by the input collaborator, read once per tick.
// moveUp/moveDown are held flags; start/restart are one-shot.
struct InputState {
    bool moveUp   = false;
    bool moveDown = false;
    bool start    = false;
    bool restart  = false;

    void apply(Command c, bool held = true) {
        switch (c) {
            case Command::MoveUp:   moveUp = held; break;
            case Command::MoveDown: moveDown = held; break;
            case Command::Start:    start = true; break;
            case Command::Restart:  restart = true; break;
        }
    }
    void clearOneShots() { start = false; restart = false; }
};

// Read-only view handed to renderers.
struct Snapshot {
    Rect  playerPaddle;
    Rect  aiPaddle;
    Rect  ball;
    int   playerScore = 0;
    int   aiScore     = 0;
    Phase phase       = Phase::Idle;
    Side  winner      = Side::None;
};

inline MatchState initialState(const MatchConfig& cfg) {
    MatchState s;
    const double paddleY = cfg.arenaHeight / 2.0 - cfg.paddleHeight / 2.0;
    s.playerPaddle = Rect{cfg.playerPaddleX(), paddleY, cfg.paddleWidth, cfg.paddleHeight};
    s.aiPaddle     = Rect{cfg.aiPaddleX(),     paddleY, cfg.paddleWidth, cfg.paddleHeight};
    s.ball.body    = Rect{cfg.ballCenterX(), cfg.ballCenterY(), cfg.ballSize, cfg.ballSize};
    s.ball.velocity = glm::dvec2(0.0);
    return s;
}

inline Side winnerOf(const MatchState& s, const MatchConfig& cfg) {
    if (s.phase != Phase::Finished) return Side::None;
    if (s.playerScore >= cfg.winScore) return Side::Player;
    if (s.aiScore >= cfg.winScore) return Side::Ai;
    return Side::None;
}

inline Snapshot snapshot(const MatchState& s, const MatchConfig& cfg) {
    return Snapshot{s.playerPaddle, s.aiPaddle, s.ball.body,
                    s.playerScore, s.aiScore, s.phase, winnerOf(s, cfg)};
}

// Start serves from Idle, Restart reinitializes from Finished. Anything else
// (including the held move commands) leaves the state untouched.
inline MatchState applyCommand(const MatchState& state, Command cmd,
                               const MatchConfig& cfg, RandomSource& rng) {
    MatchState next = state;
    switch (cmd) {
        case Command::Start:
            if (next.phase == Phase::Idle) {
                const int j = cfg.serveVerticalJitter;
                const double vy = j > 0 ? static_cast<double>(rng.uniformInt(-j, j)) : 0.0;
                next.ball.velocity = glm::dvec2(cfg.baseBallSpeed, vy);
                next.phase = Phase::Active;
            }
            break;
        case Command::Restart:
            if (next.phase == Phase::Finished)
                next = initialState(cfg);
            break;
        case Command::MoveUp:
        case Command::MoveDown:
            break;
    }
    return next;
}

namespace detail {

inline void resetBall(MatchState& s, const MatchConfig& cfg) {
    s.ball.body.x = cfg.ballCenterX();
    s.ball.body.y = cfg.ballCenterY();
    s.ball.velocity = glm::dvec2(0.0);
    s.speedMultiplier = 1.0;
    s.phase = Phase::Idle;
}

// awaySign: +1 for the player (left) paddle, -1 for the opponent.
inline void collidePaddle(MatchState& s, const Rect& paddle, double awaySign,
                          const MatchConfig& cfg) {
    // Ball already heading away: the contact was handled on an earlier tick.
    if (s.ball.velocity.x * awaySign > 0.0) return;
    if (!intersects(paddle, s.ball.body)) return;
    s.ball.velocity.x = -s.ball.velocity.x;
    s.speedMultiplier = std::min(s.speedMultiplier + cfg.speedIncrement, cfg.maxSpeedMultiplier);
    s.ball.velocity = bounceVelocity(paddle, s.ball.body,
                                     cfg.baseBallSpeed * s.speedMultiplier, awaySign);
}

inline void driveOpponent(MatchState& s, const MatchConfig& cfg, RandomSource& rng) {
    const int n = cfg.aiTargetNoise;
    const double offset = n > 0 ? static_cast<double>(rng.uniformInt(-n, n)) : 0.0;
    const double target = s.ball.body.centerY() + offset;
    const double center = s.aiPaddle.centerY();
    if (center < target - cfg.aiDeadZone)
        s.aiPaddle.y += cfg.paddleSpeed;
    else if (center > target + cfg.aiDeadZone)
        s.aiPaddle.y -= cfg.paddleSpeed;
    s.aiPaddle.y = clampPaddleY(s.aiPaddle.y, s.aiPaddle.height, cfg.arenaHeight);
}

inline void drivePlayer(MatchState& s, const InputState& in, const MatchConfig& cfg) {
    if (in.moveUp)   s.playerPaddle.y -= cfg.paddleSpeed;
    if (in.moveDown) s.playerPaddle.y += cfg.paddleSpeed;
    s.playerPaddle.y = clampPaddleY(s.playerPaddle.y, s.playerPaddle.height, cfg.arenaHeight);
}

} // namespace detail

// Advances the match by one tick. Pure: the result depends only on the
// arguments and the values drawn from rng.
inline MatchState step(const MatchState& state, const InputState& input,
                       const MatchConfig& cfg, RandomSource& rng) {
    MatchState s = state;
    if (input.restart) s = applyCommand(s, Command::Restart, cfg, rng);
    if (input.start)   s = applyCommand(s, Command::Start, cfg, rng);
    if (s.phase != Phase::Active) return s;

    s.ball.body.x += s.ball.velocity.x;
    s.ball.body.y += s.ball.velocity.y;

    bounceOffWalls(s.ball.body, s.ball.velocity, cfg.arenaHeight);

    detail::collidePaddle(s, s.playerPaddle, +1.0, cfg);
    detail::collidePaddle(s, s.aiPaddle, -1.0, cfg);

    detail::driveOpponent(s, cfg, rng);
    detail::drivePlayer(s, input, cfg);

    if (s.ball.body.x < 0.0) {
        ++s.aiScore;
        detail::resetBall(s, cfg);
    } else if (s.ball.body.x > cfg.arenaWidth) {
        ++s.playerScore;
        detail::resetBall(s, cfg);
    }

    if (s.playerScore >= cfg.winScore || s.aiScore >= cfg.winScore)
        s.phase = Phase::Finished;
    return s;
}
