#pragma once
#include <cstdint>
#include <memory>
#include <random>
#include "logger.hpp"
#include "profiler.hpp"
#include "matchstate.hpp"

// Owns one match: its state, the pending input and the random source.
// All calls are expected on the thread that drives tick().
class Match {
public:
    explicit Match(const MatchConfig& cfg, std::shared_ptr<RandomSource> rng = nullptr)
        : cfg_(cfg), rng_(std::move(rng))
    {
        cfg_.validate();
        if (!rng_) rng_ = std::make_shared<SeededRandom>(std::random_device{}());
        state_ = initialState(cfg_);
    }

    void setLogger(Logger* l)     { logger_ = l; }
    void setProfiler(Profiler* p) { profiler_ = p; }

    void moveUp(bool held)   { input_.apply(Command::MoveUp, held); }
    void moveDown(bool held) { input_.apply(Command::MoveDown, held); }
    void start()             { input_.apply(Command::Start); }
    void restart()           { input_.apply(Command::Restart); }
    void submit(Command c, bool held = true) { input_.apply(c, held); }

    void tick() {
        PROF_SCOPE(profiler_, "Match:step");
        const MatchState prev = state_;
        state_ = step(prev, input_, cfg_, *rng_);
        input_.clearOneShots();
        ++ticks_;
        report(prev);
    }

    const MatchState&  state()  const { return state_; }
    const InputState&  input()  const { return input_; }
    const MatchConfig& config() const { return cfg_; }
    Snapshot snapshot() const { return ::snapshot(state_, cfg_); }
    std::int64_t ticks() const { return ticks_; }

private:
    // A paddle contact is the only thing that reverses vx during a rally.
    // The multiplier stops growing once capped, so it cannot be used here.
    static bool paddleHit(const MatchState& prev, const MatchState& next) {
        return prev.phase == Phase::Active && next.phase == Phase::Active &&
               (prev.ball.velocity.x > 0.0) != (next.ball.velocity.x > 0.0);
    }

    void report(const MatchState& prev) {
        if (state_.playerScore != prev.playerScore || state_.aiScore != prev.aiScore) {
            LOG_INFO(logger_, "Point {} tick={} score={}-{}",
                     state_.playerScore != prev.playerScore ? "player" : "ai",
                     ticks_, state_.playerScore, state_.aiScore);
        } else if (paddleHit(prev, state_)) {
            LOG_DEBUG(logger_, "PaddleHit side={} tick={} mult={:.1f} v=({:.2f},{:.2f})",
                      state_.ball.velocity.x > 0.0 ? "player" : "ai",
                      ticks_, state_.speedMultiplier,
                      state_.ball.velocity.x, state_.ball.velocity.y);
        }
        if (state_.phase != prev.phase) {
            LOG_INFO(logger_, "Phase {} -> {} tick={}",
                     phaseName(prev.phase), phaseName(state_.phase), ticks_);
            if (state_.phase == Phase::Finished)
                LOG_INFO(logger_, "Match over winner={} score={}-{}",
                         sideName(winnerOf(state_, cfg_)),
                         state_.playerScore, state_.aiScore);
        }
        LOG_TRACE(logger_, "Tick {} ball=({:.1f},{:.1f}) v=({:.2f},{:.2f}) player.y={:.1f} ai.y={:.1f}",
                  ticks_, state_.ball.body.x, state_.ball.body.y,
                  state_.ball.velocity.x, state_.ball.velocity.y,
                  state_.playerPaddle.y, state_.aiPaddle.y);
    }

    MatchConfig                   cfg_;
    std::shared_ptr<RandomSource> rng_;
    MatchState                    state_{};
    InputState                    input_{};
    std::int64_t                  ticks_ = 0;

    Logger*   logger_   = nullptr;
    Profiler* profiler_ = nullptr;
};
