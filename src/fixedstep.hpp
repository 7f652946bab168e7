#pragma once
#include <vector>
#include <thread>
#include <functional>
#include <chrono>
#include <cstdint>
#include <string>
#include "logger.hpp"
#include "profiler.hpp"

// Fixed-timestep driver. Phases run in insertion order once per step, all on
// the calling thread. Real time is fed in through advance(); run() does that
// from the steady clock and paces itself to the tick rate.
class FixedStep {
public:
    using Seconds  = std::chrono::duration<double>;
    using Clock    = std::chrono::steady_clock;
    using Duration = Clock::duration;

    struct Settings {
        double        hz         = 60.0;
        std::int64_t  maxFrames  = -1;    // <0: until requestExit()
        int           maxCatchUp = 4;     // extra steps allowed per advance()
        int           driftLogInterval = 600;
        int           spinMicros = 500;
        bool          logPhases  = false;
    };

    using Subsystem = std::function<void(std::int64_t frame, Seconds dt)>;

    struct Phase {
        std::string            name;
        std::vector<Subsystem> serialSubsystems;
        bool                   enabled = true;
    };

    FixedStep() : FixedStep(Settings{}) {}
    explicit FixedStep(const Settings& s) { applySettings(s); }

    void setLogger(Logger* l)    { logger_ = l; }
    void setProfiler(Profiler* p){ profiler_ = p; }

    // Out-of-range values are clamped. The warnings only reach a logger
    // installed with setLogger() before this call.
    void applySettings(const Settings& s) {
        settings_ = s;
        if (!(settings_.hz > 0.0)) {
            LOG_WARN(logger_, "Invalid hz={}, using 60", s.hz);
            settings_.hz = 60.0;
        }
        if (settings_.maxCatchUp < 0) {
            LOG_WARN(logger_, "Invalid maxCatchUp={}, using 0", s.maxCatchUp);
            settings_.maxCatchUp = 0;
        }
        if (settings_.spinMicros < 0) {
            LOG_WARN(logger_, "Invalid spinMicros={}, using 0", s.spinMicros);
            settings_.spinMicros = 0;
        }
        recalcTiming();
        LOG_INFO(logger_,
                 "Config hz={} maxFrames={} maxCatchUp={} driftInterval={} spinMicros={}",
                 settings_.hz, settings_.maxFrames, settings_.maxCatchUp,
                 settings_.driftLogInterval, settings_.spinMicros);
    }

    const Settings& settings() const { return settings_; }

    std::size_t addPhase(const std::string& name) {
        phases_.push_back(Phase{name, {}, true});
        LOG_DEBUG(logger_, "AddPhase '{}'", name);
        return phases_.size()-1;
    }
    void addSerialSubsystem(std::size_t phaseIndex, Subsystem fn) {
        phases_.at(phaseIndex).serialSubsystems.push_back(std::move(fn));
        LOG_TRACE(logger_, "Add serial subsystem to phase '{}'",
                  phases_[phaseIndex].name);
    }
    void setPhaseEnabled(std::size_t phaseIndex, bool enabled) {
        phases_.at(phaseIndex).enabled = enabled;
        LOG_DEBUG(logger_, "Phase '{}' enabled={}", phases_[phaseIndex].name, enabled);
    }

    void requestExit() { terminate_ = true; }
    bool done() const {
        return terminate_ || (settings_.maxFrames >= 0 && frame_ >= settings_.maxFrames);
    }

    std::int64_t frame() const { return frame_; }
    Duration     dt() const { return dt_; }
    double       dtSeconds() const { return Seconds(dt_).count(); }
    Duration     accumulated() const { return accumulator_; }
    std::int64_t droppedSteps() const { return droppedSteps_; }
    double       lastDriftMs() const { return lastDriftMs_; }

    // Fraction of a step left in the accumulator, in [0, 1).
    double alpha() const {
        return static_cast<double>(accumulator_.count()) / static_cast<double>(dt_.count());
    }

    // Feeds `elapsed` real time and runs the whole steps it covers, at most
    // 1 + maxCatchUp of them. Whole steps beyond that are dropped so a stall
    // cannot snowball. Returns the number of steps run.
    int advance(Duration elapsed) {
        if (elapsed.count() < 0) elapsed = Duration::zero();
        accumulator_ += elapsed;
        const int budget = 1 + settings_.maxCatchUp;
        int steps = 0;
        while (accumulator_ >= dt_ && !done()) {
            if (steps >= budget) {
                const auto behind = accumulator_ / dt_;
                droppedSteps_ += behind;
                accumulator_ -= dt_ * behind;
                LOG_WARN(logger_, "Behind by {} steps at frame={}, dropping", behind, frame_);
                break;
            }
            doOneStep();
            accumulator_ -= dt_;
            ++steps;
        }
        return steps;
    }

    void run() {
        LOG_INFO(logger_, "Run loop start (paced)");
        startReal_ = Clock::now();
        auto last = startReal_;
        while (!done()) {
            auto now = Clock::now();
            advance(now - last);
            last = now;
            logDrift();
            if (done()) break;
            sleepUntil(now + (dt_ - accumulator_));
        }
        LOG_INFO(logger_, "Run loop end frame={}", frame_);
    }

    void runUnpaced() {
        LOG_INFO(logger_, "Run loop start (unpaced)");
        while (!done()) doOneStep();
        LOG_INFO(logger_, "Run loop end frame={}", frame_);
    }

private:
    void sleepUntil(Clock::time_point target) {
        auto spinBudget = std::chrono::microseconds(settings_.spinMicros);
        for (;;) {
            auto now = Clock::now();
            if (now + spinBudget >= target) {
                while (Clock::now() < target)
                    std::this_thread::yield();
                break;
            }
            std::this_thread::sleep_for(std::chrono::microseconds(200));
        }
    }

    void doOneStep() {
        PROF_SCOPE(profiler_, "Frame");
        const Seconds dt{dt_};
        for (auto& ph : phases_) {
            if (!ph.enabled) continue;
            if (settings_.logPhases)
                LOG_DEBUG(logger_, "PhaseBegin '{}' frame={}", ph.name, frame_);
            PROF_SCOPE(profiler_, "Phase:" + ph.name);

            for (auto& sub : ph.serialSubsystems)
                sub(frame_, dt);

            if (settings_.logPhases)
                LOG_DEBUG(logger_, "PhaseEnd   '{}' frame={}", ph.name, frame_);
        }
        ++frame_;
        if ((frame_ & 0x3FF) == 0)
            LOG_DEBUG(logger_, "Progress frame={}", frame_);
    }

    void logDrift() {
        if (settings_.driftLogInterval <= 0) return;
        if (frame_ == lastDriftFrame_ || frame_ % settings_.driftLogInterval) return;
        lastDriftFrame_ = frame_;
        auto now = Clock::now();
        double simT  = static_cast<double>(frame_) * dtSeconds();
        double realT = Seconds(now - startReal_).count();
        double driftMs = (simT - realT) * 1000.0;
        lastDriftMs_ = driftMs;
        LOG_INFO(logger_, "[DRIFT] frame={} simT={:.3f}s realT={:.3f}s drift={:.2f}ms",
                 frame_, simT, realT, driftMs);
    }

    void recalcTiming() {
        dt_ = std::chrono::duration_cast<Duration>(Seconds{1.0 / settings_.hz});
        if (dt_.count() <= 0) dt_ = Duration{1};
        accumulator_ = Duration::zero();
        startReal_ = Clock::now();
    }

    Settings               settings_{};
    std::vector<Phase>     phases_;
    std::int64_t           frame_      = 0;
    bool                   terminate_  = false;

    Duration               dt_{};
    Duration               accumulator_{};
    Clock::time_point      startReal_{};
    std::int64_t           droppedSteps_   = 0;
    std::int64_t           lastDriftFrame_ = -1;
    double                 lastDriftMs_    = 0.0;

    Logger*   logger_   = nullptr;
    Profiler* profiler_ = nullptr;
};
