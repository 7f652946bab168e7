#pragma once
#include <cmath>
#include <stdexcept>
#include <string>

// Thrown for rejected match configuration or command-line input.
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Fixed constants of one match. Units are pixels and pixels per tick.
struct MatchConfig {
    double arenaWidth         = 800.0;
    double arenaHeight        = 600.0;
    double paddleWidth        = 15.0;
    double paddleHeight       = 100.0;
    double paddleInset        = 50.0;
    double ballSize           = 20.0;
    double paddleSpeed        = 5.0;
    double baseBallSpeed      = 4.0;
    int    winScore           = 10;
    double speedIncrement     = 0.1;
    double maxSpeedMultiplier = 3.0;
    int    aiTargetNoise      = 20;
    double aiDeadZone         = 15.0;
    int    serveVerticalJitter = 1;

    double ballCenterX() const { return arenaWidth  / 2.0 - ballSize / 2.0; }
    double ballCenterY() const { return arenaHeight / 2.0 - ballSize / 2.0; }
    double playerPaddleX() const { return paddleInset; }
    double aiPaddleX() const { return arenaWidth - paddleInset - paddleWidth; }

    void validate() const {
        requirePositive(arenaWidth, "arenaWidth");
        requirePositive(arenaHeight, "arenaHeight");
        requirePositive(paddleWidth, "paddleWidth");
        requirePositive(paddleHeight, "paddleHeight");
        requirePositive(ballSize, "ballSize");
        requirePositive(paddleSpeed, "paddleSpeed");
        requirePositive(baseBallSpeed, "baseBallSpeed");
        if (paddleInset < 0.0)
            throw ConfigError("paddleInset must not be negative");
        if (paddleHeight > arenaHeight)
            throw ConfigError("paddleHeight exceeds arenaHeight");
        if (ballSize > arenaHeight || ballSize > arenaWidth)
            throw ConfigError("ballSize exceeds the arena");
        if (playerPaddleX() + paddleWidth >= aiPaddleX())
            throw ConfigError("paddles overlap; arenaWidth too small for paddleInset/paddleWidth");
        if (winScore < 1)
            throw ConfigError("winScore must be at least 1");
        if (!(speedIncrement >= 0.0))
            throw ConfigError("speedIncrement must not be negative");
        if (!(maxSpeedMultiplier >= 1.0))
            throw ConfigError("maxSpeedMultiplier must be at least 1.0");
        if (aiTargetNoise < 0)
            throw ConfigError("aiTargetNoise must not be negative");
        if (!(aiDeadZone >= 0.0))
            throw ConfigError("aiDeadZone must not be negative");
        if (serveVerticalJitter < 0)
            throw ConfigError("serveVerticalJitter must not be negative");
        // The steepest serve must already respect the speed cap.
        if (std::hypot(baseBallSpeed, static_cast<double>(serveVerticalJitter)) >
            baseBallSpeed * maxSpeedMultiplier)
            throw ConfigError("serve speed exceeds baseBallSpeed * maxSpeedMultiplier; "
                              "lower serveVerticalJitter or raise maxSpeedMultiplier");
    }

private:
    // NaN fails too.
    static void requirePositive(double v, const char* name) {
        if (!(v > 0.0))
            throw ConfigError(std::string(name) + " must be positive");
    }
};
