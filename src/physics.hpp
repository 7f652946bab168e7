#pragma once
#include <algorithm>
#include <array>
#include <cmath>
#include <glm/glm.hpp>

// Screen coordinates: origin top-left, y grows downward.

struct Rect {
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;

    double right()   const { return x + width; }
    double bottom()  const { return y + height; }
    double centerX() const { return x + width / 2.0; }
    double centerY() const { return y + height / 2.0; }
};

inline bool operator==(const Rect& a, const Rect& b) {
    return a.x == b.x && a.y == b.y && a.width == b.width && a.height == b.height;
}
inline bool operator!=(const Rect& a, const Rect& b) { return !(a == b); }

// Strict overlap; rectangles sharing only an edge do not intersect.
inline bool intersects(const Rect& a, const Rect& b) {
    return a.x < b.right() && a.right() > b.x &&
           a.y < b.bottom() && a.bottom() > b.y;
}

inline constexpr int kPaddleBands = 5;
inline constexpr std::array<double, kPaddleBands> kBandAnglesDeg = {-60.0, -30.0, 0.0, 30.0, 60.0};

// Band of the paddle (0 = top) containing the ball's vertical center.
inline int bandIndex(const Rect& paddle, const Rect& ball) {
    const double bandHeight = paddle.height / kPaddleBands;
    const double rel = ball.centerY() - paddle.y;
    const int band = static_cast<int>(std::floor(rel / bandHeight));
    return std::clamp(band, 0, kPaddleBands - 1);
}

// New ball velocity of magnitude `speed` after striking `paddle`.
// awaySign is +1 for the left paddle, -1 for the right one.
inline glm::dvec2 bounceVelocity(const Rect& paddle, const Rect& ball, double speed, double awaySign) {
    const double rad = glm::radians(kBandAnglesDeg[static_cast<std::size_t>(bandIndex(paddle, ball))]);
    glm::dvec2 v = speed * glm::dvec2(glm::cos(rad), glm::sin(rad));
    v.x = awaySign < 0.0 ? -glm::abs(v.x) : glm::abs(v.x);
    return v;
}

// Reflects off the top/bottom walls. The body is clamped back inside the
// arena and vy points away from the wall touched.
inline bool bounceOffWalls(Rect& body, glm::dvec2& velocity, double arenaHeight) {
    if (body.y <= 0.0) {
        body.y = 0.0;
        velocity.y = glm::abs(velocity.y);
        return true;
    }
    if (body.bottom() >= arenaHeight) {
        body.y = arenaHeight - body.height;
        velocity.y = -glm::abs(velocity.y);
        return true;
    }
    return false;
}

inline double clampPaddleY(double y, double paddleHeight, double arenaHeight) {
    return std::clamp(y, 0.0, arenaHeight - paddleHeight);
}
