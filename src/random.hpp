#pragma once
#include <cstdint>
#include <random>

// Source of the match's randomness (serve angle, opponent aim).
class RandomSource {
public:
    virtual ~RandomSource() = default;
    // Uniform integer in [lo, hi]; callers guarantee lo <= hi.
    virtual int uniformInt(int lo, int hi) = 0;
};

class SeededRandom : public RandomSource {
public:
    explicit SeededRandom(std::uint32_t seed) : seed_(seed), gen_(seed) {}

    int uniformInt(int lo, int hi) override {
        std::uniform_int_distribution<int> dist(lo, hi);
        return dist(gen_);
    }

    std::uint32_t seed() const { return seed_; }

private:
    std::uint32_t seed_;
    std::mt19937  gen_;
};
