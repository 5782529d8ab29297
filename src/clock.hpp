#ifndef BEATRUN_CLOCK_HPP
#define BEATRUN_CLOCK_HPP

#include <chrono>

/**
 * Time source in seconds used for animation and death timestamps
 */
class Clock {
  public:
    virtual ~Clock() = default;
    virtual float now() const = 0;
};

/**
 * Accumulates simulated time, only moves when the game is stepped
 */
class AnimationClock : public Clock {
  public:
    float now() const override {
        return elapsed;
    }

    void advance(float dt) {
        elapsed += dt;
    }

    void reset() {
        elapsed = 0.0f;
    }

  private:
    float elapsed = 0.0f;
};

/**
 * Wall clock time since construction
 */
class SteadyClock : public Clock {
  public:
    SteadyClock();
    float now() const override;

  private:
    std::chrono::time_point<std::chrono::steady_clock> start;
};

#endif // BEATRUN_CLOCK_HPP
