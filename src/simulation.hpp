#ifndef BEATRUN_SIMULATION_HPP
#define BEATRUN_SIMULATION_HPP

#include <vector>

#include "clock.hpp"
#include "config.hpp"
#include "obstacle.hpp"
#include "state/player.hpp"
#include "world/world.hpp"

struct TickReport {
    int damage = 0;     // damage taken during the tick(s)
    int ticks = 0;      // simulation ticks run
    bool died = false;  // player died during the tick(s)
    bool finished = false; // player reached the end of the level
};

/**
 * Drives the player through a world one fixed tick at a time
 */
class Simulation {
  public:
    Simulation(const World &world, const RunConfig &config);
    // the player holds a reference to this simulation's clock
    Simulation(const Simulation &) = delete;
    Simulation &operator=(const Simulation &) = delete;

    /**
     * Runs a single tick of length dt
     * @param jump_pressed forwarded to the player before stepping
     */
    TickReport tick(float dt, bool jump_pressed);

    /**
     * Runs as many TICK_INTERVAL ticks as frame_dt covers, carrying the
     * remainder over to the next frame. A jump press is applied on the next
     * tick that runs.
     */
    TickReport advance(float frame_dt, bool jump_pressed);

    bool is_over() const {
        return player.is_dead() || is_finished();
    }
    bool is_finished() const {
        return player.get_position().x >= world.get_length();
    }

    const PlayerBody &get_player() const {
        return player;
    }
    const Clock &get_clock() const {
        return clock;
    }
    const World &get_world() const {
        return world;
    }

  private:
    void resolve_obstacles();

    const World &world;
    AnimationClock clock;
    PlayerBody player;

    float accumulator = 0.0f;
    bool pending_jump = false;
    std::vector<const Obstacle *> nearby;
};

#endif // BEATRUN_SIMULATION_HPP
