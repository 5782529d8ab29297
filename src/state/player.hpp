#ifndef BEATRUN_STATE_PLAYER_HPP
#define BEATRUN_STATE_PLAYER_HPP

#include <raylib.h>

#include <cstddef>
#include <cstdint>
#include <unordered_map>
#include <variant>

#include "clock.hpp"
#include "obstacle.hpp"

namespace player_state {
struct Running {};
struct Jumping {};
struct Dead {
    float death_time = 0.0f;
};
} // namespace player_state

using PlayerState = std::variant<player_state::Running,
                                 player_state::Jumping,
                                 player_state::Dead>;

enum class PlayerPhase : uint8_t {
    RUNNING,
    JUMPING,
    DEAD,
};

/**
 * Transition table of the player state machine. Dead absorbs every event so
 * nothing can leave it.
 */
namespace player_transition {
PlayerState jump(const PlayerState &state);
PlayerState land(const PlayerState &state);
PlayerState deplete(const PlayerState &state, float now);
} // namespace player_transition

PlayerPhase phase_of(const PlayerState &state);

/**
 * The runner. Stepped once per tick by the simulation, which also feeds it
 * the obstacles near its bounding box.
 */
class PlayerBody {
  public:
    explicit PlayerBody(const Clock &clock, const Vector2 &velocity = {});

    /**
     * Jumps if fewer than two jumps were used since the last landing and the
     * vertical speed is small enough (on the ground, or near the apex of the
     * first jump)
     */
    void request_jump();

    /**
     * Integrates gravity and velocity over dt (must be > 0)
     * @param ground_height terrain height under the player, landing below it
     * counts as touching the ground
     */
    void step(float dt, float ground_height = 0.0f);

    /**
     * Tests the rect against the player box. Lands on top of it when falling
     * onto it from within the climb threshold.
     * @return true if the rect blocks the player and apply_hit should follow
     */
    bool resolve_collision(const Rectangle &rect);

    /**
     * Damages the player once per obstacle, bigger obstacles hurt more
     */
    void apply_hit(const Obstacle &obstacle);

    /**
     * @return damage taken since the last call, 0 if none
     */
    int consume_hit_signal();

    void set_forward_speed(float vx) {
        velocity.x = vx;
    }
    void set_position(const Vector2 &pos) {
        position = pos;
    }
    void set_velocity(const Vector2 &vel) {
        velocity = vel;
    }

    Vector2 get_position() const {
        return position;
    }
    Vector2 get_velocity() const {
        return velocity;
    }
    Rectangle get_rect() const {
        return Rectangle{position.x, position.y, WIDTH, HEIGHT};
    }
    const PlayerState &get_state() const {
        return state;
    }
    PlayerPhase get_phase() const {
        return phase_of(state);
    }
    bool is_dead() const {
        return std::holds_alternative<player_state::Dead>(state);
    }
    int get_health() const {
        return health;
    }
    float get_score() const {
        return score;
    }
    // whole points shown to the player
    int get_score_points() const {
        return static_cast<int>(score);
    }
    float get_score_multiplier() const {
        return score_multiplier;
    }
    int get_jump_count() const {
        return jump_count;
    }
    float get_hit_animation() const {
        return hit_animation;
    }
    bool is_hit_shown() const {
        return hit_animation > 0.0f;
    }
    float get_death_time() const;
    size_t remembered_hits() const {
        return hit_obstacles.size();
    }

    constexpr static float WIDTH = 0.8f;
    constexpr static float HEIGHT = 0.8f;
    constexpr static float HIT_ANIMATION_DURATION = 0.1f;
    // obstacles of almost the same height can be climbed onto
    constexpr static float CLIMB_THRESHOLD = 0.4f;
    // double jumps only near the top of the first jump
    constexpr static float DOUBLE_JUMP_THRESHOLD = 6.0f;
    constexpr static float GRAVITY = -9.8f * 4.0f;
    constexpr static float JUMP_VELOCITY = 10.0f;
    constexpr static float AREA_TO_DAMAGE = 15.0f;
    constexpr static int MIN_DAMAGE = 1;
    constexpr static int MAX_HEALTH = 1000;
    constexpr static int MAX_JUMPS = 2;
    constexpr static float SCORE_PER_SECOND = 100.0f;
    constexpr static float MULTIPLIER_STEP = 0.5f;
    // hits on obstacles this far behind the player are forgotten
    constexpr static float HIT_MEMORY_DISTANCE = 5.0f;

  private:
    void land_on_surface(float height, bool ground);
    int damage_for(const Obstacle &obstacle) const;
    void forget_passed_obstacles();

    const Clock &clock;

    Vector2 position{0.0f, 0.0f};
    Vector2 velocity{0.0f, 0.0f};
    PlayerState state = player_state::Running{};

    int health = MAX_HEALTH;
    float score = 0.0f;
    float score_multiplier = 1.0f;
    int jump_count = 0;

    float hit_animation = -1.0f;
    int just_hit_damage = 0;

    // obstacle id -> right edge, for forgetting once passed
    std::unordered_map<ObstacleId, float> hit_obstacles;
};

#endif // BEATRUN_STATE_PLAYER_HPP
