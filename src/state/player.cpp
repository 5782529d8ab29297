#include "player.hpp"

#include <raylib.h>

#include <algorithm>
#include <cmath>
#include <variant>

#include "clock.hpp"
#include "obstacle.hpp"

namespace {
template <typename... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <typename... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
} // namespace

namespace player_transition {
PlayerState jump(const PlayerState &state) {
    return std::visit(
        overloaded{[](const player_state::Dead &d) -> PlayerState { return d; },
                   [](const auto &) -> PlayerState {
                       return player_state::Jumping{};
                   }},
        state);
}

PlayerState land(const PlayerState &state) {
    return std::visit(
        overloaded{[](const player_state::Dead &d) -> PlayerState { return d; },
                   [](const auto &) -> PlayerState {
                       return player_state::Running{};
                   }},
        state);
}

PlayerState deplete(const PlayerState &state, float now) {
    return std::visit(
        overloaded{[](const player_state::Dead &d) -> PlayerState { return d; },
                   [now](const auto &) -> PlayerState {
                       return player_state::Dead{now};
                   }},
        state);
}
} // namespace player_transition

PlayerPhase phase_of(const PlayerState &state) {
    return std::visit(
        overloaded{
            [](const player_state::Running &) { return PlayerPhase::RUNNING; },
            [](const player_state::Jumping &) { return PlayerPhase::JUMPING; },
            [](const player_state::Dead &) { return PlayerPhase::DEAD; }},
        state);
}

PlayerBody::PlayerBody(const Clock &clock, const Vector2 &velocity)
    : clock(clock), velocity(velocity) {}

void PlayerBody::request_jump() {
    if (is_dead()) return;

    if (jump_count < MAX_JUMPS &&
        std::abs(velocity.y) <= DOUBLE_JUMP_THRESHOLD) {
        velocity.y = JUMP_VELOCITY;
        state = player_transition::jump(state);
        jump_count++;
    }
}

void PlayerBody::step(float dt, float ground_height) {
    // frozen once dead
    if (is_dead()) return;

    hit_animation -= dt;

    velocity.y += GRAVITY * dt;

    position.x += velocity.x * dt;
    position.y += velocity.y * dt;

    if (position.y < ground_height) {
        land_on_surface(ground_height, true);
    } else if (std::holds_alternative<player_state::Jumping>(state)) {
        score += SCORE_PER_SECOND * dt * score_multiplier;
    }

    forget_passed_obstacles();
}

bool PlayerBody::resolve_collision(const Rectangle &rect) {
    if (is_dead()) return false;

    if (rect.x + rect.width < position.x || rect.x > position.x + WIDTH ||
        rect.y + rect.height < position.y || rect.y > position.y + HEIGHT) {
        return false;
    }

    const float top = rect.y + rect.height;
    // falling onto it, or close enough to the top to climb on
    if (position.y > top - CLIMB_THRESHOLD && velocity.y <= 0.0f) {
        land_on_surface(top, false);
        return false;
    }

    return true;
}

void PlayerBody::land_on_surface(float height, bool ground) {
    if (ground || height <= 0.0f) {
        score_multiplier = 1.0f;
    } else if (std::holds_alternative<player_state::Jumping>(state)) {
        // chaining jumps across obstacles without touching the ground
        score_multiplier += MULTIPLIER_STEP;
    }

    state = player_transition::land(state);
    velocity.y = 0.0f;
    position.y = height;
    jump_count = 0;
}

int PlayerBody::damage_for(const Obstacle &obstacle) const {
    // bigger obstacles cause more damage
    const int damage = std::max(
        MIN_DAMAGE,
        static_cast<int>(std::lround(obstacle.area() * AREA_TO_DAMAGE)));
    if (velocity.y <= 0.0f || obstacle.rect.height <= 0.0f) {
        return damage;
    }

    // clipping an obstacle near its top on the way up hurts less
    const float scale =
        1.0f - (position.y - obstacle.rect.y) / obstacle.rect.height;
    return std::max(MIN_DAMAGE,
                    static_cast<int>(std::lround(damage * scale)));
}

void PlayerBody::apply_hit(const Obstacle &obstacle) {
    if (is_dead()) return;

    hit_animation = HIT_ANIMATION_DURATION;

    if (hit_obstacles.count(obstacle.id) != 0) {
        return;
    }
    hit_obstacles.emplace(obstacle.id, obstacle.right());

    score_multiplier = 1.0f;

    const int damage = damage_for(obstacle);
    health = std::max(0, health - damage);
    just_hit_damage += damage;

    if (health == 0) {
        velocity = Vector2{0.0f, 0.0f};
        state = player_transition::deplete(state, clock.now());
    }
}

int PlayerBody::consume_hit_signal() {
    const int damage = just_hit_damage;
    just_hit_damage = 0;
    return damage;
}

float PlayerBody::get_death_time() const {
    if (const auto *dead = std::get_if<player_state::Dead>(&state)) {
        return dead->death_time;
    }
    return 0.0f;
}

void PlayerBody::forget_passed_obstacles() {
    const float cutoff = position.x - HIT_MEMORY_DISTANCE;
    for (auto itr = hit_obstacles.begin(); itr != hit_obstacles.end();) {
        if (itr->second < cutoff) {
            itr = hit_obstacles.erase(itr);
        } else {
            ++itr;
        }
    }
}
