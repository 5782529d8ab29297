#include "simulation.hpp"

#include <raylib.h>
#include <spdlog/spdlog.h>

#include <vector>

#include "config.hpp"
#include "obstacle.hpp"
#include "state/player.hpp"
#include "world/world.hpp"

Simulation::Simulation(const World &world, const RunConfig &config)
    : world(world), clock(),
      player(clock, Vector2{config.run_speed, 0.0f}) {
    spdlog::info("Starting run: length {}, speed {}.",
                 world.get_length(),
                 config.run_speed);
}

TickReport Simulation::tick(float dt, bool jump_pressed) {
    TickReport report;
    if (dt <= 0.0f) {
        spdlog::warn("Ignoring tick with non-positive dt {}.", dt);
        return report;
    }
    if (is_over()) {
        return report;
    }
    report.ticks = 1;

    clock.advance(dt);

    const PlayerPhase before = player.get_phase();
    if (jump_pressed || pending_jump) {
        pending_jump = false;
        const int jumps = player.get_jump_count();
        player.request_jump();
        if (player.get_jump_count() > jumps) {
            spdlog::debug("Jump {} at x={:.2f}.",
                          player.get_jump_count(),
                          player.get_position().x);
        }
    }

    const Vector2 pos = player.get_position();
    player.step(dt, world.terrain_height_at(pos.x));
    resolve_obstacles();

    if (before == PlayerPhase::JUMPING &&
        player.get_phase() == PlayerPhase::RUNNING) {
        spdlog::debug("Landed at y={:.2f}, multiplier x{:.1f}.",
                      player.get_position().y,
                      player.get_score_multiplier());
    }

    report.damage = player.consume_hit_signal();
    if (report.damage > 0) {
        spdlog::info("Hit for {} damage, {} health left.",
                     report.damage,
                     player.get_health());
    }
    if (player.is_dead()) {
        report.died = true;
        spdlog::info("Player died at x={:.2f} with score {}.",
                     player.get_position().x,
                     player.get_score_points());
    } else if (is_finished()) {
        report.finished = true;
        spdlog::info("Run complete with score {} and {} health.",
                     player.get_score_points(),
                     player.get_health());
    }
    return report;
}

TickReport Simulation::advance(float frame_dt, bool jump_pressed) {
    TickReport total;
    if (frame_dt <= 0.0f) {
        return total;
    }
    // a press on a frame too short for a tick waits for the next one
    pending_jump = pending_jump || jump_pressed;
    accumulator += frame_dt;

    size_t steps = 0;
    while (accumulator >= TICK_INTERVAL && steps < MAX_STEPS_PER_FRAME) {
        accumulator -= TICK_INTERVAL;
        TickReport report = tick(TICK_INTERVAL, false);
        ++steps;

        total.damage += report.damage;
        total.ticks += report.ticks;
        total.died = total.died || report.died;
        total.finished = total.finished || report.finished;
    }
    if (steps == MAX_STEPS_PER_FRAME && accumulator >= TICK_INTERVAL) {
        spdlog::debug("Dropping {:.3f}s of simulation time.", accumulator);
        accumulator = 0.0f;
    }
    return total;
}

void Simulation::resolve_obstacles() {
    world.get_intersect_obstacles(player.get_rect(), nearby);
    for (const Obstacle *obstacle : nearby) {
        if (player.resolve_collision(obstacle->rect)) {
            player.apply_hit(*obstacle);
        }
    }
}
