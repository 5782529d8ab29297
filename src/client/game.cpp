#include "game.hpp"

#include <raylib.h>
#include <spdlog/spdlog.h>

#include <memory>

#include "client/player_frame.hpp"
#include "client/player_renderer.hpp"
#include "client/world_renderer.hpp"
#include "config.hpp"
#include "simulation.hpp"
#include "world/world.hpp"

Game::Game(const World &world, const RunConfig &config)
    : world(world), config(config) {
    restart();
}

Game::~Game() {
    if (window_open) {
        CloseWindow();
    }
}

void Game::restart() {
    simulation = std::make_unique<Simulation>(world, config);
    shake = 0.0f;
    paused = false;

    camera.zoom = 1.0f;
    camera.offset = {WINDOW_WIDTH / 3.0f, WINDOW_HEIGHT * 2.0f / 3.0f};
    camera.rotation = 0.0f;
    camera.target = {0.0f, 0.0f};
}

void Game::run() {
    spdlog::info("Running game.");

    SetTargetFPS(60);
    InitWindow(WINDOW_WIDTH, WINDOW_HEIGHT, "beatrun");
    window_open = true;

    WorldRenderer world_renderer(world);
    while (!WindowShouldClose()) {
        float dt = GetFrameTime();

        if (IsKeyPressed(KEY_R)) {
            spdlog::info("Restarting run.");
            restart();
        }
        if (IsKeyPressed(KEY_P) && !simulation->is_over()) {
            paused = !paused;
        }
        update(dt);

        BeginDrawing();
        ClearBackground(Color{9, 10, 20, 255});
        BeginMode2D(camera);
        world_renderer.render(get_view());

        const PlayerBody &player = simulation->get_player();
        PlayerFrame frame = select_player_frame(
            player, simulation->get_clock().now(), paused);
        player_render(player, frame);

        EndMode2D();
        hud_render(player, paused, simulation->is_finished());
        EndDrawing();
    }

    spdlog::info("Game shutting down.");
}

void Game::update(float dt) {
    if (!paused && !simulation->is_over()) {
        TickReport report = simulation->advance(dt, get_jump_input());
        if (report.damage > 0) {
            shake = SHAKE_DURATION;
        }
    }
    update_camera(dt);
}

void Game::update_camera(float dt) {
    const Vector2 pos = simulation->get_player().get_position();
    // follow horizontally, ease vertically
    camera.target.x = pos.x * PIXELS_PER_UNIT;
    camera.target.y += (-pos.y * PIXELS_PER_UNIT - camera.target.y) * 0.05f;

    camera.offset = {WINDOW_WIDTH / 3.0f, WINDOW_HEIGHT * 2.0f / 3.0f};
    if (shake > 0.0f) {
        shake -= dt;
        camera.offset.x += GetRandomValue(-100, 100) / 100.0f * SHAKE_STRENGTH;
        camera.offset.y += GetRandomValue(-100, 100) / 100.0f * SHAKE_STRENGTH;
    }
}

bool Game::get_jump_input() const {
    return IsKeyPressed(KEY_SPACE) || IsKeyPressed(KEY_UP) ||
           IsKeyPressed(KEY_W) || IsMouseButtonPressed(MOUSE_BUTTON_LEFT);
}

Rectangle Game::get_view() const {
    // camera view in world units, y up
    const float left = (camera.target.x - camera.offset.x) / PIXELS_PER_UNIT;
    const float top = -(camera.target.y - camera.offset.y) / PIXELS_PER_UNIT;
    const float width = WINDOW_WIDTH / PIXELS_PER_UNIT;
    const float height = WINDOW_HEIGHT / PIXELS_PER_UNIT;
    return Rectangle{left, top - height, width, height};
}
