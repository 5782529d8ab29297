#ifndef BEATRUN_CLIENT_GAME_HPP
#define BEATRUN_CLIENT_GAME_HPP

#include <raylib.h>

#include <memory>

#include "config.hpp"
#include "simulation.hpp"
#include "world/world.hpp"

class Game {
  public:
    Game(const World &world, const RunConfig &config);
    ~Game();
    void run();

  private:
    void restart();
    void update(float dt);
    void update_camera(float dt);
    void render();
    bool get_jump_input() const;
    Rectangle get_view() const;

    const World &world;
    RunConfig config;
    std::unique_ptr<Simulation> simulation;

    Camera2D camera{};
    float shake = 0.0f;
    bool paused = false;
    bool window_open = false;
};

#endif // BEATRUN_CLIENT_GAME_HPP
