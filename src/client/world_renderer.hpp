#ifndef BEATRUN_CLIENT_WORLDRENDERER_HPP
#define BEATRUN_CLIENT_WORLDRENDERER_HPP

#include <raylib.h>

#include <vector>

#include "obstacle.hpp"
#include "world/world.hpp"

// world units (y up) to screen pixels (y down)
Rectangle to_screen_rect(const Rectangle &rect);

/**
 * Draws the obstacles and terrain that are inside the camera view
 */
class WorldRenderer {
  public:
    explicit WorldRenderer(const World &world);
    void render(const Rectangle &view);

  private:
    void render_terrain(const Rectangle &view);

    const World &world;
    std::vector<const Obstacle *> visible;
};

#endif // BEATRUN_CLIENT_WORLDRENDERER_HPP
