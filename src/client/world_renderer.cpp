#include "world_renderer.hpp"

#include <raylib.h>

#include <cstddef>

#include "config.hpp"
#include "obstacle.hpp"
#include "world/world.hpp"

Rectangle to_screen_rect(const Rectangle &rect) {
    return Rectangle{rect.x * PIXELS_PER_UNIT,
                     -(rect.y + rect.height) * PIXELS_PER_UNIT,
                     rect.width * PIXELS_PER_UNIT,
                     rect.height * PIXELS_PER_UNIT};
}

WorldRenderer::WorldRenderer(const World &world) : world(world) {}

void WorldRenderer::render(const Rectangle &view) {
    render_terrain(view);

    world.get_intersect_obstacles(view, visible);
    for (const Obstacle *o : visible) {
        Rectangle r = to_screen_rect(o->rect);
        DrawRectangleRec(r, Color{0, 200, 255, 255});
        DrawRectangleLinesEx(r, 2.0f, Color{255, 0, 200, 255});
    }

    // finish line
    Rectangle finish =
        to_screen_rect(Rectangle{world.get_length(), 0.0f, 0.1f, 20.0f});
    DrawRectangleRec(finish, Color{255, 240, 0, 255});
}

void WorldRenderer::render_terrain(const Rectangle &view) {
    const auto &points = world.get_height_map();
    const float view_right = view.x + view.width;
    // ground up to the first point, then one slab per point
    float start = view.x;
    float height = world.terrain_height_at(view.x);
    for (size_t i = 0; i <= points.size(); ++i) {
        float end = i < points.size() ? points[i].x : view_right;
        if (end <= start) {
            if (i < points.size()) height = points[i].y;
            continue;
        }
        if (start >= view_right) break;
        end = end > view_right ? view_right : end;
        Rectangle slab =
            to_screen_rect(Rectangle{start, height - 1.0f, end - start, 1.0f});
        DrawRectangleRec(slab, Color{20, 24, 48, 255});
        DrawLine(slab.x,
                 slab.y,
                 slab.x + slab.width,
                 slab.y,
                 Color{50, 255, 160, 255});
        start = end;
        if (i < points.size()) height = points[i].y;
    }
}
