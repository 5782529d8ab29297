#include "world.hpp"

#include <raylib.h>

#include <algorithm>
#include <iterator>
#include <utility>

#include "obstacle.hpp"

World::World(std::vector<Obstacle> obstacles,
             std::vector<Vector2> height_map,
             float length)
    : obstacles(std::move(obstacles)), height_map(std::move(height_map)),
      length(length) {
    std::sort(this->obstacles.begin(),
              this->obstacles.end(),
              [](const Obstacle &a, const Obstacle &b) {
                  return a.rect.x < b.rect.x;
              });
    std::sort(this->height_map.begin(),
              this->height_map.end(),
              [](const Vector2 &a, const Vector2 &b) { return a.x < b.x; });
    for (const auto &o : this->obstacles) {
        widest_obstacle = std::max(widest_obstacle, o.rect.width);
    }
}

void World::get_intersect_obstacles(
    const Rectangle &rect,
    std::vector<const Obstacle *> &collided) const {
    // reset the output vector
    collided.clear();

    // nothing starting before this can reach rect
    const float search_start = rect.x - widest_obstacle;
    auto itr = std::lower_bound(
        obstacles.begin(),
        obstacles.end(),
        search_start,
        [](const Obstacle &o, float x) { return o.rect.x < x; });

    for (; itr != obstacles.end() && itr->rect.x <= rect.x + rect.width;
         ++itr) {
        if (obstacle_touches(*itr, rect)) {
            collided.push_back(&*itr);
        }
    }
}

float World::terrain_height_at(float x) const {
    // first point strictly after x
    auto itr = std::upper_bound(
        height_map.begin(),
        height_map.end(),
        x,
        [](float value, const Vector2 &point) { return value < point.x; });
    if (itr == height_map.begin()) {
        return 0.0f;
    }
    return std::prev(itr)->y;
}
