#ifndef BEATRUN_WORLD_WORLD_HPP
#define BEATRUN_WORLD_WORLD_HPP

#include <raylib.h>

#include <vector>

#include "obstacle.hpp"

/**
 * Stores the obstacles and terrain of a level in world units (y up)
 */
class World {
  public:
    /**
     * @param obstacles obstacles with unique ids, any order
     * @param height_map terrain points (x, height), any order
     * @param length x coordinate where the level ends
     */
    World(std::vector<Obstacle> obstacles,
          std::vector<Vector2> height_map,
          float length);

    /**
     * Finds the obstacles touching the given rect
     * @param rect intersection test rect
     * @param collided vector of pointers to obstacles touching rect, sorted by
     * x, pointers stay valid for the lifetime of the world
     */
    void get_intersect_obstacles(const Rectangle &rect,
                                 std::vector<const Obstacle *> &collided) const;

    /**
     * @returns height of the last terrain point at or before x, 0 before the
     * first point
     */
    float terrain_height_at(float x) const;

    const std::vector<Obstacle> &get_obstacles() const {
        return obstacles;
    }
    const std::vector<Vector2> &get_height_map() const {
        return height_map;
    }
    float get_length() const {
        return length;
    }

  private:
    std::vector<Obstacle> obstacles; // sorted by rect.x
    std::vector<Vector2> height_map; // sorted by x
    float length = 0.0f;
    float widest_obstacle = 0.0f;
};

#endif // BEATRUN_WORLD_WORLD_HPP
