#ifndef BEATRUN_OBSTACLE_HPP
#define BEATRUN_OBSTACLE_HPP

#include <raylib.h>

#include <cstdint>

// unique per run, assigned by the world and never reused
using ObstacleId = uint64_t;

struct Obstacle {
    ObstacleId id = 0;
    // world units, (x, y) is the bottom left corner, y up
    Rectangle rect{0.0f, 0.0f, 0.0f, 0.0f};

    float area() const {
        return rect.width * rect.height;
    }
    float top() const {
        return rect.y + rect.height;
    }
    float right() const {
        return rect.x + rect.width;
    }
};

bool obstacle_touches(const Obstacle &o, const Rectangle &rect);

#endif // BEATRUN_OBSTACLE_HPP
