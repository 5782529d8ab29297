#include "obstacle.hpp"

#include <raylib.h>

bool obstacle_touches(const Obstacle &o, const Rectangle &rect) {
    // edges count as touching, landing on top needs the contact
    return !(o.right() < rect.x || o.rect.x > rect.x + rect.width ||
             o.top() < rect.y || o.rect.y > rect.y + rect.height);
}
