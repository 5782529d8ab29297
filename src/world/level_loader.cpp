#include "level_loader.hpp"

#include <libtmx-parser/tmxparser.h>
#include <raylib.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "obstacle.hpp"
#include "world/world.hpp"

namespace {
// tiled measures in pixels with y down, the world in tiles with y up
Rectangle to_world_rect(const tmxparser::TmxMap &map,
                        const tmxparser::Object &object) {
    const float tile_w = map.tileWidth, tile_h = map.tileHeight;
    const float map_height_pix = (float)map.height * tile_h;
    return Rectangle{object.x / tile_w,
                     (map_height_pix - (object.y + object.height)) / tile_h,
                     object.width / tile_w,
                     object.height / tile_h};
}

float level_length(const tmxparser::TmxMap &map) {
    auto itr = map.propertyMap.find(LENGTH_PROPERTY);
    if (itr == map.propertyMap.end()) {
        return (float)map.width;
    }
    try {
        return std::stof(itr->second);
    } catch (std::invalid_argument const &e) {
        spdlog::warn("Ignoring level length '{}': {}", itr->second, e.what());
    } catch (std::out_of_range const &e) {
        spdlog::warn("Ignoring level length '{}': {}", itr->second, e.what());
    }
    return (float)map.width;
}
} // namespace

std::unique_ptr<World> load_level(const std::string &file_path,
                                  const std::string &tileset_path) {
    tmxparser::TmxMap map;
    tmxparser::TmxReturn ret =
        tmxparser::parseFromFile(file_path, &map, tileset_path);
    if (ret != tmxparser::TmxReturn::kSuccess) {
        spdlog::error("Failed to load level '{}' (error {}).",
                      file_path,
                      static_cast<int>(ret));
        return nullptr;
    }
    spdlog::info("Loaded level '{}'.", file_path);
    return world_from_map(map);
}

std::unique_ptr<World> world_from_map(const tmxparser::TmxMap &map) {
    if (map.tileWidth == 0 || map.tileHeight == 0) {
        spdlog::error("Level has no tile size.");
        return nullptr;
    }

    std::vector<Obstacle> obstacles;
    std::vector<Vector2> height_map;
    ObstacleId next_id = 1;

    for (const auto &group : map.objectGroupCollection) {
        if (group.name == OBSTACLE_GROUP) {
            for (const auto &object : group.objects) {
                Obstacle o;
                o.rect = to_world_rect(map, object);
                if (o.rect.width <= 0.0f || o.rect.height <= 0.0f) {
                    spdlog::warn("Skipping empty obstacle '{}'.", object.name);
                    continue;
                }
                o.id = next_id++;
                obstacles.push_back(o);
            }
        } else if (group.name == TERRAIN_GROUP) {
            for (const auto &object : group.objects) {
                Rectangle rect = to_world_rect(map, object);
                height_map.push_back(Vector2{rect.x, rect.y + rect.height});
            }
        } else {
            spdlog::debug("Ignoring object group '{}'.", group.name);
        }
    }

    spdlog::info("Level has {} obstacles and {} terrain points.",
                 obstacles.size(),
                 height_map.size());
    return std::make_unique<World>(
        std::move(obstacles), std::move(height_map), level_length(map));
}
