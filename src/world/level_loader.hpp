#ifndef BEATRUN_WORLD_LEVELLOADER_HPP
#define BEATRUN_WORLD_LEVELLOADER_HPP

#include <libtmx-parser/tmxparser.h>

#include <memory>
#include <string>

#include "world/world.hpp"

constexpr const char *OBSTACLE_GROUP = "obstacles";
constexpr const char *TERRAIN_GROUP = "terrain";
constexpr const char *LENGTH_PROPERTY = "length";

/**
 * Loads a level drawn in Tiled. Objects in the "obstacles" group become
 * obstacles, objects in the "terrain" group raise the ground from their left
 * edge onwards. One tile is one world unit.
 * @param file_path path of the tmx file
 * @param tileset_path directory the tilesets are relative to
 * @returns the world, or nullptr if the file could not be parsed
 */
std::unique_ptr<World> load_level(const std::string &file_path,
                                  const std::string &tileset_path);

/**
 * Converts an already parsed map, exposed so maps can come from memory
 */
std::unique_ptr<World> world_from_map(const tmxparser::TmxMap &map);

#endif // BEATRUN_WORLD_LEVELLOADER_HPP
