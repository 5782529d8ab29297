#include <gtest/gtest.h>

#include <libtmx-parser/tmxparser.h>

#include <memory>
#include <string>

#include "world/level_loader.hpp"
#include "world/world.hpp"

namespace {
tmxparser::Object make_object(float x, float y, float width, float height) {
    tmxparser::Object object{};
    object.name = "o";
    object.x = x;
    object.y = y;
    object.width = width;
    object.height = height;
    object.visible = true;
    return object;
}

// 100x10 tiles of 16 pixels
tmxparser::TmxMap make_map() {
    tmxparser::TmxMap map{};
    map.width = 100;
    map.height = 10;
    map.tileWidth = 16;
    map.tileHeight = 16;

    tmxparser::ObjectGroup obstacles{};
    obstacles.name = "obstacles";
    obstacles.objects.push_back(make_object(32.0f, 128.0f, 16.0f, 32.0f));
    obstacles.objects.push_back(make_object(64.0f, 112.0f, 32.0f, 16.0f));
    // nothing to collide with
    obstacles.objects.push_back(make_object(80.0f, 80.0f, 0.0f, 0.0f));

    tmxparser::ObjectGroup terrain{};
    terrain.name = "terrain";
    terrain.objects.push_back(make_object(80.0f, 144.0f, 32.0f, 16.0f));

    tmxparser::ObjectGroup decoration{};
    decoration.name = "decoration";
    decoration.objects.push_back(make_object(0.0f, 0.0f, 16.0f, 16.0f));

    map.objectGroupCollection = {obstacles, terrain, decoration};
    return map;
}
} // namespace

TEST(LevelLoaderTest, ConvertsObstaclesToWorldUnits) {
    std::unique_ptr<World> world = world_from_map(make_map());
    ASSERT_NE(world, nullptr);

    const auto &obstacles = world->get_obstacles();
    ASSERT_EQ(obstacles.size(), 2u);
    EXPECT_FLOAT_EQ(obstacles[0].rect.x, 2.0f);
    EXPECT_FLOAT_EQ(obstacles[0].rect.y, 0.0f);
    EXPECT_FLOAT_EQ(obstacles[0].rect.width, 1.0f);
    EXPECT_FLOAT_EQ(obstacles[0].rect.height, 2.0f);

    // floating one tile above the ground
    EXPECT_FLOAT_EQ(obstacles[1].rect.x, 4.0f);
    EXPECT_FLOAT_EQ(obstacles[1].rect.y, 2.0f);
    EXPECT_FLOAT_EQ(obstacles[1].rect.width, 2.0f);
    EXPECT_FLOAT_EQ(obstacles[1].rect.height, 1.0f);
}

TEST(LevelLoaderTest, ObstacleIdsAreUnique) {
    std::unique_ptr<World> world = world_from_map(make_map());
    ASSERT_NE(world, nullptr);
    const auto &obstacles = world->get_obstacles();
    ASSERT_EQ(obstacles.size(), 2u);
    EXPECT_NE(obstacles[0].id, obstacles[1].id);
    EXPECT_NE(obstacles[0].id, 0u);
    EXPECT_NE(obstacles[1].id, 0u);
}

TEST(LevelLoaderTest, TerrainRaisesGround) {
    std::unique_ptr<World> world = world_from_map(make_map());
    ASSERT_NE(world, nullptr);
    EXPECT_FLOAT_EQ(world->terrain_height_at(4.0f), 0.0f);
    EXPECT_FLOAT_EQ(world->terrain_height_at(5.0f), 1.0f);
    EXPECT_FLOAT_EQ(world->terrain_height_at(50.0f), 1.0f);
}

TEST(LevelLoaderTest, LengthFromMapWidth) {
    std::unique_ptr<World> world = world_from_map(make_map());
    ASSERT_NE(world, nullptr);
    EXPECT_FLOAT_EQ(world->get_length(), 100.0f);
}

TEST(LevelLoaderTest, LengthFromProperty) {
    tmxparser::TmxMap map = make_map();
    map.propertyMap["length"] = "42.5";
    std::unique_ptr<World> world = world_from_map(map);
    ASSERT_NE(world, nullptr);
    EXPECT_FLOAT_EQ(world->get_length(), 42.5f);
}

TEST(LevelLoaderTest, BadLengthFallsBackToWidth) {
    tmxparser::TmxMap map = make_map();
    map.propertyMap["length"] = "far";
    std::unique_ptr<World> world = world_from_map(map);
    ASSERT_NE(world, nullptr);
    EXPECT_FLOAT_EQ(world->get_length(), 100.0f);
}

TEST(LevelLoaderTest, RejectsMapWithoutTileSize) {
    tmxparser::TmxMap map = make_map();
    map.tileWidth = 0;
    EXPECT_EQ(world_from_map(map), nullptr);
}

TEST(LevelLoaderTest, SkippedObjectsTakeNoId) {
    tmxparser::TmxMap map = make_map();
    tmxparser::ObjectGroup &obstacles = map.objectGroupCollection[0];
    obstacles.objects.insert(obstacles.objects.begin(),
                             make_object(0.0f, 0.0f, 0.0f, 16.0f));

    std::unique_ptr<World> world = world_from_map(map);
    ASSERT_NE(world, nullptr);
    const auto &loaded = world->get_obstacles();
    ASSERT_EQ(loaded.size(), 2u);
    EXPECT_EQ(loaded[0].id, 1u);
    EXPECT_EQ(loaded[1].id, 2u);
}

TEST(LevelLoaderTest, LoadsTmxFile) {
    const std::string data_dir = BEATRUN_TEST_DATA_DIR;
    std::unique_ptr<World> world =
        load_level(data_dir + "/level.tmx", data_dir);
    ASSERT_NE(world, nullptr);

    const auto &obstacles = world->get_obstacles();
    ASSERT_EQ(obstacles.size(), 2u);
    EXPECT_EQ(obstacles[0].id, 1u);
    EXPECT_FLOAT_EQ(obstacles[0].rect.x, 2.0f);
    EXPECT_FLOAT_EQ(obstacles[0].rect.y, 0.0f);
    EXPECT_FLOAT_EQ(obstacles[0].rect.width, 1.0f);
    EXPECT_FLOAT_EQ(obstacles[0].rect.height, 2.0f);
    EXPECT_EQ(obstacles[1].id, 2u);
    EXPECT_FLOAT_EQ(obstacles[1].rect.x, 4.0f);
    EXPECT_FLOAT_EQ(obstacles[1].rect.y, 2.0f);
    EXPECT_FLOAT_EQ(obstacles[1].rect.width, 2.0f);
    EXPECT_FLOAT_EQ(obstacles[1].rect.height, 1.0f);

    EXPECT_FLOAT_EQ(world->terrain_height_at(4.0f), 0.0f);
    EXPECT_FLOAT_EQ(world->terrain_height_at(5.0f), 1.0f);
    EXPECT_FLOAT_EQ(world->get_length(), 42.5f);
}

TEST(LevelLoaderTest, MissingFileFails) {
    EXPECT_EQ(load_level("./does/not/exist.tmx", "./does/not"), nullptr);
}
