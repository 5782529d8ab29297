#ifndef BEATRUN_CONFIG_HPP
#define BEATRUN_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <string>

constexpr uint32_t TICK_RATE = 120;
constexpr float TICK_INTERVAL = 1.0f / TICK_RATE;
// stop catching up after a long frame instead of spiralling
constexpr size_t MAX_STEPS_PER_FRAME = 8;

constexpr float DEFAULT_RUN_SPEED = 5.0f;

constexpr int WINDOW_WIDTH = 1080, WINDOW_HEIGHT = 720;
constexpr float PIXELS_PER_UNIT = 48.0f;
constexpr float SHAKE_DURATION = 0.25f;
constexpr float SHAKE_STRENGTH = 6.0f;

struct RunConfig {
    std::string level_path;
    std::string tileset_path;
    float run_speed = DEFAULT_RUN_SPEED;
    bool verbose = false;
};

#endif // BEATRUN_CONFIG_HPP
