#include <spdlog/spdlog.h>

#include <memory>
#include <stdexcept>
#include <string>

#include "client/game.hpp"
#include "config.hpp"
#include "world/level_loader.hpp"
#include "world/world.hpp"

int main(int argc, char **argv) {
    RunConfig config;
    int argi = 1;
    if (argi < argc && std::string(argv[argi]) == "-v") {
        config.verbose = true;
        ++argi;
    }
    if (argc - argi != 2 && argc - argi != 3) {
        spdlog::error(
            "Invalid usage: ./beatrun [-v] <level.tmx> <tileset_dir> "
            "[run_speed]");
        return -1;
    }
    if (config.verbose) {
        spdlog::set_level(spdlog::level::debug);
    }
    config.level_path = argv[argi];
    config.tileset_path = argv[argi + 1];
    if (argc - argi == 3) {
        try {
            config.run_speed = std::stof(argv[argi + 2]);
        } catch (std::invalid_argument const &e) {
            spdlog::error("std::invalid argument: {}", e.what());
            return -1;
        } catch (std::out_of_range const &e) {
            spdlog::error("std::out_of_range: {}", e.what());
            return -1;
        }
        if (config.run_speed <= 0.0f) {
            spdlog::error("Invalid run speed: Must be > 0.");
            return -1;
        }
    }

    std::unique_ptr<World> world =
        load_level(config.level_path, config.tileset_path);
    if (!world) {
        return -1;
    }
    Game game(*world, config);
    game.run();
    return 0;
}
