#ifndef BEATRUN_CLIENT_PLAYERFRAME_HPP
#define BEATRUN_CLIENT_PLAYERFRAME_HPP

#include <cstddef>
#include <cstdint>

#include "state/player.hpp"

enum class PlayerFrame : uint8_t {
    WALK_A,
    WALK_B,
    JUMP,
    HIT,
    DUCK,
    GHOST,
    GHOST_CROSSED,
};

constexpr float WALK_FRAME_DURATION = 0.2f;
constexpr float DEATH_FRAME_DURATION = 0.5f;
constexpr size_t WALK_FRAME_COUNT = 2;
constexpr size_t DEATH_FRAME_COUNT = 4;

/**
 * Picks the animation frame for the player
 * @param now animation clock time
 * @param paused shows the first walk frame instead of cycling
 */
PlayerFrame select_player_frame(const PlayerBody &player,
                                float now,
                                bool paused);

#endif // BEATRUN_CLIENT_PLAYERFRAME_HPP
