#include "player_frame.hpp"

#include <algorithm>
#include <array>
#include <cstddef>

#include "state/player.hpp"

namespace {
constexpr std::array<PlayerFrame, WALK_FRAME_COUNT> WALK_FRAMES = {
    PlayerFrame::WALK_A, PlayerFrame::WALK_B};
constexpr std::array<PlayerFrame, DEATH_FRAME_COUNT> DEATH_FRAMES = {
    PlayerFrame::HIT,
    PlayerFrame::DUCK,
    PlayerFrame::GHOST,
    PlayerFrame::GHOST_CROSSED};

size_t frame_index(float time, float frame_duration) {
    if (time <= 0.0f) return 0;
    return static_cast<size_t>(time / frame_duration);
}
} // namespace

PlayerFrame select_player_frame(const PlayerBody &player,
                                float now,
                                bool paused) {
    switch (player.get_phase()) {
    case PlayerPhase::DEAD: {
        // death animation stops on the last frame
        size_t idx = frame_index(now - player.get_death_time(),
                                 DEATH_FRAME_DURATION);
        return DEATH_FRAMES[std::min(idx, DEATH_FRAME_COUNT - 1)];
    }
    case PlayerPhase::RUNNING:
        if (player.is_hit_shown()) return PlayerFrame::HIT;
        if (paused) return WALK_FRAMES[0];
        return WALK_FRAMES[frame_index(now, WALK_FRAME_DURATION) %
                           WALK_FRAME_COUNT];
    case PlayerPhase::JUMPING:
        if (player.is_hit_shown()) return PlayerFrame::HIT;
        break;
    }
    return PlayerFrame::JUMP;
}
