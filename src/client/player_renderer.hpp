#ifndef BEATRUN_CLIENT_PLAYERRENDERER_HPP
#define BEATRUN_CLIENT_PLAYERRENDERER_HPP

#include <raylib.h>

#include "client/player_frame.hpp"
#include "state/player.hpp"

Color frame_color(PlayerFrame frame);

// draws the player in world space, call inside BeginMode2D
void player_render(const PlayerBody &player, PlayerFrame frame);

// draws health, score and multiplier in screen space
void hud_render(const PlayerBody &player, bool paused, bool finished);

#endif // BEATRUN_CLIENT_PLAYERRENDERER_HPP
