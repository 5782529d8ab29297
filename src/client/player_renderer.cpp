#include "player_renderer.hpp"

#include <raylib.h>

#include "client/player_frame.hpp"
#include "client/world_renderer.hpp"
#include "config.hpp"
#include "state/player.hpp"

Color frame_color(PlayerFrame frame) {
    switch (frame) {
    case PlayerFrame::WALK_A:
        return Color{0, 255, 255, 255};
    case PlayerFrame::WALK_B:
        return Color{60, 160, 255, 255};
    case PlayerFrame::JUMP:
        return Color{50, 255, 160, 255};
    case PlayerFrame::HIT:
        return Color{207, 87, 80, 255};
    case PlayerFrame::DUCK:
        return Color{185, 89, 61, 255};
    case PlayerFrame::GHOST:
        return Color{230, 230, 255, 180};
    case PlayerFrame::GHOST_CROSSED:
        return Color{230, 230, 255, 90};
    }
    return WHITE;
}

void player_render(const PlayerBody &player, PlayerFrame frame) {
    Rectangle r = to_screen_rect(player.get_rect());
    if (frame == PlayerFrame::DUCK) {
        // squash to half height
        r.y += r.height / 2.0f;
        r.height /= 2.0f;
    }
    DrawRectangleRec(r, frame_color(frame));
    if (frame == PlayerFrame::GHOST_CROSSED) {
        DrawLine(r.x, r.y, r.x + r.width, r.y + r.height, BLACK);
        DrawLine(r.x + r.width, r.y, r.x, r.y + r.height, BLACK);
    }
}

void hud_render(const PlayerBody &player, bool paused, bool finished) {
    // draw health bar
    const float max_width = 240.0f, max_height = 18.0f;
    const float bar_width = (float)player.get_health() /
                            PlayerBody::MAX_HEALTH * (max_width - 2.0f);

    Rectangle health_rect;
    health_rect.x = 20.0f;
    health_rect.y = 20.0f;
    health_rect.width = max_width;
    health_rect.height = max_height;

    DrawRectangle(health_rect.x + 1.0f,
                  health_rect.y + 1.0f,
                  health_rect.width - 2.0f,
                  health_rect.height - 2.0f,
                  Color{185, 89, 61, 255});
    DrawRectangle(health_rect.x + 1.0f,
                  health_rect.y + 1.0f,
                  bar_width,
                  health_rect.height - 2.0f,
                  Color{150, 80, 250, 255});
    DrawRectangleLinesEx(health_rect, 1.0f, WHITE);

    DrawText(TextFormat("%d", player.get_score_points()),
             WINDOW_WIDTH - 200,
             20,
             32,
             WHITE);
    if (player.get_score_multiplier() > 1.0f) {
        DrawText(TextFormat("x%.1f", player.get_score_multiplier()),
                 WINDOW_WIDTH - 200,
                 56,
                 24,
                 Color{255, 240, 0, 255});
    }

    const char *banner = nullptr;
    if (player.is_dead()) {
        banner = "GAME OVER - press R to restart";
    } else if (finished) {
        banner = "LEVEL COMPLETE - press R to restart";
    } else if (paused) {
        banner = "PAUSED";
    }
    if (banner != nullptr) {
        int width = MeasureText(banner, 32);
        DrawText(banner,
                 WINDOW_WIDTH / 2 - width / 2,
                 WINDOW_HEIGHT / 2 - 16,
                 32,
                 WHITE);
    }
}
