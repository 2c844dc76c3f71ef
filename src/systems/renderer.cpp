#include "renderer.hpp"
#include "../components.hpp"
#include "watch.hpp"
#include <raylib.h>
#include <rlgl.h>
#include <algorithm>
#include <cstdio>
#include <memory>

using namespace ecs;

static constexpr int   BORDER_PX     = 6;

// Convert our engine Color4 to Raylib's Color at draw time.
static inline Color to_raylib(const Color4& c) {
    return Color{
        static_cast<unsigned char>(c.r * 255.0f),
        static_cast<unsigned char>(c.g * 255.0f),
        static_cast<unsigned char>(c.b * 255.0f),
        static_cast<unsigned char>(c.a * 255.0f),
    };
}

void RenderSystem::Update(World& world, float dt, bool paused) {
    // dt is 0 while paused, so the flash holds until P resumes.
    if (auto* flash = world.try_resource<AlertFlash>())
        flash->remaining = std::max(0.0f, flash->remaining - dt);

    BeginDrawing();
    ClearBackground({35, 35, 40, 255});

    Camera3D camera = {};
    camera.position   = {40.0f, 35.0f, 40.0f};
    camera.target     = {0.0f, 0.0f, 0.0f};
    camera.up         = {0, 1, 0};
    camera.fovy       = 45.0f;
    camera.projection = CAMERA_PERSPECTIVE;

    BeginMode3D(camera);
        DrawGrid(60, 2.0f);
        world.each<Spinner>([&](Entity, Spinner& s) {
            rlPushMatrix();
            rlTranslatef(s.position.x, s.position.y, s.position.z);
            rlRotatef(s.angle, 0.0f, 1.0f, 0.0f);
            DrawCube({0, 0, 0}, 1.0f, 1.0f, 1.0f, to_raylib(s.color));
            rlPopMatrix();
        });
    EndMode3D();

    const int w = GetScreenWidth();
    const int h = GetScreenHeight();

    DrawText("UP: +spinners | DOWN: clear | M: +64 MB | N: free | T: tone | P: pause | F3: overlay",
             10, h - 30, 20, LIGHTGRAY);

    if (const auto* flash = world.try_resource<AlertFlash>()) {
        if (flash->remaining > 0.0f) {
            const auto alpha = static_cast<unsigned char>(255.0f * flash->remaining / AlertFlash::DURATION);
            DrawRectangleLinesEx({0, 0, static_cast<float>(w), static_cast<float>(h)},
                                 BORDER_PX, {230, 41, 55, alpha});
            char b[48];
            std::snprintf(b, sizeof(b), "WATCH %d FIRED", flash->last_packet_id);
            DrawText(b, w - MeasureText(b, 20) - 16, 16, 20, RED);
        }
    }

    if (paused) {
        const char* msg = "PAUSED BY WATCH - press P";
        DrawText(msg, (w - MeasureText(msg, 30)) / 2, h / 2 - 15, 30, YELLOW);
    }
}

void RenderSystem::FinishFrame(World& world) {
    if (auto* executor = world.try_resource<std::shared_ptr<RaylibActionExecutor>>(); executor && *executor)
        (*executor)->flush_screenshots();
    EndDrawing();
}
