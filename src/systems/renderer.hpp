#pragma once
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// RenderSystem — Render-phase system; opens the frame.
//
// Draws the spinner field, the key legend and the alert feedback (red border
// while AlertFlash is running, PAUSED banner while the pipeline is paused).
// Calls BeginDrawing(); DebugSystem draws on top, and FinishFrame() must be
// the last render step: it writes queued watch screenshots of the finished
// frame, then calls EndDrawing().
// ---------------------------------------------------------------------------

class RenderSystem {
public:
    static void Update(ecs::World& world, float dt, bool paused);
    static void FinishFrame(ecs::World& world);
};
