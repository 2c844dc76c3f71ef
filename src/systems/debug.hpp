#pragma once
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// DebugSystem — Render-phase system; draws the DebugPanel overlay.
//
// Runs after RenderSystem (inside its BeginDrawing). Toggle with F3.
// ---------------------------------------------------------------------------

class DebugSystem {
public:
    static void Update(ecs::World& world, float dt);
};
