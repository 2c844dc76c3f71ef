#pragma once
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// AlertSystem — Logic-phase system; turns WatchFiredEvents into AlertFlash.
//
// Runs after WatchSystem in the same phase, so it sees every event of this
// frame's sweep exactly once, including the one from a packet that paused
// the pipeline (Logic finishes the frame it was entered in; the queue is
// not read again while paused). RenderSystem only draws and decays the flash.
// ---------------------------------------------------------------------------

class AlertSystem {
public:
    static void Update(ecs::World& world, float dt);
};
