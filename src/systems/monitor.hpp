#pragma once
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// MonitorSystem — Pre-Update system; refreshes MonitorResource.
//
// Frame rate is sampled every frame from dt. Process memory is re-read from
// /proc every MEMORY_POLL_SECONDS. The audio peak is latched every frame.
// ---------------------------------------------------------------------------

class MonitorSystem {
public:
    static constexpr float MEMORY_POLL_SECONDS = 0.25f;

    static void Update(ecs::World& world, float dt);
};
