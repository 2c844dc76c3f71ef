#pragma once
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// LoadSystem — Logic-phase system; lets the user push each metric around.
//
//   UP    spawn SPAWN_BATCH spinners (frame rate drops)
//   DOWN  destroy every spinner
//   M     allocate one MemoryBallast block (memory rises)
//   N     release all ballast
//
// Spinners are created through world.deferred() and appear after the
// pipeline's post-Logic flush. Also animates existing spinners.
// ---------------------------------------------------------------------------

class LoadSystem {
public:
    static constexpr int SPAWN_BATCH = 250;

    static void Update(ecs::World& world, float dt);

    // Number of live Spinner entities.
    static int SpinnerCount(ecs::World& world);
};
