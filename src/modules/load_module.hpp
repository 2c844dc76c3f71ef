#pragma once
#include "../components.hpp"
#include "../pipeline.hpp"
#include "../systems/load.hpp"
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// LoadModule
//
// Creates the MemoryBallast resource and adds LoadSystem to the Logic phase.
// Load changes made here show up in the monitors on the next Pre-Update.
// ---------------------------------------------------------------------------

struct LoadModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline) {
        world.set_resource(MemoryBallast{});
        pipeline.add_logic([](ecs::World& w, float dt) { LoadSystem::Update(w, dt); });
    }
};
