#pragma once
#include "../monitors.hpp"
#include "../pipeline.hpp"
#include "../systems/monitor.hpp"
#include <ecs/ecs.hpp>
#include <memory>

// ---------------------------------------------------------------------------
// MonitorModule
//
// Creates the MonitorResource (held by shared_ptr: the audio thread keeps a
// raw pointer into it, so it must never move) and adds MonitorSystem to the
// Pre-Update phase, after the event flush.
//
// Must be installed before AudioModule and WatchModule; both look up the
// resource during install.
// ---------------------------------------------------------------------------

struct MonitorModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline) {
        world.set_resource(std::make_shared<MonitorResource>());
        pipeline.add_pre_update([](ecs::World& w, float dt) { MonitorSystem::Update(w, dt); });
    }
};
