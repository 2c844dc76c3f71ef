#pragma once
#include "../events.hpp"
#include "../monitors.hpp"
#include "../pipeline.hpp"
#include "../systems/watch.hpp"
#include "../watch/debug_engine.hpp"
#include "../watch/watch_loader.hpp"
#include <ecs/ecs.hpp>
#include <raylib.h>
#include <memory>
#include <string>

// ---------------------------------------------------------------------------
// WatchModule
//
// Builds the watch engine and wires it into the frame:
//   - std::shared_ptr<RaylibActionExecutor> resource (actions → raylib)
//   - std::shared_ptr<watch::DebugEngine> resource, reading MonitorResource
//   - Events<WatchFiredEvent> queue for the "fired_event" hook
//   - packets from `config_path` (a missing or bad file is logged and the
//     engine starts empty)
//   - WatchSystem in the Logic phase
//
// Requires MonitorModule. The Pipeline must outlive the world resources
// (the executor pauses it on break).
// ---------------------------------------------------------------------------

struct WatchModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline, const std::string& config_path) {
        auto& metrics = world.resource<std::shared_ptr<MonitorResource>>();

        auto executor = std::make_shared<RaylibActionExecutor>(pipeline);
        auto engine   = std::make_shared<watch::DebugEngine>(*metrics, *executor);
        world.set_resource(executor);
        world.set_resource(engine);

        world.resource<EventRegistry>().register_queue<WatchFiredEvent>(world);

        std::string error;
        const bool ok = watch::WatchLoader::load(
            *engine, config_path,
            [&world](const std::string& name) { return WatchSystem::ResolveHook(world, name); },
            &error);
        if (ok) {
            TraceLog(LOG_INFO, "WATCH: loaded %d packet(s) from %s",
                     static_cast<int>(engine->size()), config_path.c_str());
        } else {
            TraceLog(LOG_WARNING, "WATCH: %s; starting with no packets", error.c_str());
        }

        pipeline.add_logic([](ecs::World& w, float dt) { WatchSystem::Update(w, dt); });
    }

    static watch::DebugEngine& engine(ecs::World& world) {
        return *world.resource<std::shared_ptr<watch::DebugEngine>>();
    }
};
