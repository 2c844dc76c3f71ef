#pragma once
#include "../components.hpp"
#include "../pipeline.hpp"
#include "../systems/alert.hpp"
#include "../systems/renderer.hpp"
#include <ecs/ecs.hpp>

// ---------------------------------------------------------------------------
// RenderModule
//
// Creates the AlertFlash world resource, adds AlertSystem to the Logic phase
// (must be installed after WatchModule so it runs after the sweep) and adds
// RenderSystem to the Render phase. RenderSystem opens the frame;
// install_finish() adds the screenshot + EndDrawing step and must be called
// after every other Render-phase install (DebugModule draws in between).
// ---------------------------------------------------------------------------

struct RenderModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline) {
        world.set_resource(AlertFlash{});
        pipeline.add_logic([](ecs::World& w, float dt) { AlertSystem::Update(w, dt); });
        pipeline.add_render([&pipeline](ecs::World& w, float dt) {
            RenderSystem::Update(w, dt, pipeline.paused());
        });
    }

    static void install_finish(ecs::World& /*world*/, ecs::Pipeline& pipeline) {
        pipeline.add_render([](ecs::World& w, float) { RenderSystem::FinishFrame(w); });
    }
};
