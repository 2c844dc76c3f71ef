#include "monitor.hpp"
#include "../monitors.hpp"
#include <raylib.h>
#include <memory>

void MonitorSystem::Update(ecs::World& world, float dt) {
    auto* monitors_ptr = world.try_resource<std::shared_ptr<MonitorResource>>();
    if (!monitors_ptr || !*monitors_ptr) return;
    auto& monitors = **monitors_ptr;

    monitors.fps.sample(dt);
    monitors.audio.latch();

    static float since_poll = MEMORY_POLL_SECONDS; // poll on the first frame
    static bool  warned     = false;

    since_poll += dt;
    if (since_poll < MEMORY_POLL_SECONDS) return;
    since_poll = 0.0f;

    if (!monitors.memory.sample() && !warned) {
        TraceLog(LOG_WARNING, "MONITOR: /proc/self/status unreadable; memory metrics frozen");
        warned = true;
    }
}
