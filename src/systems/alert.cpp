#include "alert.hpp"
#include "../components.hpp"
#include "../events.hpp"

void AlertSystem::Update(ecs::World& world, float /*dt*/) {
    auto* flash = world.try_resource<AlertFlash>();
    const auto* events = world.try_resource<Events<WatchFiredEvent>>();
    if (!flash || !events) return;

    for (const auto& ev : events->read()) {
        flash->remaining      = AlertFlash::DURATION;
        flash->last_packet_id = ev.packet_id;
        flash->total_fired++;
    }
}
