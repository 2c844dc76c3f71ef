#include "load.hpp"
#include "../components.hpp"
#include <raylib.h>
#include <cstring>
#include <memory>
#include <vector>

using namespace ecs;

static constexpr int   GRID_SIDE = 40;   // spinners per row
static constexpr float SPACING   = 1.5f;

static void spawn_batch(World& world, int existing) {
    for (int i = 0; i < LoadSystem::SPAWN_BATCH; ++i) {
        const int n   = existing + i;
        const int col = n % GRID_SIDE;
        const int row = (n / GRID_SIDE) % GRID_SIDE;
        const int lay = n / (GRID_SIDE * GRID_SIDE);

        Spinner s;
        s.position = {(col - GRID_SIDE / 2) * SPACING,
                      0.5f + lay * SPACING,
                      (row - GRID_SIDE / 2) * SPACING};
        s.speed    = 45.0f + static_cast<float>(n % 7) * 30.0f;
        s.color    = {0.3f + 0.1f * static_cast<float>(n % 7), 0.4f, 0.9f - 0.1f * static_cast<float>(n % 5), 1.0f};
        world.deferred().create_with(std::move(s));
    }
}

int LoadSystem::SpinnerCount(World& world) {
    int count = 0;
    world.each<Spinner>([&](Entity, Spinner&) { ++count; });
    return count;
}

void LoadSystem::Update(World& world, float dt) {
    world.each<Spinner>([dt](Entity, Spinner& s) {
        s.angle += s.speed * dt;
        if (s.angle > 360.0f) s.angle -= 360.0f;
    });

    if (IsKeyPressed(KEY_UP)) {
        const int existing = SpinnerCount(world);
        spawn_batch(world, existing);
        TraceLog(LOG_INFO, "LOAD: spinners %d -> %d", existing, existing + SPAWN_BATCH);
    }

    if (IsKeyPressed(KEY_DOWN)) {
        std::vector<Entity> to_destroy;
        world.each<Spinner>([&](Entity e, Spinner&) { to_destroy.push_back(e); });
        for (auto e : to_destroy) world.destroy(e);
        TraceLog(LOG_INFO, "LOAD: destroyed %d spinners", static_cast<int>(to_destroy.size()));
    }

    auto* ballast = world.try_resource<MemoryBallast>();
    if (!ballast) return;

    if (IsKeyPressed(KEY_M)) {
        // Touch every page so the block counts toward resident memory.
        auto block = std::make_unique<unsigned char[]>(MemoryBallast::BLOCK_BYTES);
        std::memset(block.get(), 0xA5, MemoryBallast::BLOCK_BYTES);
        ballast->blocks.push_back(std::move(block));
        TraceLog(LOG_INFO, "LOAD: ballast now %d MB", static_cast<int>(ballast->megabytes()));
    }

    if (IsKeyPressed(KEY_N) && !ballast->blocks.empty()) {
        ballast->blocks.clear();
        ballast->blocks.shrink_to_fit();
        TraceLog(LOG_INFO, "LOAD: ballast released");
    }
}
