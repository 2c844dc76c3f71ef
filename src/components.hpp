#pragma once
#include <ecs/ecs.hpp>
#include <ecs/modules/transform.hpp>
#include <cstddef>
#include <memory>
#include <vector>

// Plain data only — no raylib dependency, so systems convert at
// draw time.

// ---------------------------------------------------------------------------
// Visuals
// ---------------------------------------------------------------------------

struct Color4 {
    float r = 1.0f, g = 1.0f, b = 1.0f, a = 1.0f;
};

// ---------------------------------------------------------------------------
// Load generator
// ---------------------------------------------------------------------------

// A cube spinning in place. Spawned in batches by LoadSystem to drag the
// frame rate down.
struct Spinner {
    ecs::Vec3 position = {0, 0, 0};
    float     angle    = 0.0f;  // degrees
    float     speed    = 90.0f; // degrees/second
    Color4    color;
};

// Heap blocks held to raise process memory on demand.
struct MemoryBallast {
    static constexpr std::size_t BLOCK_BYTES = 64u * 1024u * 1024u;

    std::vector<std::unique_ptr<unsigned char[]>> blocks;

    std::size_t megabytes() const { return blocks.size() * (BLOCK_BYTES / (1024u * 1024u)); }
};

// ---------------------------------------------------------------------------
// Alert feedback
// ---------------------------------------------------------------------------

// Seconds of red border left after a WatchFiredEvent.
struct AlertFlash {
    static constexpr float DURATION = 0.6f;

    float remaining = 0.0f;
    int   last_packet_id = 0;
    int   total_fired = 0;
};
