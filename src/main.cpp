#include "events.hpp"
#include "pipeline.hpp"
#include "modules/audio_module.hpp"
#include "modules/debug_module.hpp"
#include "modules/load_module.hpp"
#include "modules/monitor_module.hpp"
#include "modules/render_module.hpp"
#include "modules/watch_module.hpp"
#include "watch/debug_engine.hpp"
#include <ecs/ecs.hpp>
#include <raylib.h>
#include <string>

static const char* WATCH_PATH = "resources/watches.json";

// Id of the packet registered from code below (not from the watch file).
static constexpr int MEMORY_WATCH_ID = 100;

int main(int argc, char** argv) {
  const std::string watch_path = argc > 1 ? argv[1] : WATCH_PATH;

  SetConfigFlags(FLAG_WINDOW_RESIZABLE);
  InitWindow(1280, 720, "Frame Watch - Runtime Alerts");
  SetTargetFPS(60);

  ecs::World world;
  ecs::Pipeline pipeline;

  // --- Event Bus Setup ---
  // Flush previous frame's events first thing in Pre-Update.
  world.set_resource(EventRegistry{});
  pipeline.add_pre_update([](ecs::World& w, float) { w.resource<EventRegistry>().flush_all(); });

  // --- Modules ---
  // Pre-Update: flush → monitors.  Logic: audio → load → watch sweep → alerts.
  // Render: scene → overlay → screenshots + EndDrawing.
  MonitorModule::install(world, pipeline);
  AudioModule::install(world, pipeline);
  LoadModule::install(world, pipeline);
  WatchModule::install(world, pipeline, watch_path);
  RenderModule::install(world, pipeline);
  DebugModule::install(world, pipeline);
  RenderModule::install_finish(world, pipeline);

  // --- Code-registered watches ---
  {
    auto& engine = WatchModule::engine(world);

    watch::WatchPacket& ram = engine.add(
        MEMORY_WATCH_ID,
        watch::Condition{watch::MetricVariable::MemoryAllocated, watch::Comparator::GreaterThan, 512.0f},
        watch::MessageSeverity::Warning,
        "Resident memory above 512 MB",
        false,
        []() { TraceLog(LOG_INFO, "WATCH: memory callback ran; press N to free ballast"); });
    ram.execute_once  = false;
    ram.recheck_delay = 5.0f;

    // Attach a callback to every file-defined frame-rate watch (id 1).
    const auto attached = engine.add_callback_to_all(1, []() {
        TraceLog(LOG_INFO, "WATCH: frame-rate callback ran; press DOWN to clear spinners");
    });
    if (attached == 0) TraceLog(LOG_INFO, "WATCH: no packet with id 1 to attach a callback to");
  }

  // --- Main Loop ---
  while (!WindowShouldClose()) {
    if (IsKeyPressed(KEY_P)) {
      pipeline.set_paused(!pipeline.paused());
      TraceLog(LOG_INFO, "HOST: %s", pipeline.paused() ? "paused" : "resumed");
    }

    pipeline.frame(world, GetFrameTime());
  }

  AudioModule::shutdown(world);
  CloseWindow();
  return 0;
}
