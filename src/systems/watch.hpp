#pragma once
#include "../pipeline.hpp"
#include "../screenshot_queue.hpp"
#include "../watch/action_executor.hpp"
#include "../watch/watch_packet.hpp"
#include <ecs/ecs.hpp>
#include <string>

// ---------------------------------------------------------------------------
// RaylibActionExecutor — action services for the raylib host.
//
//   log                → TraceLog (Log/Warning/Error → LOG_INFO/WARNING/ERROR)
//   capture_screenshot → queued; TakeScreenshot runs in flush_screenshots()
//                        from the Render phase, before EndDrawing
//   request_break      → pauses the Pipeline (P resumes, see main.cpp)
//
// capture_screenshot() only reports whether the request was accepted; a
// failed write is logged at LOG_ERROR when the queue is flushed.
// ---------------------------------------------------------------------------

class RaylibActionExecutor : public watch::ActionExecutor {
public:
    explicit RaylibActionExecutor(ecs::Pipeline& pipeline) : pipeline_(pipeline) {}

    void log(watch::MessageSeverity severity, const std::string& text) override;
    bool capture_screenshot(const std::string& path) override;
    bool request_break() override;

    // Render phase, after everything is drawn and before EndDrawing.
    void flush_screenshots();

private:
    ecs::Pipeline&  pipeline_;
    ScreenshotQueue screenshots_;
};

// ---------------------------------------------------------------------------
// WatchSystem — Logic-phase system; runs the DebugEngine sweep.
//
// Reads the std::shared_ptr<watch::DebugEngine> resource installed by
// WatchModule. Must run after MonitorSystem so conditions see this frame's
// readings.
// ---------------------------------------------------------------------------

class WatchSystem {
public:
    static void Update(ecs::World& world, float dt);

    // Named hooks available to watch files. Known names:
    //   "fired_event"  sends WatchFiredEvent{id, execute_once}
    // Returns an empty hook for unknown names.
    static watch::EventHook ResolveHook(ecs::World& world, const std::string& name);
};
