#include "watch.hpp"
#include "../events.hpp"
#include "../watch/debug_engine.hpp"
#include <raylib.h>
#include <memory>

void RaylibActionExecutor::log(watch::MessageSeverity severity, const std::string& text) {
    int level = LOG_INFO;
    switch (severity) {
        case watch::MessageSeverity::Log:     level = LOG_INFO;    break;
        case watch::MessageSeverity::Warning: level = LOG_WARNING; break;
        case watch::MessageSeverity::Error:   level = LOG_ERROR;   break;
    }
    TraceLog(level, "%s", text.c_str());
}

bool RaylibActionExecutor::capture_screenshot(const std::string& path) {
    if (!IsWindowReady()) return false;
    screenshots_.push(path);
    return true;
}

void RaylibActionExecutor::flush_screenshots() {
    if (screenshots_.empty()) return;
    const auto failed = screenshots_.flush([](const std::string& path) {
        TakeScreenshot(path.c_str());
    });
    for (const auto& path : failed)
        TraceLog(LOG_ERROR, "WATCH: screenshot '%s' failed: nothing written", path.c_str());
}

bool RaylibActionExecutor::request_break() {
    if (pipeline_.paused()) return true;
    pipeline_.set_paused(true);
    TraceLog(LOG_WARNING, "WATCH: execution paused by a watch packet. Press P to resume.");
    return true;
}

void WatchSystem::Update(ecs::World& world, float dt) {
    auto* engine_ptr = world.try_resource<std::shared_ptr<watch::DebugEngine>>();
    if (!engine_ptr || !*engine_ptr) return;
    (*engine_ptr)->update(dt);
}

watch::EventHook WatchSystem::ResolveHook(ecs::World& world, const std::string& name) {
    if (name == "fired_event") {
        return [&world](const watch::WatchPacket& packet) {
            if (auto* q = world.try_resource<Events<WatchFiredEvent>>())
                q->send({packet.id, packet.execute_once});
        };
    }
    return {};
}
