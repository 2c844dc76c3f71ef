#pragma once
#include "../components.hpp"
#include "../debug_panel.hpp"
#include "../monitors.hpp"
#include "../pipeline.hpp"
#include "../systems/debug.hpp"
#include "../systems/load.hpp"
#include "../watch/debug_engine.hpp"
#include <ecs/ecs.hpp>
#include <cstdio>
#include <memory>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// DebugModule
//
// Creates the DebugPanel world resource with three sections:
//   Monitors  every value a watch condition can read
//   Load      spinner count and ballast size
//   Watches   one row per live packet with its timer state
// and adds DebugSystem to the Render phase (after RenderSystem).
//
// Providers look resources up lazily, so install order relative to
// MonitorModule/WatchModule does not matter.
// ---------------------------------------------------------------------------

struct DebugModule {
    static void install(ecs::World& world, ecs::Pipeline& pipeline) {
        DebugPanel panel;

        using Reader = float (*)(const MonitorResource&);
        auto metric = [&world](Reader read, const char* fmt) {
            return [&world, read, fmt]() {
                auto* m = world.try_resource<std::shared_ptr<MonitorResource>>();
                if (!m || !*m) return std::string("-");
                char b[32];
                std::snprintf(b, sizeof(b), fmt, read(**m));
                return std::string(b);
            };
        };

        panel.watch("Monitors", "FPS",         metric([](const MonitorResource& m) { return m.current_fps(); }, "%.1f"));
        panel.watch("Monitors", "FPS min",     metric([](const MonitorResource& m) { return m.min_fps(); }, "%.1f"));
        panel.watch("Monitors", "FPS max",     metric([](const MonitorResource& m) { return m.max_fps(); }, "%.1f"));
        panel.watch("Monitors", "FPS avg",     metric([](const MonitorResource& m) { return m.average_fps(); }, "%.1f"));
        panel.watch("Monitors", "RAM resident", metric([](const MonitorResource& m) { return m.allocated_memory_mb(); }, "%.1f MB"));
        panel.watch("Monitors", "RAM virtual",  metric([](const MonitorResource& m) { return m.reserved_memory_mb(); }, "%.1f MB"));
        panel.watch("Monitors", "RAM data",     metric([](const MonitorResource& m) { return m.managed_memory_mb(); }, "%.1f MB"));
        panel.watch("Monitors", "Audio peak",   metric([](const MonitorResource& m) { return m.audio_peak_db(); }, "%.1f dB"));

        panel.watch("Load", "Spinners", [&world]() {
            return std::to_string(LoadSystem::SpinnerCount(world));
        });
        panel.watch("Load", "Ballast", [&world]() {
            auto* b = world.try_resource<MemoryBallast>();
            return b ? std::to_string(b->megabytes()) + " MB" : std::string("-");
        });

        panel.watch_list("Watches", [&world]() {
            std::vector<DebugPanel::Entry> rows;
            auto* e = world.try_resource<std::shared_ptr<watch::DebugEngine>>();
            if (!e || !*e) return rows;
            (*e)->each([&](const watch::WatchPacket& p) { rows.push_back(describe(p)); });
            if (rows.empty()) rows.emplace_back("(none)", "");
            return rows;
        });

        world.set_resource(std::move(panel));
        pipeline.add_render([](ecs::World& w, float dt) { DebugSystem::Update(w, dt); });
    }

private:
    // "#3 FrameRate < 30 +1" -> "cooling 1.2/2.0 s"
    static DebugPanel::Entry describe(const watch::WatchPacket& p) {
        std::string label = "#" + std::to_string(p.id);
        if (!p.conditions.empty()) {
            const auto& c = p.conditions.front();
            char b[64];
            std::snprintf(b, sizeof(b), " %s %s %g", watch::variable_name(c.variable),
                          watch::comparator_symbol(c.comparator), c.threshold);
            label += b;
            if (p.conditions.size() > 1) label += " +" + std::to_string(p.conditions.size() - 1);
        }

        if (!p.active)    return {label, "inactive"};
        if (p.eligible()) return {label, "armed"};

        char b[32];
        std::snprintf(b, sizeof(b), "cooling %.1f/%.1f s", p.elapsed(),
                      p.has_fired() ? p.recheck_delay : p.init_delay);
        return {label, b};
    }
};
