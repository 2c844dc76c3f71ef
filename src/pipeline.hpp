#pragma once
#include <ecs/ecs.hpp>
#include <vector>
#include <functional>
#include <utility>

namespace ecs {

/**
 * @brief Manages groups of systems categorized by execution phase, with a
 *        pause switch that freezes everything but rendering.
 */
class Pipeline {
public:
    using SystemFunc = std::function<void(World&, float)>;

    void add_pre_update(SystemFunc func) { pre_update_.push_back(std::move(func)); }
    void add_logic(SystemFunc func)      { logic_.push_back(std::move(func)); }
    void add_render(SystemFunc func)     { render_.push_back(std::move(func)); }

    /**
     * @brief While paused, frame() skips Pre-Update and Logic; Render still
     *        runs (with dt = 0) so the window stays responsive.
     */
    void set_paused(bool paused) { paused_ = paused; }
    bool paused() const          { return paused_; }

    /**
     * @brief Runs one host frame: input/monitoring, gameplay/watch logic,
     *        deferred structural changes, then rendering.
     */
    void frame(World& world, float dt) {
        if (!paused_) {
            for (auto& sys : pre_update_) sys(world, dt);
            for (auto& sys : logic_) sys(world, dt);

            // Apply entities spawned/destroyed during Logic before drawing.
            world.deferred().flush(world);
        }
        for (auto& sys : render_) sys(world, paused_ ? 0.0f : dt);
    }

private:
    std::vector<SystemFunc> pre_update_;
    std::vector<SystemFunc> logic_;
    std::vector<SystemFunc> render_;
    bool paused_ = false;
};

} // namespace ecs
