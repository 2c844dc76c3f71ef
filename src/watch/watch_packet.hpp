#pragma once
#include "condition.hpp"
#include <functional>
#include <string>
#include <vector>

namespace watch {

struct WatchPacket;

enum class CombinationPolicy { AllMustMatch, AnyMayMatch };

enum class MessageSeverity { Log, Warning, Error };

using Callback  = std::function<void()>;
using EventHook = std::function<void(const WatchPacket&)>;

// What to do when a packet's conditions hold. Steps run in declaration order
// (break, message, screenshot, hooks, callbacks); see DebugEngine::execute.
struct ActionSet {
    MessageSeverity severity        = MessageSeverity::Log;
    std::string     message;                    // empty: no message
    bool            capture_screenshot = false;
    std::string     screenshot_name = "FrameWatch_Screenshot";
    bool            break_execution = false;

    std::vector<EventHook> event_hooks;
    std::vector<Callback>  callbacks;           // empty entries are skipped
};

// ---------------------------------------------------------------------------
// WatchPacket — the scheduling unit.
//
// Configuration is public and may be edited between frames. The timer is
// private and only moves through advance() and mark_executed():
//
//   Cooling  --elapsed >= delay-->  Eligible  --mark_executed-->  Cooling
//
// `delay` is init_delay until the first firing, recheck_delay afterwards.
// An eligible packet whose conditions fail stays eligible.
// ---------------------------------------------------------------------------

struct WatchPacket {
    int   id            = 0;        // caller-assigned, not unique
    bool  active        = true;     // inactive packets are skipped entirely
    bool  execute_once  = true;     // removed after the first firing
    float init_delay    = 2.0f;     // seconds before the first check
    float recheck_delay = 2.0f;     // seconds between firings

    CombinationPolicy      policy = CombinationPolicy::AllMustMatch;
    std::vector<Condition> conditions;
    ActionSet              actions;

    // Accumulates dt while cooling. No-op when inactive.
    void advance(float dt);

    // Reduces the condition list per `policy`. An empty list satisfies
    // AllMustMatch and never satisfies AnyMayMatch.
    bool is_satisfied(const MetricSource& source) const;

    // Re-arms the cooldown after the action pipeline ran.
    void mark_executed();

    bool  eligible()  const { return eligible_; }
    bool  has_fired() const { return fired_; }
    float elapsed()   const { return elapsed_; }

private:
    float elapsed_  = 0.0f;
    bool  fired_    = false;
    bool  eligible_ = false;
};

} // namespace watch
