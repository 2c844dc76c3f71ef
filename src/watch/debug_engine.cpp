#include "debug_engine.hpp"
#include "scoped_flag.hpp"
#include <algorithm>
#include <exception>
#include <iostream>
#include <optional>
#include <stdexcept>

namespace watch {

// Runs fn and returns the failure text, if any.
template<typename F>
static std::optional<std::string> attempt(F&& fn) {
    try {
        fn();
        return std::nullopt;
    } catch (const std::exception& e) {
        return std::string(e.what());
    } catch (...) {
        return std::string("unknown exception");
    }
}

static std::string describe(const WatchPacket& packet) {
    return "packet " + std::to_string(packet.id);
}

DebugEngine::DebugEngine(const MetricSource& metrics, ActionExecutor& executor)
    : metrics_(&metrics), executor_(&executor) {}

// ---------------------------------------------------------------------------
// Management API
// ---------------------------------------------------------------------------

WatchPacket& DebugEngine::add(WatchPacket packet) {
    slots_.push_back({std::make_unique<WatchPacket>(std::move(packet)), false});
    return *slots_.back().packet;
}

WatchPacket& DebugEngine::add(int id, const Condition& condition,
                              MessageSeverity severity, std::string message,
                              bool debug_break, Callback callback) {
    return add(id, std::vector<Condition>{condition}, severity, std::move(message),
               debug_break, std::vector<Callback>{std::move(callback)});
}

WatchPacket& DebugEngine::add(int id, std::vector<Condition> conditions,
                              MessageSeverity severity, std::string message,
                              bool debug_break, Callback callback) {
    return add(id, std::move(conditions), severity, std::move(message),
               debug_break, std::vector<Callback>{std::move(callback)});
}

WatchPacket& DebugEngine::add(int id, const Condition& condition,
                              MessageSeverity severity, std::string message,
                              bool debug_break, std::vector<Callback> callbacks) {
    return add(id, std::vector<Condition>{condition}, severity, std::move(message),
               debug_break, std::move(callbacks));
}

WatchPacket& DebugEngine::add(int id, std::vector<Condition> conditions,
                              MessageSeverity severity, std::string message,
                              bool debug_break, std::vector<Callback> callbacks) {
    WatchPacket packet;
    packet.id                      = id;
    packet.conditions              = std::move(conditions);
    packet.actions.severity        = severity;
    packet.actions.message         = std::move(message);
    packet.actions.break_execution = debug_break;
    packet.actions.callbacks       = std::move(callbacks);
    return add(std::move(packet));
}

WatchPacket* DebugEngine::first_with_id(int id) {
    for (auto& slot : slots_)
        if (!slot.doomed && slot.packet->id == id) return slot.packet.get();
    return nullptr;
}

const WatchPacket* DebugEngine::first_with_id(int id) const {
    for (const auto& slot : slots_)
        if (!slot.doomed && slot.packet->id == id) return slot.packet.get();
    return nullptr;
}

std::vector<WatchPacket*> DebugEngine::all_with_id(int id) {
    std::vector<WatchPacket*> out;
    for (auto& slot : slots_)
        if (!slot.doomed && slot.packet->id == id) out.push_back(slot.packet.get());
    return out;
}

bool DebugEngine::remove_first_with_id(int id) {
    for (std::size_t i = 0; i < slots_.size(); ++i) {
        if (!slots_[i].doomed && slots_[i].packet->id == id) {
            erase_or_doom(i);
            return true;
        }
    }
    return false;
}

std::size_t DebugEngine::remove_all_with_id(int id) {
    std::size_t removed = 0;
    for (auto& slot : slots_) {
        if (!slot.doomed && slot.packet->id == id) {
            slot.doomed = true;
            ++removed;
        }
    }
    if (!sweeping_) compact();
    return removed;
}

bool DebugEngine::add_callback_to_first(int id, Callback callback) {
    WatchPacket* packet = first_with_id(id);
    if (!packet) return false;
    packet->actions.callbacks.push_back(std::move(callback));
    return true;
}

std::size_t DebugEngine::add_callback_to_all(int id, Callback callback) {
    const auto packets = all_with_id(id);
    for (WatchPacket* packet : packets) packet->actions.callbacks.push_back(callback);
    return packets.size();
}

std::size_t DebugEngine::size() const {
    return static_cast<std::size_t>(std::count_if(slots_.begin(), slots_.end(),
        [](const Slot& s) { return !s.doomed; }));
}

// ---------------------------------------------------------------------------
// Sweep
// ---------------------------------------------------------------------------

void DebugEngine::update(float dt) {
    if (sweeping_) {
        report(MessageSeverity::Warning, "WATCH: update() re-entered from an action; ignored");
        return;
    }
    {
        ScopedFlag sweeping(sweeping_);

        // Packets appended by callbacks wait for the next frame.
        const std::size_t count = slots_.size();
        for (std::size_t i = 0; i < count; ++i) {
            if (slots_[i].doomed) continue;
            WatchPacket& packet = *slots_[i].packet;
            if (!packet.active) continue;

            const auto failure = attempt([&] {
                packet.advance(dt);
                if (!packet.eligible() || !packet.is_satisfied(*metrics_)) return;

                execute(packet);
                if (packet.execute_once) slots_[i].doomed = true;
            });
            if (failure) {
                report(MessageSeverity::Error,
                       "WATCH: " + describe(packet) + " failed during sweep: " + *failure);
            }
        }
    }

    compact();
}

void DebugEngine::execute(WatchPacket& packet) {
    const ActionSet& actions = packet.actions;

    std::string stamp;
    if (auto failure = attempt([&] { stamp = executor_->timestamp(); })) {
        stamp = "unknown time";
        report(MessageSeverity::Warning, "WATCH: timestamp unavailable: " + *failure);
    }

    // 1. Break
    if (actions.break_execution) {
        auto failure = attempt([&] {
            if (!executor_->request_break()) {
                report(MessageSeverity::Warning,
                       "WATCH: " + describe(packet) + " requested a break; host cannot pause");
            }
        });
        if (failure) report(MessageSeverity::Error, "WATCH: break failed: " + *failure);
    }

    // 2. Message
    if (!actions.message.empty()) {
        const std::string text = format_message(prefix_, stamp, actions.message);
        auto failure = attempt([&] { executor_->log(actions.severity, text); });
        if (failure) report(MessageSeverity::Error, "WATCH: message dispatch failed: " + *failure);
    }

    // 3. Screenshot
    if (actions.capture_screenshot) {
        const std::string path = screenshot_path(actions.screenshot_name, stamp);
        auto failure = attempt([&] {
            if (!executor_->capture_screenshot(path))
                throw std::runtime_error("nothing written");
        });
        if (failure) {
            report(MessageSeverity::Error,
                   "WATCH: screenshot '" + path + "' failed: " + *failure);
        }
    }

    // 4-5. Hooks and callbacks. Copied before the call: an action may attach
    // more callbacks to this packet and grow the vector underneath us.
    const std::size_t hook_count = actions.event_hooks.size();
    for (std::size_t i = 0; i < hook_count; ++i) {
        EventHook hook = actions.event_hooks[i];
        if (!hook) continue;
        if (auto failure = attempt([&] { hook(packet); })) {
            report(MessageSeverity::Error,
                   "WATCH: " + describe(packet) + " event hook " + std::to_string(i) +
                   " threw: " + *failure);
        }
    }

    const std::size_t callback_count = actions.callbacks.size();
    for (std::size_t i = 0; i < callback_count; ++i) {
        Callback callback = actions.callbacks[i];
        if (!callback) continue;
        if (auto failure = attempt(callback)) {
            report(MessageSeverity::Error,
                   "WATCH: " + describe(packet) + " callback " + std::to_string(i) +
                   " threw: " + *failure);
        }
    }

    // 6. Re-arm
    packet.mark_executed();
}

void DebugEngine::erase_or_doom(std::size_t index) {
    if (sweeping_) {
        slots_[index].doomed = true;
        return;
    }
    slots_.erase(slots_.begin() + static_cast<std::ptrdiff_t>(index));
}

void DebugEngine::compact() {
    slots_.erase(std::remove_if(slots_.begin(), slots_.end(),
                                [](const Slot& s) { return s.doomed; }),
                 slots_.end());
}

void DebugEngine::report(MessageSeverity severity, const std::string& text) {
    try {
        executor_->log(severity, text);
    } catch (const std::exception& e) {
        std::cerr << text << " (log channel failed: " << e.what() << ")\n";
    } catch (...) {
        std::cerr << text << " (log channel failed)\n";
    }
}

} // namespace watch
