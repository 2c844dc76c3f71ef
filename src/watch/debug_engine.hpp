#pragma once
#include "action_executor.hpp"
#include "metric_source.hpp"
#include "watch_packet.hpp"
#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace watch {

// ---------------------------------------------------------------------------
// DebugEngine — owns the watch packets and runs the per-frame sweep.
//
// Constructed explicitly by the host (WatchModule stores it as a
// std::shared_ptr world resource). The MetricSource and ActionExecutor must
// outlive the engine.
//
// Not thread-safe: every call, including update(), belongs on the frame
// thread. Callbacks fired by update() may call back into the management API:
//   - add() during a sweep appends; the new packet is first checked next frame.
//   - remove_*() during a sweep only marks the packet; it is destroyed when
//     the sweep compacts.
//
// Packet pointers returned by the lookup functions stay valid until that
// packet is removed.
// ---------------------------------------------------------------------------

class DebugEngine {
public:
    DebugEngine(const MetricSource& metrics, ActionExecutor& executor);

    DebugEngine(const DebugEngine&)            = delete;
    DebugEngine& operator=(const DebugEngine&) = delete;

    // --- Management API ---

    WatchPacket& add(WatchPacket packet);

    WatchPacket& add(int id, const Condition& condition,
                     MessageSeverity severity, std::string message,
                     bool debug_break, Callback callback);
    WatchPacket& add(int id, std::vector<Condition> conditions,
                     MessageSeverity severity, std::string message,
                     bool debug_break, Callback callback);
    WatchPacket& add(int id, const Condition& condition,
                     MessageSeverity severity, std::string message,
                     bool debug_break, std::vector<Callback> callbacks);
    WatchPacket& add(int id, std::vector<Condition> conditions,
                     MessageSeverity severity, std::string message,
                     bool debug_break, std::vector<Callback> callbacks);

    // nullptr when no packet has `id`.
    WatchPacket*       first_with_id(int id);
    const WatchPacket* first_with_id(int id) const;

    std::vector<WatchPacket*> all_with_id(int id);

    // Returns false when no packet has `id`.
    bool        remove_first_with_id(int id);
    std::size_t remove_all_with_id(int id);

    bool        add_callback_to_first(int id, Callback callback);
    std::size_t add_callback_to_all(int id, Callback callback);

    // --- Per-frame tick ---

    // Advances every active packet by dt seconds, fires the satisfied ones
    // and drops the one-shots that fired. Never throws.
    void update(float dt);

    // Live packets (excludes ones marked for removal), in sweep order.
    std::size_t size() const;

    template<typename F>
    void each(F&& fn) const {
        for (const auto& slot : slots_)
            if (!slot.doomed) fn(static_cast<const WatchPacket&>(*slot.packet));
    }

    void               set_message_prefix(std::string prefix) { prefix_ = std::move(prefix); }
    const std::string& message_prefix() const                 { return prefix_; }

private:
    struct Slot {
        std::unique_ptr<WatchPacket> packet;
        bool                         doomed = false;
    };

    void execute(WatchPacket& packet);
    void erase_or_doom(std::size_t index);
    void compact();
    void report(MessageSeverity severity, const std::string& text);

    const MetricSource* metrics_;
    ActionExecutor*     executor_;
    std::vector<Slot>   slots_;
    std::string         prefix_   = "FrameWatch";
    bool                sweeping_ = false;
};

} // namespace watch
