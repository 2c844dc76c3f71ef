#pragma once
#include <ecs/ecs.hpp>
#include <cstddef>
#include <functional>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// Events<T> — per-frame queue of one event type, held as a World resource.
//
// Watch hooks send() during the Logic-phase sweep; AlertSystem read()s later
// in the same phase. The queue lives until the next unpaused Pre-Update, so
// while the pipeline is paused it still holds the firing that paused it.
// ---------------------------------------------------------------------------

template<typename T>
struct Events {
    void send(T event)                     { buffer_.push_back(std::move(event)); }
    const std::vector<T>& read()   const  { return buffer_; }
    bool                  empty()  const  { return buffer_.empty(); }
    void                  clear()         { buffer_.clear(); }

private:
    std::vector<T> buffer_;
};

// ---------------------------------------------------------------------------
// EventRegistry — clears every registered queue; main() runs flush_all() as
// the first Pre-Update step.
//
// Modules register the queues they emit into at install time. Registering a
// type twice keeps the existing queue and its single flush entry.
// ---------------------------------------------------------------------------

class EventRegistry {
public:
    template<typename T>
    void register_queue(ecs::World& world) {
        if (world.try_resource<Events<T>>()) return;
        world.set_resource(Events<T>{});
        flush_fns_.push_back([&world]() {
            if (auto* q = world.try_resource<Events<T>>()) q->clear();
        });
    }

    void flush_all() {
        for (auto& fn : flush_fns_) fn();
    }

    std::size_t queue_count() const { return flush_fns_.size(); }

private:
    std::vector<std::function<void()>> flush_fns_;
};

// ---------------------------------------------------------------------------
// Concrete event types
// ---------------------------------------------------------------------------

// Emitted by the "fired_event" watch hook when a packet's actions run.
// one_shot: the packet is removed at the end of this sweep.
struct WatchFiredEvent {
    int  packet_id;
    bool one_shot;
};
