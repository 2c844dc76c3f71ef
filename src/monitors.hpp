#pragma once
#include "watch/metric_source.hpp"
#include <atomic>
#include <cstddef>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// Monitors — the metric producers behind watch::MetricSource.
//
// MonitorSystem feeds them once per frame (frame time, /proc/self/status,
// audio latch); the audio mixer thread feeds AudioLevelMonitor::submit().
// No raylib dependency — compilable in the headless test target.
// ---------------------------------------------------------------------------

// Instantaneous, min, max and mean fps over a sliding window of frames.
class FrameRateMonitor {
public:
    explicit FrameRateMonitor(std::size_t window = 200);

    // Non-positive frame times are ignored.
    void sample(float dt);

    float       current() const { return current_; }
    float       min()     const { return min_; }
    float       max()     const { return max_; }
    float       average() const { return average_; }
    std::size_t samples() const { return count_; }

private:
    std::vector<float> window_;
    std::size_t        next_    = 0;
    std::size_t        count_   = 0;
    float              current_ = 0.0f;
    float              min_     = 0.0f;
    float              max_     = 0.0f;
    float              average_ = 0.0f;
};

// Process memory in megabytes, read from /proc/self/status.
//   resident_mb: VmRSS   (what the process is actually using)
//   virtual_mb:  VmSize  (address space reserved)
//   data_mb:     VmData  (heap + data segment managed by the allocator)
struct MemoryUsage {
    float resident_mb = 0.0f;
    float virtual_mb  = 0.0f;
    float data_mb     = 0.0f;
};

class MemoryMonitor {
public:
    // Parses the text of a /proc/<pid>/status file. Returns false if any of
    // the three fields is missing; `out` is left unchanged in that case.
    static bool parse_status(const std::string& text, MemoryUsage& out);

    // Re-reads /proc/self/status. Returns false (keeping the last values)
    // if the file is unreadable.
    bool sample();

    const MemoryUsage& usage() const { return usage_; }

private:
    MemoryUsage usage_;
};

// Peak level of the mixed audio output, in dBFS.
class AudioLevelMonitor {
public:
    static constexpr float FLOOR_DB = -80.0f;

    // Audio thread. `samples` are interleaved floats in [-1, 1].
    void submit(const float* samples, std::size_t count);

    // Frame thread. Publishes the peak seen since the previous latch().
    void latch();

    float peak_db() const { return peak_db_; }

    static float to_db(float amplitude);

private:
    std::atomic<float> running_peak_{0.0f};
    float              peak_db_ = FLOOR_DB;
};

// ---------------------------------------------------------------------------
// MonitorResource — World resource (held by shared_ptr) exposing all three
// monitors to the watch engine.
// ---------------------------------------------------------------------------

struct MonitorResource : watch::MetricSource {
    FrameRateMonitor  fps;
    MemoryMonitor     memory;
    AudioLevelMonitor audio;

    float current_fps() const override { return fps.current(); }
    float min_fps()     const override { return fps.min(); }
    float max_fps()     const override { return fps.max(); }
    float average_fps() const override { return fps.average(); }

    float allocated_memory_mb() const override { return memory.usage().resident_mb; }
    float reserved_memory_mb()  const override { return memory.usage().virtual_mb; }
    float managed_memory_mb()   const override { return memory.usage().data_mb; }

    float audio_peak_db() const override { return audio.peak_db(); }
};
