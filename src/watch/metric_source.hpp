#pragma once
#include <cstddef>

namespace watch {

// ---------------------------------------------------------------------------
// MetricVariable — which live reading a Condition compares against.
//
// Frame rate in frames/second, memory in megabytes, audio peak in dBFS.
// New variables are appended here and given an accessor in metric_source.cpp;
// the evaluation code never switches on this enum.
// ---------------------------------------------------------------------------

enum class MetricVariable {
    FrameRate,
    FrameRateMin,
    FrameRateMax,
    FrameRateAverage,
    MemoryAllocated,
    MemoryReserved,
    MemoryManaged,
    AudioPeak,
};

// ---------------------------------------------------------------------------
// MetricSource — read-only view of the monitors.
//
// Implemented by the host (MonitorResource) and by test fakes. Accessors are
// polled every frame and must be side-effect free.
// ---------------------------------------------------------------------------

class MetricSource {
public:
    virtual ~MetricSource() = default;

    virtual float current_fps() const = 0;
    virtual float min_fps() const = 0;
    virtual float max_fps() const = 0;
    virtual float average_fps() const = 0;

    virtual float allocated_memory_mb() const = 0;
    virtual float reserved_memory_mb() const = 0;
    virtual float managed_memory_mb() const = 0;

    virtual float audio_peak_db() const = 0;
};

// Reads the value named by `variable`. Values outside the enum read 0.
float read_metric(const MetricSource& source, MetricVariable variable);

// Number of variables that have an accessor.
std::size_t metric_variable_count();

} // namespace watch
