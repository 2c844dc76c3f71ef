#include "metric_source.hpp"

namespace watch {

using Accessor = float (MetricSource::*)() const;

// Indexed by MetricVariable.
static constexpr Accessor ACCESSORS[] = {
    &MetricSource::current_fps,
    &MetricSource::min_fps,
    &MetricSource::max_fps,
    &MetricSource::average_fps,
    &MetricSource::allocated_memory_mb,
    &MetricSource::reserved_memory_mb,
    &MetricSource::managed_memory_mb,
    &MetricSource::audio_peak_db,
};

static constexpr std::size_t ACCESSOR_COUNT = sizeof(ACCESSORS) / sizeof(ACCESSORS[0]);

float read_metric(const MetricSource& source, MetricVariable variable) {
    const auto index = static_cast<std::size_t>(variable);
    if (index >= ACCESSOR_COUNT) return 0.0f;
    return (source.*ACCESSORS[index])();
}

std::size_t metric_variable_count() {
    return ACCESSOR_COUNT;
}

} // namespace watch
