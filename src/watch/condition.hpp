#pragma once
#include "metric_source.hpp"

namespace watch {

enum class Comparator {
    LessThan,
    LessOrEqual,
    Equal,          // approximate, see approximately()
    GreaterOrEqual,
    GreaterThan,
};

// One threshold test: `read(variable) <comparator> threshold`.
struct Condition {
    MetricVariable variable   = MetricVariable::FrameRate;
    Comparator     comparator = Comparator::LessThan;
    float          threshold  = 0.0f;
};

// Tolerant float equality. Relative tolerance of 1e-6 with an absolute floor
// of 8 * FLT_EPSILON near zero.
bool approximately(float a, float b);

// Pure: reads one metric and applies the comparator.
bool evaluate(const Condition& condition, const MetricSource& source);

// Display names, also the spellings accepted by WatchLoader.
const char* variable_name(MetricVariable variable);
const char* comparator_symbol(Comparator comparator);

} // namespace watch
