#include "condition.hpp"
#include <algorithm>
#include <cfloat>
#include <cmath>

namespace watch {

bool approximately(float a, float b) {
    const float scale = std::max(std::fabs(a), std::fabs(b));
    return std::fabs(b - a) < std::max(1e-6f * scale, FLT_EPSILON * 8.0f);
}

bool evaluate(const Condition& condition, const MetricSource& source) {
    const float value = read_metric(source, condition.variable);

    switch (condition.comparator) {
        case Comparator::LessThan:       return value <  condition.threshold;
        case Comparator::LessOrEqual:    return value <= condition.threshold;
        case Comparator::Equal:          return approximately(value, condition.threshold);
        case Comparator::GreaterOrEqual: return value >= condition.threshold;
        case Comparator::GreaterThan:    return value >  condition.threshold;
    }
    return false;
}

const char* variable_name(MetricVariable variable) {
    switch (variable) {
        case MetricVariable::FrameRate:        return "FrameRate";
        case MetricVariable::FrameRateMin:     return "FrameRateMin";
        case MetricVariable::FrameRateMax:     return "FrameRateMax";
        case MetricVariable::FrameRateAverage: return "FrameRateAverage";
        case MetricVariable::MemoryAllocated:  return "MemoryAllocated";
        case MetricVariable::MemoryReserved:   return "MemoryReserved";
        case MetricVariable::MemoryManaged:    return "MemoryManaged";
        case MetricVariable::AudioPeak:        return "AudioPeak";
    }
    return "Unknown";
}

const char* comparator_symbol(Comparator comparator) {
    switch (comparator) {
        case Comparator::LessThan:       return "<";
        case Comparator::LessOrEqual:    return "<=";
        case Comparator::Equal:          return "==";
        case Comparator::GreaterOrEqual: return ">=";
        case Comparator::GreaterThan:    return ">";
    }
    return "?";
}

} // namespace watch
