#include "monitors.hpp"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iterator>
#include <sstream>

// ---------------------------------------------------------------------------
// FrameRateMonitor
// ---------------------------------------------------------------------------

FrameRateMonitor::FrameRateMonitor(std::size_t window)
    : window_(std::max<std::size_t>(window, 1), 0.0f) {}

void FrameRateMonitor::sample(float dt) {
    if (dt <= 0.0f) return;

    current_       = 1.0f / dt;
    window_[next_] = current_;
    next_          = (next_ + 1) % window_.size();
    count_         = std::min(count_ + 1, window_.size());

    const auto begin = window_.begin();
    const auto end   = begin + static_cast<std::ptrdiff_t>(count_);
    const auto [lo, hi] = std::minmax_element(begin, end);
    min_ = *lo;
    max_ = *hi;

    float sum = 0.0f;
    for (auto it = begin; it != end; ++it) sum += *it;
    average_ = sum / static_cast<float>(count_);
}

// ---------------------------------------------------------------------------
// MemoryMonitor
// ---------------------------------------------------------------------------

bool MemoryMonitor::parse_status(const std::string& text, MemoryUsage& out) {
    constexpr float KB_PER_MB = 1024.0f;

    MemoryUsage parsed;
    bool has_rss = false, has_size = false, has_data = false;

    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        std::istringstream fields(line);
        std::string key;
        double kb = 0.0;
        if (!(fields >> key >> kb)) continue;

        if (key == "VmRSS:")       { parsed.resident_mb = static_cast<float>(kb / KB_PER_MB); has_rss  = true; }
        else if (key == "VmSize:") { parsed.virtual_mb  = static_cast<float>(kb / KB_PER_MB); has_size = true; }
        else if (key == "VmData:") { parsed.data_mb     = static_cast<float>(kb / KB_PER_MB); has_data = true; }
    }

    if (!has_rss || !has_size || !has_data) return false;
    out = parsed;
    return true;
}

bool MemoryMonitor::sample() {
    std::ifstream file("/proc/self/status");
    if (!file.is_open()) return false;
    const std::string content(std::istreambuf_iterator<char>(file),
                              std::istreambuf_iterator<char>{});
    return parse_status(content, usage_);
}

// ---------------------------------------------------------------------------
// AudioLevelMonitor
// ---------------------------------------------------------------------------

void AudioLevelMonitor::submit(const float* samples, std::size_t count) {
    float peak = 0.0f;
    for (std::size_t i = 0; i < count; ++i) peak = std::max(peak, std::fabs(samples[i]));

    float seen = running_peak_.load(std::memory_order_relaxed);
    while (peak > seen &&
           !running_peak_.compare_exchange_weak(seen, peak, std::memory_order_relaxed)) {
    }
}

void AudioLevelMonitor::latch() {
    peak_db_ = to_db(running_peak_.exchange(0.0f, std::memory_order_relaxed));
}

float AudioLevelMonitor::to_db(float amplitude) {
    if (amplitude <= 0.0f) return FLOOR_DB;
    return std::max(20.0f * std::log10(amplitude), FLOOR_DB);
}
