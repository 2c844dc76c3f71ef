#include "action_executor.hpp"
#include <algorithm>
#include <chrono>
#include <ctime>

namespace watch {

std::string ActionExecutor::timestamp() const {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);

    char buf[32];
    const std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &local);
    return std::string(buf, n);
}

std::string format_message(const std::string& prefix,
                           const std::string& timestamp,
                           const std::string& message) {
    return "[" + prefix + "] (" + timestamp + "): " + message;
}

std::string sanitize_filename(std::string name) {
    std::replace(name.begin(), name.end(), '/', '-');
    std::replace(name.begin(), name.end(), ' ', '_');
    std::replace(name.begin(), name.end(), ':', '-');
    return name;
}

std::string screenshot_path(const std::string& name, const std::string& timestamp) {
    return sanitize_filename(name + "_" + timestamp + ".png");
}

} // namespace watch
