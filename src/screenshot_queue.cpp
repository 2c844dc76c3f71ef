#include "screenshot_queue.hpp"
#include <filesystem>
#include <system_error>
#include <utility>

std::vector<std::string> ScreenshotQueue::flush(const Writer& write) {
    std::vector<std::string> failed;

    // Swap out first: a writer that requests another capture lands next frame.
    std::vector<std::string> batch;
    batch.swap(pending_);

    for (const auto& path : batch) {
        // Timestamps have one-second resolution; drop a same-named file
        // from an earlier firing.
        std::error_code ec;
        std::filesystem::remove(path, ec);
        if (ec) {
            failed.push_back(path);
            continue;
        }

        write(path);
        if (!std::filesystem::exists(path, ec)) failed.push_back(path);
    }
    return failed;
}
