#pragma once
#include <cstddef>
#include <functional>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// ScreenshotQueue — screenshot requests held until the frame is drawn.
//
// The watch sweep runs in Logic, before anything is drawn, so a capture taken
// there would read a stale back buffer. RaylibActionExecutor pushes paths
// here and drains the queue from RenderSystem::FinishFrame, before
// EndDrawing swaps the buffers.
//
// No raylib dependency — compilable in the headless test target.
// ---------------------------------------------------------------------------

class ScreenshotQueue {
public:
    using Writer = std::function<void(const std::string& path)>;

    void push(std::string path) { pending_.push_back(std::move(path)); }

    bool        empty() const { return pending_.empty(); }
    std::size_t size()  const { return pending_.size(); }

    // Writes every queued path in request order and empties the queue.
    // A file already at the path is deleted first, so success means `write`
    // produced it. Returns the paths that were not written.
    std::vector<std::string> flush(const Writer& write);

private:
    std::vector<std::string> pending_;
};
