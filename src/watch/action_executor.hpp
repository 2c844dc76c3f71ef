#pragma once
#include "watch_packet.hpp"
#include <string>

namespace watch {

// ---------------------------------------------------------------------------
// ActionExecutor — the side-effect services the action pipeline calls into.
//
// The host wires a raylib-backed implementation (systems/watch.hpp); tests
// use a recording fake. Implementations may throw; DebugEngine contains and
// reports every failure.
// ---------------------------------------------------------------------------

class ActionExecutor {
public:
    virtual ~ActionExecutor() = default;

    // Logging channel. Also receives the engine's own failure reports.
    virtual void log(MessageSeverity severity, const std::string& text) = 0;

    // Captures the current frame to `path`. Returns false if nothing was
    // written.
    virtual bool capture_screenshot(const std::string& path) = 0;

    // Asks the host to suspend stepping. Returns false when the host has no
    // such capability.
    virtual bool request_break() = 0;

    // Stamp used in messages and screenshot names. Local time,
    // "YYYY-MM-DD HH:MM:SS".
    virtual std::string timestamp() const;
};

// "[prefix] (timestamp): message"
std::string format_message(const std::string& prefix,
                           const std::string& timestamp,
                           const std::string& message);

// Replaces '/' and ':' with '-' and ' ' with '_'.
std::string sanitize_filename(std::string name);

// sanitize_filename(name + "_" + timestamp + ".png")
std::string screenshot_path(const std::string& name, const std::string& timestamp);

} // namespace watch
