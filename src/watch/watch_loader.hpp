#pragma once
#include "debug_engine.hpp"
#include <functional>
#include <string>

namespace watch {

// ---------------------------------------------------------------------------
// WatchLoader — reads JSON watch files into a DebugEngine.
//
// All-or-nothing: every packet is parsed before any is added, so a malformed
// file leaves the engine untouched. Omitted packet fields keep the
// WatchPacket defaults. Hook names are resolved through `hooks`; an unknown
// name (or a resolver returning an empty hook) fails the load.
// No raylib dependency — compilable in the headless test target.
// ---------------------------------------------------------------------------

class WatchLoader {
public:
    using HookResolver = std::function<EventHook(const std::string& name)>;

    // Returns false if the file cannot be opened or the JSON is malformed.
    // On failure `error` (if given) receives the reason.
    static bool load(DebugEngine& engine, const std::string& path,
                     const HookResolver& hooks = {}, std::string* error = nullptr);

    // Identical to load() but parses from memory. Intended for unit testing.
    static bool load_from_string(DebugEngine& engine, const std::string& json,
                                 const HookResolver& hooks = {}, std::string* error = nullptr);
};

} // namespace watch
