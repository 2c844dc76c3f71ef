#pragma once

namespace watch {

// Sets `flag` for the lifetime of the scope and clears it on every exit
// path, exceptions included.
class ScopedFlag {
public:
    explicit ScopedFlag(bool& flag) : flag_(flag) { flag_ = true; }
    ~ScopedFlag() { flag_ = false; }

    ScopedFlag(const ScopedFlag&)            = delete;
    ScopedFlag& operator=(const ScopedFlag&) = delete;

private:
    bool& flag_;
};

} // namespace watch
