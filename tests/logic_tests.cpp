#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "fakes.hpp"
#include "../src/watch/condition.hpp"
#include "../src/watch/debug_engine.hpp"
#include "../src/watch/scoped_flag.hpp"
#include "../src/watch/watch_packet.hpp"
#include <iostream>
#include <stdexcept>
#include <streambuf>
#include <string>
#include <vector>

// The watch core has no engine-library dependencies, so everything here runs
// against FakeMetrics and RecordingExecutor without a window or audio device.

using namespace watch;

// 0.25 s steps add up exactly in float, so delay boundaries are deterministic.
static constexpr float DT = 0.25f;

static Condition fps_below(float threshold) {
    return Condition{MetricVariable::FrameRate, Comparator::LessThan, threshold};
}

// ---------------------------------------------------------------------------
// Conditions
// ---------------------------------------------------------------------------

TEST_CASE("approximately — tolerant near equal values", "[condition]") {
    CHECK(approximately(60.0f, 60.00000001f));
    CHECK(approximately(0.0f, 0.0f));
    CHECK(approximately(0.0f, 1e-7f));
    CHECK_FALSE(approximately(60.0f, 60.1f));
    CHECK_FALSE(approximately(0.0f, 0.001f));
}

TEST_CASE("evaluate — every comparator against the frame rate", "[condition]") {
    FakeMetrics m;
    m.fps = 60.0f;

    CHECK(evaluate({MetricVariable::FrameRate, Comparator::LessThan, 61.0f}, m));
    CHECK_FALSE(evaluate({MetricVariable::FrameRate, Comparator::LessThan, 60.0f}, m));

    CHECK(evaluate({MetricVariable::FrameRate, Comparator::LessOrEqual, 60.0f}, m));
    CHECK_FALSE(evaluate({MetricVariable::FrameRate, Comparator::LessOrEqual, 59.0f}, m));

    CHECK(evaluate({MetricVariable::FrameRate, Comparator::GreaterOrEqual, 60.0f}, m));
    CHECK_FALSE(evaluate({MetricVariable::FrameRate, Comparator::GreaterOrEqual, 61.0f}, m));

    CHECK(evaluate({MetricVariable::FrameRate, Comparator::GreaterThan, 59.0f}, m));
    CHECK_FALSE(evaluate({MetricVariable::FrameRate, Comparator::GreaterThan, 60.0f}, m));
}

TEST_CASE("evaluate — Equal is approximate", "[condition]") {
    FakeMetrics m;
    m.fps = 60.00000001f;
    CHECK(evaluate({MetricVariable::FrameRate, Comparator::Equal, 60.0f}, m));

    m.fps = 60.5f;
    CHECK_FALSE(evaluate({MetricVariable::FrameRate, Comparator::Equal, 60.0f}, m));
}

TEST_CASE("read_metric — each variable reads its own accessor", "[condition]") {
    FakeMetrics m;
    m.fps = 1.0f; m.fps_min = 2.0f; m.fps_max = 3.0f; m.fps_avg = 4.0f;
    m.ram_allocated = 5.0f; m.ram_reserved = 6.0f; m.ram_managed = 7.0f;
    m.audio_db = -8.0f;

    CHECK(read_metric(m, MetricVariable::FrameRate)        == 1.0f);
    CHECK(read_metric(m, MetricVariable::FrameRateMin)     == 2.0f);
    CHECK(read_metric(m, MetricVariable::FrameRateMax)     == 3.0f);
    CHECK(read_metric(m, MetricVariable::FrameRateAverage) == 4.0f);
    CHECK(read_metric(m, MetricVariable::MemoryAllocated)  == 5.0f);
    CHECK(read_metric(m, MetricVariable::MemoryReserved)   == 6.0f);
    CHECK(read_metric(m, MetricVariable::MemoryManaged)    == 7.0f);
    CHECK(read_metric(m, MetricVariable::AudioPeak)        == -8.0f);
}

TEST_CASE("read_metric — unrecognized variable reads 0", "[condition]") {
    FakeMetrics m;
    m.fps = 60.0f;
    const auto bogus = static_cast<MetricVariable>(99);
    CHECK(read_metric(m, bogus) == 0.0f);
    CHECK(evaluate({bogus, Comparator::Equal, 0.0f}, m));
}

TEST_CASE("variable_name — names round trip the loader spellings", "[condition]") {
    CHECK(std::string(variable_name(MetricVariable::FrameRate)) == "FrameRate");
    CHECK(std::string(variable_name(MetricVariable::MemoryAllocated)) == "MemoryAllocated");
    CHECK(std::string(comparator_symbol(Comparator::GreaterOrEqual)) == ">=");
}

// ---------------------------------------------------------------------------
// WatchPacket — combination policy
// ---------------------------------------------------------------------------

TEST_CASE("WatchPacket — policies over every truth assignment", "[packet]") {
    FakeMetrics m;
    m.fps = 60.0f;

    // FrameRate > 0 holds, FrameRate > 1000 does not.
    const Condition yes{MetricVariable::FrameRate, Comparator::GreaterThan, 0.0f};
    const Condition no {MetricVariable::FrameRate, Comparator::GreaterThan, 1000.0f};

    constexpr int N = 3;
    for (int mask = 0; mask < (1 << N); ++mask) {
        WatchPacket p;
        for (int bit = 0; bit < N; ++bit) p.conditions.push_back((mask >> bit) & 1 ? yes : no);

        const bool all = mask == (1 << N) - 1;
        const bool any = mask != 0;

        p.policy = CombinationPolicy::AllMustMatch;
        CHECK(p.is_satisfied(m) == all);
        p.policy = CombinationPolicy::AnyMayMatch;
        CHECK(p.is_satisfied(m) == any);
    }
}

TEST_CASE("WatchPacket — empty condition list", "[packet]") {
    FakeMetrics m;
    WatchPacket p;

    p.policy = CombinationPolicy::AllMustMatch;
    CHECK(p.is_satisfied(m));
    p.policy = CombinationPolicy::AnyMayMatch;
    CHECK_FALSE(p.is_satisfied(m));
}

// ---------------------------------------------------------------------------
// WatchPacket — timer
// ---------------------------------------------------------------------------

TEST_CASE("WatchPacket — defaults", "[packet]") {
    WatchPacket p;
    CHECK(p.active);
    CHECK(p.execute_once);
    CHECK(p.init_delay == 2.0f);
    CHECK(p.recheck_delay == 2.0f);
    CHECK(p.policy == CombinationPolicy::AllMustMatch);
    CHECK(p.actions.screenshot_name == "FrameWatch_Screenshot");
    CHECK_FALSE(p.eligible());
    CHECK_FALSE(p.has_fired());
}

TEST_CASE("WatchPacket — init delay gates the first check", "[packet]") {
    WatchPacket p;
    p.init_delay    = 0.5f;
    p.recheck_delay = 1.0f;

    p.advance(DT);
    CHECK_FALSE(p.eligible());
    CHECK_THAT(p.elapsed(), Catch::Matchers::WithinAbs(0.25f, 1e-6f));

    p.advance(DT);
    CHECK(p.eligible());
    CHECK(p.elapsed() == 0.0f);
}

TEST_CASE("WatchPacket — eligible packet stays eligible until executed", "[packet]") {
    WatchPacket p;
    p.init_delay = 0.0f;
    p.advance(DT);
    REQUIRE(p.eligible());

    p.advance(DT);
    p.advance(DT);
    CHECK(p.eligible());
    CHECK(p.elapsed() == 0.0f);
}

TEST_CASE("WatchPacket — recheck delay applies after the first firing", "[packet]") {
    WatchPacket p;
    p.init_delay    = 0.0f;
    p.recheck_delay = 0.5f;
    p.advance(DT);
    REQUIRE(p.eligible());

    p.mark_executed();
    CHECK_FALSE(p.eligible());
    CHECK(p.has_fired());

    p.advance(DT);
    CHECK_FALSE(p.eligible());
    p.advance(DT);
    CHECK(p.eligible());
}

TEST_CASE("WatchPacket — inactive packet does not advance", "[packet]") {
    WatchPacket p;
    p.init_delay = 0.5f;
    p.active     = false;

    for (int i = 0; i < 10; ++i) p.advance(DT);
    CHECK(p.elapsed() == 0.0f);
    CHECK_FALSE(p.eligible());
}

TEST_CASE("WatchPacket — non-positive dt does not move the timer", "[packet]") {
    WatchPacket p;
    p.init_delay = 0.5f;
    p.advance(0.0f);
    p.advance(-1.0f);
    CHECK(p.elapsed() == 0.0f);
    CHECK_FALSE(p.eligible());
}

// ---------------------------------------------------------------------------
// DebugEngine — sweep
// ---------------------------------------------------------------------------

TEST_CASE("DebugEngine — low fps after init delay fires exactly once", "[engine]") {
    FakeMetrics       m;
    RecordingExecutor x;
    DebugEngine       engine(m, x);

    int fired = 0, fired_frame = 0, frame = 0;
    engine.add(1, fps_below(30.0f), MessageSeverity::Warning, "Low fps", false,
               [&]() { ++fired; fired_frame = frame; });
    REQUIRE(engine.size() == 1);

    // 3 s at 60 fps: eligible after 2 s, but the condition does not hold.
    m.fps = 60.0f;
    for (frame = 1; frame <= 12; ++frame) engine.update(DT);
    CHECK(fired == 0);
    CHECK(engine.size() == 1);
    CHECK(engine.first_with_id(1)->eligible());

    // Drop to 20 fps: fires on the very next sweep, then the one-shot is gone.
    m.fps = 20.0f;
    for (; frame <= 20; ++frame) engine.update(DT);
    CHECK(fired == 1);
    CHECK(fired_frame == 13);
    CHECK(engine.size() == 0);
    CHECK(engine.first_with_id(1) == nullptr);
}

TEST_CASE("DebugEngine — repeating packet re-arms and fires after recheck delay", "[engine]") {
    FakeMetrics       m;
    RecordingExecutor x;
    DebugEngine       engine(m, x);
    m.fps = 20.0f;

    std::vector<int> frames;
    int frame = 0;
    WatchPacket& p = engine.add(2, fps_below(30.0f), MessageSeverity::Log, "", false,
                                [&]() { frames.push_back(frame); });
    p.execute_once  = false;
    p.init_delay    = 0.5f;
    p.recheck_delay = 1.0f;

    for (frame = 1; frame <= 2; ++frame) engine.update(DT);
    REQUIRE(frames == std::vector<int>{2});
    const WatchPacket* live = engine.first_with_id(2);
    REQUIRE(live != nullptr);
    CHECK(live->has_fired());
    CHECK_FALSE(live->eligible());

    for (; frame <= 10; ++frame) engine.update(DT);
    CHECK(frames == std::vector<int>{2, 6, 10});
    CHECK(engine.size() == 1);
}

TEST_CASE("DebugEngine — inactive packet never fires and resumes its timer", "[engine]") {
    FakeMetrics       m;
    RecordingExecutor x;
    DebugEngine       engine(m, x);
    m.fps = 20.0f;

    int fired = 0;
    WatchPacket& p = engine.add(3, fps_below(30.0f), MessageSeverity::Log, "", false,
                                [&]() { ++fired; });
    p.init_delay = 0.5f;

    engine.update(DT);                      // elapsed 0.25
    p.active = false;
    for (int i = 0; i < 20; ++i) engine.update(DT);
    CHECK(fired == 0);
    CHECK_THAT(p.elapsed(), Catch::Matchers::WithinAbs(0.25f, 1e-6f));

    p.active = true;
    engine.update(DT);
    CHECK(fired == 1);
}

TEST_CASE("DebugEngine — AnyMayMatch fires on a single matching condition", "[engine]") {
    FakeMetrics       m;
    RecordingExecutor x;
    DebugEngine       engine(m, x);
    m.fps           = 30.0f;
    m.ram_allocated = 2e9f;

    int fired = 0;
    WatchPacket& p = engine.add(4,
        std::vector<Condition>{
            {MetricVariable::FrameRate,       Comparator::GreaterThan, 100.0f},
            {MetricVariable::MemoryAllocated, Comparator::GreaterThan, 1e9f},
        },
        MessageSeverity::Log, "", false, [&]() { ++fired; });
    p.policy     = CombinationPolicy::AnyMayMatch;
    p.init_delay = 0.0f;

    CHECK(p.is_satisfied(m));
    engine.update(DT);
    CHECK(fired == 1);
}

TEST_CASE("DebugEngine — several one-shots satisfied in one sweep all fire", "[engine]") {
    FakeMetrics       m;
    RecordingExecutor x;
    DebugEngine       engine(m, x);
    m.fps = 10.0f;

    std::vector<int> order;
    for (int id = 1; id <= 3; ++id) {
        WatchPacket& p = engine.add(id, fps_below(30.0f), MessageSeverity::Log, "", false,
                                    [&order, id]() { order.push_back(id); });
        p.init_delay = 0.0f;
    }

    engine.update(DT);
    CHECK(order == std::vector<int>{1, 2, 3});
    CHECK(engine.size() == 0);
}

// ---------------------------------------------------------------------------
// DebugEngine — action pipeline
// ---------------------------------------------------------------------------

TEST_CASE("DebugEngine — actions run in order: break, message, screenshot, hooks, callbacks",
          "[engine][actions]") {
    FakeMetrics              m;
    RecordingExecutor        x;
    std::vector<std::string> trace;
    x.trace = &trace;
    DebugEngine engine(m, x);
    m.fps = 10.0f;

    WatchPacket p;
    p.id         = 5;
    p.init_delay = 0.0f;
    p.conditions.push_back(fps_below(30.0f));
    p.actions.message            = "Low fps";
    p.actions.capture_screenshot = true;
    p.actions.break_execution    = true;
    p.actions.event_hooks.push_back([&](const WatchPacket& fired) {
        CHECK(fired.id == 5);
        trace.push_back("hook");
    });
    p.actions.callbacks.push_back([&]() { trace.push_back("callback"); });
    engine.add(std::move(p));

    engine.update(DT);
    CHECK(trace == std::vector<std::string>{"break", "log", "screenshot", "hook", "callback"});
    CHECK(x.breaks == 1);
}

TEST_CASE("DebugEngine — message is prefixed and timestamped", "[engine][actions]") {
    FakeMetrics       m;
    RecordingExecutor x;
    DebugEngine       engine(m, x);
    m.fps = 10.0f;

    engine.add(6, fps_below(30.0f), MessageSeverity::Warning, "Low fps", false, Callback{})
        .init_delay = 0.0f;
    engine.update(DT);

    REQUIRE(x.logs.size() == 1);
    CHECK(x.logs[0].severity == MessageSeverity::Warning);
    CHECK(x.logs[0].text == "[FrameWatch] (2017-12-23 10:30:00): Low fps");
}

TEST_CASE("DebugEngine — custom message prefix", "[engine][actions]") {
    FakeMetrics       m;
    RecordingExecutor x;
    DebugEngine       engine(m, x);
    engine.set_message_prefix("Graphy");
    CHECK(engine.message_prefix() == "Graphy");
    m.fps = 10.0f;

    engine.add(6, fps_below(30.0f), MessageSeverity::Error, "Low fps", false, Callback{})
        .init_delay = 0.0f;
    engine.update(DT);

    REQUIRE(x.logs.size() == 1);
    CHECK(x.logs[0].text == "[Graphy] (2017-12-23 10:30:00): Low fps");
}

TEST_CASE("DebugEngine — empty message logs nothing", "[engine][actions]") {
    FakeMetrics       m;
    RecordingExecutor x;
    DebugEngine       engine(m, x);
    m.fps = 10.0f;

    int fired = 0;
    engine.add(6, fps_below(30.0f), MessageSeverity::Log, "", false, [&]() { ++fired; })
        .init_delay = 0.0f;
    engine.update(DT);

    CHECK(fired == 1);
    CHECK(x.logs.empty());
}

TEST_CASE("DebugEngine — screenshot file name is sanitized", "[engine][actions]") {
    FakeMetrics       m;
    RecordingExecutor x;
    DebugEngine       engine(m, x);
    m.fps = 10.0f;

    WatchPacket& p = engine.add(7, fps_below(30.0f), MessageSeverity::Log, "", false, Callback{});
    p.init_delay                 = 0.0f;
    p.actions.capture_screenshot = true;
    p.actions.screenshot_name    = "Graphy Screenshot";
    engine.update(DT);

    REQUIRE(x.screenshots.size() == 1);
    CHECK(x.screenshots[0] == "Graphy_Screenshot_2017-12-23_10-30-00.png");
}

TEST_CASE("sanitize_filename — slashes, spaces and colons", "[actions]") {
    CHECK(sanitize_filename("12/23/2017 10:30:00 AM") == "12-23-2017_10-30-00_AM");
    CHECK(screenshot_path("Shot", "12/23/2017 10:30:00") == "Shot_12-23-2017_10-30-00.png");
    CHECK(format_message("P", "T", "M") == "[P] (T): M");
}

TEST_CASE("DebugEngine — failed screenshot is reported and later steps still run",
          "[engine][actions]") {
    FakeMetrics       m;
    RecordingExecutor x;
    x.screenshot_ok = false;
    DebugEngine engine(m, x);
    m.fps = 10.0f;

    int fired = 0;
    WatchPacket& p = engine.add(8, fps_below(30.0f), MessageSeverity::Log, "", false,
                                [&]() { ++fired; });
    p.init_delay                 = 0.0f;
    p.actions.capture_screenshot = true;
    engine.update(DT);

    CHECK(fired == 1);
    CHECK(x.count(MessageSeverity::Error, "screenshot") == 1);
}

TEST_CASE("DebugEngine — unsupported break warns and continues", "[engine][actions]") {
    FakeMetrics       m;
    RecordingExecutor x;
    x.break_supported = false;
    DebugEngine engine(m, x);
    m.fps = 10.0f;

    int fired = 0;
    engine.add(9, fps_below(30.0f), MessageSeverity::Log, "Stop", true, [&]() { ++fired; })
        .init_delay = 0.0f;
    engine.update(DT);

    CHECK(x.breaks == 1);
    CHECK(x.count(MessageSeverity::Warning, "cannot pause") == 1);
    CHECK(x.count(MessageSeverity::Log, "Stop") == 1);
    CHECK(fired == 1);
}

TEST_CASE("DebugEngine — throwing callback is contained", "[engine][actions]") {
    FakeMetrics       m;
    RecordingExecutor x;
    DebugEngine       engine(m, x);
    m.fps = 10.0f;

    int later = 0, other = 0;
    engine.add(10, fps_below(30.0f), MessageSeverity::Log, "", false,
               std::vector<Callback>{
                   []() { throw std::runtime_error("boom"); },
                   []() { throw 42; },
                   [&]() { ++later; },
               }).init_delay = 0.0f;
    engine.add(11, fps_below(30.0f), MessageSeverity::Log, "", false, [&]() { ++other; })
        .init_delay = 0.0f;

    REQUIRE_NOTHROW(engine.update(DT));
    CHECK(later == 1);
    CHECK(other == 1);
    CHECK(x.count(MessageSeverity::Error, "callback 0 threw: boom") == 1);
    CHECK(x.count(MessageSeverity::Error, "callback 1 threw: unknown exception") == 1);
    CHECK(engine.size() == 0);
}

TEST_CASE("DebugEngine — empty callbacks are skipped", "[engine][actions]") {
    FakeMetrics       m;
    RecordingExecutor x;
    DebugEngine       engine(m, x);
    m.fps = 10.0f;

    int fired = 0;
    engine.add(12, fps_below(30.0f), MessageSeverity::Log, "", false,
               std::vector<Callback>{Callback{}, [&]() { ++fired; }, Callback{}})
        .init_delay = 0.0f;
    engine.update(DT);

    CHECK(fired == 1);
    CHECK(x.count(MessageSeverity::Error) == 0);
}

// Executors whose services fail, for the containment paths.
struct ThrowingClockExecutor : RecordingExecutor {
    std::string timestamp() const override { throw std::runtime_error("clock down"); }
};

struct ThrowingLogExecutor : RecordingExecutor {
    int attempts = 0;
    void log(watch::MessageSeverity, const std::string&) override {
        ++attempts;
        throw std::runtime_error("log down");
    }
};

TEST_CASE("DebugEngine — throwing event hook is contained", "[engine][actions]") {
    FakeMetrics       m;
    RecordingExecutor x;
    DebugEngine       engine(m, x);
    m.fps = 10.0f;

    int later_hook = 0, callback = 0;
    WatchPacket& p = engine.add(14, fps_below(30.0f), MessageSeverity::Log, "", false,
                                [&]() { ++callback; });
    p.init_delay = 0.0f;
    p.actions.event_hooks.push_back([](const WatchPacket&) { throw std::runtime_error("hook boom"); });
    p.actions.event_hooks.push_back([&](const WatchPacket&) { ++later_hook; });

    REQUIRE_NOTHROW(engine.update(DT));
    CHECK(later_hook == 1);
    CHECK(callback == 1);
    CHECK(x.count(MessageSeverity::Error, "event hook 0 threw: hook boom") == 1);
    CHECK(engine.size() == 0);
}

TEST_CASE("DebugEngine — failing timestamp falls back to unknown time", "[engine][actions]") {
    FakeMetrics           m;
    ThrowingClockExecutor x;
    DebugEngine           engine(m, x);
    m.fps = 10.0f;

    WatchPacket& p = engine.add(15, fps_below(30.0f), MessageSeverity::Warning, "Low fps", false,
                                Callback{});
    p.init_delay                 = 0.0f;
    p.actions.capture_screenshot = true;
    engine.update(DT);

    CHECK(x.count(MessageSeverity::Warning, "timestamp unavailable: clock down") == 1);
    CHECK(x.count(MessageSeverity::Warning, "[FrameWatch] (unknown time): Low fps") == 1);
    REQUIRE(x.screenshots.size() == 1);
    CHECK(x.screenshots[0] == "FrameWatch_Screenshot_unknown_time.png");
}

TEST_CASE("DebugEngine — failing log channel does not stop the sweep", "[engine][actions]") {
    FakeMetrics         m;
    ThrowingLogExecutor x;
    DebugEngine         engine(m, x);
    m.fps = 10.0f;

    int first = 0, second = 0;
    engine.add(16, fps_below(30.0f), MessageSeverity::Error, "one", false, [&]() { ++first; })
        .init_delay = 0.0f;
    engine.add(17, fps_below(30.0f), MessageSeverity::Error, "two", false, [&]() { ++second; })
        .init_delay = 0.0f;

    REQUIRE_NOTHROW(engine.update(DT));
    CHECK(first == 1);
    CHECK(second == 1);
    CHECK(x.attempts >= 2);
    CHECK(engine.size() == 0);
}

TEST_CASE("ScopedFlag — cleared when the scope unwinds", "[engine]") {
    bool flag = false;
    try {
        ScopedFlag guard(flag);
        CHECK(flag);
        throw std::runtime_error("unwind");
    } catch (const std::runtime_error&) {
    }
    CHECK_FALSE(flag);
}

// Rejects every write, so a stream using it goes bad on the first output.
struct RejectingBuf : std::streambuf {
    int overflow(int) override { return traits_type::eof(); }
};

TEST_CASE("DebugEngine — sweep escaping by exception does not block later sweeps",
          "[engine][actions]") {
    FakeMetrics         m;
    ThrowingLogExecutor x;
    DebugEngine         engine(m, x);
    m.fps = 10.0f;

    engine.add(18, fps_below(30.0f), MessageSeverity::Log, "msg", false, Callback{})
        .init_delay = 0.0f;

    // With the log channel and its stderr fallback both failing, the failure
    // report itself throws out of update().
    RejectingBuf    rejecting;
    std::streambuf* saved      = std::cerr.rdbuf(&rejecting);
    const auto      saved_mask = std::cerr.exceptions();
    std::cerr.exceptions(std::ios::badbit);
    CHECK_THROWS(engine.update(DT));
    std::cerr.exceptions(saved_mask);
    std::cerr.rdbuf(saved);
    std::cerr.clear();

    int fired = 0;
    engine.add(19, fps_below(30.0f), MessageSeverity::Log, "", false, [&]() { ++fired; })
        .init_delay = 0.0f;
    engine.update(DT);
    CHECK(fired == 1);
}

// ---------------------------------------------------------------------------
// DebugEngine — management API
// ---------------------------------------------------------------------------

TEST_CASE("DebugEngine — convenience add fills the packet", "[engine][api]") {
    FakeMetrics       m;
    RecordingExecutor x;
    DebugEngine       engine(m, x);

    WatchPacket& p = engine.add(13, fps_below(30.0f), MessageSeverity::Error, "msg", true,
                                []() {});
    CHECK(p.id == 13);
    REQUIRE(p.conditions.size() == 1);
    CHECK(p.conditions[0].comparator == Comparator::LessThan);
    CHECK(p.conditions[0].threshold == 30.0f);
    CHECK(p.actions.severity == MessageSeverity::Error);
    CHECK(p.actions.message == "msg");
    CHECK(p.actions.break_execution);
    CHECK(p.actions.callbacks.size() == 1);
    CHECK(p.execute_once);
}

TEST_CASE("DebugEngine — remove all packets sharing an id", "[engine][api]") {
    FakeMetrics       m;
    RecordingExecutor x;
    DebugEngine       engine(m, x);

    engine.add(7, fps_below(30.0f), MessageSeverity::Log, "a", false, Callback{});
    engine.add(8, fps_below(30.0f), MessageSeverity::Log, "b", false, Callback{});
    engine.add(7, fps_below(30.0f), MessageSeverity::Log, "c", false, Callback{});
    CHECK(engine.all_with_id(7).size() == 2);

    CHECK(engine.remove_all_with_id(7) == 2);
    CHECK(engine.first_with_id(7) == nullptr);
    CHECK(engine.all_with_id(7).empty());
    CHECK(engine.size() == 1);
    REQUIRE(engine.first_with_id(8) != nullptr);

    // Lookup misses are not errors.
    CHECK(engine.remove_all_with_id(7) == 0);
    CHECK_FALSE(engine.remove_first_with_id(7));
}

TEST_CASE("DebugEngine — removal preserves order of the rest", "[engine][api]") {
    FakeMetrics       m;
    RecordingExecutor x;
    DebugEngine       engine(m, x);

    for (int id : {1, 2, 1, 3, 1})
        engine.add(id, fps_below(30.0f), MessageSeverity::Log, "", false, Callback{});

    CHECK(engine.remove_first_with_id(1));
    std::vector<int> ids;
    engine.each([&](const WatchPacket& p) { ids.push_back(p.id); });
    CHECK(ids == std::vector<int>{2, 1, 3, 1});

    engine.remove_all_with_id(1);
    ids.clear();
    engine.each([&](const WatchPacket& p) { ids.push_back(p.id); });
    CHECK(ids == std::vector<int>{2, 3});
}

TEST_CASE("DebugEngine — attach callbacks by id", "[engine][api]") {
    FakeMetrics       m;
    RecordingExecutor x;
    DebugEngine       engine(m, x);
    m.fps = 10.0f;

    engine.add(20, fps_below(30.0f), MessageSeverity::Log, "", false, Callback{}).init_delay = 0.0f;
    engine.add(20, fps_below(30.0f), MessageSeverity::Log, "", false, Callback{}).init_delay = 0.0f;

    int first = 0, all = 0;
    CHECK(engine.add_callback_to_first(20, [&]() { ++first; }));
    CHECK(engine.add_callback_to_all(20, [&]() { ++all; }) == 2);
    CHECK_FALSE(engine.add_callback_to_first(99, []() {}));
    CHECK(engine.add_callback_to_all(99, []() {}) == 0);

    engine.update(DT);
    CHECK(first == 1);
    CHECK(all == 2);
}

// ---------------------------------------------------------------------------
// DebugEngine — callbacks re-entering the engine
// ---------------------------------------------------------------------------

TEST_CASE("DebugEngine — callback removes its own packet mid-sweep", "[engine][reentrancy]") {
    FakeMetrics       m;
    RecordingExecutor x;
    DebugEngine       engine(m, x);
    m.fps = 10.0f;

    int after = 0, neighbour = 0;
    WatchPacket& p = engine.add(30, fps_below(30.0f), MessageSeverity::Log, "", false,
        std::vector<Callback>{
            [&]() { CHECK(engine.remove_first_with_id(30)); },
            [&]() { ++after; },
        });
    p.execute_once = false;
    p.init_delay   = 0.0f;
    engine.add(31, fps_below(30.0f), MessageSeverity::Log, "", false, [&]() { ++neighbour; })
        .init_delay = 0.0f;

    engine.update(DT);
    CHECK(after == 1);
    CHECK(neighbour == 1);
    CHECK(engine.first_with_id(30) == nullptr);
    CHECK(engine.size() == 0);
}

TEST_CASE("DebugEngine — callback removes a later packet before it is checked",
          "[engine][reentrancy]") {
    FakeMetrics       m;
    RecordingExecutor x;
    DebugEngine       engine(m, x);
    m.fps = 10.0f;

    int victim = 0;
    engine.add(40, fps_below(30.0f), MessageSeverity::Log, "", false,
               [&]() { engine.remove_all_with_id(41); }).init_delay = 0.0f;
    engine.add(41, fps_below(30.0f), MessageSeverity::Log, "", false, [&]() { ++victim; })
        .init_delay = 0.0f;

    engine.update(DT);
    CHECK(victim == 0);
    CHECK(engine.size() == 0);
}

TEST_CASE("DebugEngine — packet added mid-sweep waits for the next frame",
          "[engine][reentrancy]") {
    FakeMetrics       m;
    RecordingExecutor x;
    DebugEngine       engine(m, x);
    m.fps = 10.0f;

    int added_fired = 0;
    WatchPacket& parent = engine.add(50, fps_below(30.0f), MessageSeverity::Log, "", false, [&]() {
        WatchPacket child;
        child.id         = 51;
        child.init_delay = 0.0f;
        child.conditions.push_back(fps_below(30.0f));
        child.actions.callbacks.push_back([&]() { ++added_fired; });
        engine.add(std::move(child));
    });
    parent.init_delay = 0.0f;

    engine.update(DT);
    CHECK(added_fired == 0);
    CHECK(engine.size() == 1);
    REQUIRE(engine.first_with_id(51) != nullptr);

    engine.update(DT);
    CHECK(added_fired == 1);
    CHECK(engine.size() == 0);
}

TEST_CASE("DebugEngine — callback attaching to its own packet runs next firing",
          "[engine][reentrancy]") {
    FakeMetrics       m;
    RecordingExecutor x;
    DebugEngine       engine(m, x);
    m.fps = 10.0f;

    int extra = 0;
    WatchPacket& p = engine.add(60, fps_below(30.0f), MessageSeverity::Log, "", false, [&]() {
        engine.add_callback_to_first(60, [&]() { ++extra; });
    });
    p.execute_once  = false;
    p.init_delay    = 0.0f;
    p.recheck_delay = 0.0f;

    engine.update(DT);
    CHECK(extra == 0);
    engine.update(DT);
    CHECK(extra == 1);
}

TEST_CASE("DebugEngine — nested update is refused with a warning", "[engine][reentrancy]") {
    FakeMetrics       m;
    RecordingExecutor x;
    DebugEngine       engine(m, x);
    m.fps = 10.0f;

    int fired = 0;
    engine.add(70, fps_below(30.0f), MessageSeverity::Log, "", false, [&]() {
        ++fired;
        engine.update(DT);
    }).init_delay = 0.0f;

    engine.update(DT);
    CHECK(fired == 1);
    CHECK(x.count(MessageSeverity::Warning, "re-entered") == 1);
    CHECK(engine.size() == 0);
}
