#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "HostLoop.hpp"
#include "SandstepError.hpp"
#include "conversions.hpp"
#include "evaluator.hpp"

using Lines = std::vector<std::string>;

class HostLoopTest : public ::testing::Test {
   protected:
    void load(const std::string& source) {
        engine.reset(new Evaluator(source, [this](Evaluator& e, const ObjectPtr& global) {
            e.register_native(global, "alert", [this](NativeCall& call) -> Value {
                output.push_back(to_display_string(call.arg(0)));
                return Value{};
            }, 1);
            loop.install_timer_natives(e);
        }));
    }

    // declared before the engine so it outlives the timer natives
    HostLoop loop{16};
    std::unique_ptr<Evaluator> engine;
    Lines output;
};

TEST_F(HostLoopTest, RunsPlainProgramToCompletion) {
    load("var s = 0;\nfor (var i = 0; i < 100; i++) s += i;\nalert(s);");
    loop.drive(*engine);
    EXPECT_EQ(output, Lines({"4950"}));
    EXPECT_EQ(engine->status(), EngineStatus::Completed);
    // 16 steps per tick means the work was spread over many ticks
    EXPECT_GT(loop.ticks(), 1u);
}

TEST_F(HostLoopTest, TimersFireInDelayOrder) {
    load(R"(
        setTimeout(function () { alert('slow'); }, 30);
        setTimeout(function () { alert('fast'); }, 1);
        setTimeout(function (a, b) { alert(a + b); }, 10, 'ar', 'gs');
        alert('sync');
    )");
    loop.drive(*engine);
    EXPECT_EQ(output, Lines({"sync", "fast", "args", "slow"}));
    EXPECT_EQ(loop.active_timers(), 0u);
}

TEST_F(HostLoopTest, RecursiveTimers) {
    load(R"(
        var count = 0;
        function increment() {
          count++;
          alert(count);
          if (count < 3) {
            setTimeout(increment, 1);
          }
        }
        increment();
    )");
    loop.drive(*engine);
    EXPECT_EQ(output, Lines({"1", "2", "3"}));
}

TEST_F(HostLoopTest, ClearTimeoutCancels) {
    load(R"(
        var id = setTimeout(function () { alert('cancelled'); }, 5);
        setTimeout(function () { alert('kept'); }, 10);
        alert(typeof id);
        clearTimeout(id);
        clearTimeout(12345);
    )");
    loop.drive(*engine);
    EXPECT_EQ(output, Lines({"number", "kept"}));
}

TEST_F(HostLoopTest, SleepSuspendsUntilTimerFires) {
    load(R"(
        alert('start');
        var r = sleep(5);
        alert('woke ' + r);
    )");
    loop.drive(*engine);
    EXPECT_EQ(output, Lines({"start", "woke undefined"}));
    EXPECT_EQ(engine->status(), EngineStatus::Completed);
}

TEST_F(HostLoopTest, SleepInsideFunctionsAndTimers) {
    load(R"(
        function pause(tag) { sleep(2); alert(tag); }
        setTimeout(function () { pause('timer'); }, 1);
        pause('main');
    )");
    loop.drive(*engine);
    EXPECT_EQ(output, Lines({"main", "timer"}));
}

TEST_F(HostLoopTest, SetTimeoutRequiresFunction) {
    load("try { setTimeout('code', 1); } catch (e) { alert(e.name); }");
    loop.drive(*engine);
    EXPECT_EQ(output, Lines({"TypeError"}));
}

TEST_F(HostLoopTest, UncaughtErrorInTimerIsRethrown) {
    load(R"(
        setTimeout(function () { throw new Error('late failure'); }, 1);
        setTimeout(function () { alert('never'); }, 50);
    )");
    try {
        loop.drive(*engine);
        FAIL() << "expected UncaughtGuestError";
    } catch (const UncaughtGuestError& e) {
        EXPECT_EQ(e.detail(), "Error: late failure");
    }
    EXPECT_EQ(engine->status(), EngineStatus::Failed);
    EXPECT_TRUE(output.empty());
    EXPECT_EQ(loop.active_timers(), 0u);
}
