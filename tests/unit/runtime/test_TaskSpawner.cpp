#include <termspace/runtime/Recovery.hpp>
#include <termspace/runtime/TaskSpawner.hpp>

#include <doctest/doctest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace TS;
using namespace std::chrono_literals;

TEST_SUITE("runtime.task_spawner") {
TEST_CASE("shutdown cancels and joins running tasks") {
    TaskSpawner       spawner;
    std::atomic<bool> started{false};
    std::atomic<bool> sawCancel{false};

    auto id = spawner.spawn("waiter", [&](CancellationContext const& ctx) {
        started = true;
        while (ctx.waitFor(5ms)) {
        }
        sawCancel = ctx.isCanceled();
    });
    REQUIRE(id.has_value());
    CHECK(*id == 1);

    auto const deadline = std::chrono::steady_clock::now() + 2s;
    while (!started && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(1ms);
    CHECK(spawner.running() == 1);

    CHECK(spawner.shutdown(1s).has_value());
    CHECK(sawCancel);
    CHECK(spawner.running() == 0);
    CHECK(spawner.spawned() == 1);
    CHECK(spawner.isCanceled());
}

TEST_CASE("spawning after shutdown is refused") {
    TaskSpawner spawner;
    REQUIRE(spawner.shutdown(100ms).has_value());
    auto id = spawner.spawn("late", [](CancellationContext const&) {});
    REQUIRE_FALSE(id.has_value());
    CHECK(id.error().code == Error::Code::NotAllowed);
}

TEST_CASE("a canceled parent refuses new tasks") {
    CancellationContext parent;
    TaskSpawner         spawner(parent);
    parent.cancel();
    auto id = spawner.spawn("orphan", [](CancellationContext const&) {});
    REQUIRE_FALSE(id.has_value());
    CHECK(id.error().code == Error::Code::Canceled);
}

TEST_CASE("task faults go to recovery") {
    Recovery::Options options;
    options.writeStderr = false;
    Recovery recovery(options);
    auto     metrics = std::make_shared<MetricsPanicHandler>();
    recovery.addHandler(metrics);

    TaskSpawner spawner(CancellationContext{}, &recovery);
    REQUIRE(spawner.spawn("boom", [](CancellationContext const&) { throw std::runtime_error("task failed"); }).has_value());
    REQUIRE(spawner.shutdown(1s).has_value());

    CHECK(metrics->panicCount() == 1);
    auto const records = metrics->records();
    REQUIRE(records.size() == 1);
    CHECK(records.front().where == "task boom");
    CHECK(records.front().value == "task failed");
}

TEST_CASE("tasks ignoring cancellation time out the shutdown") {
    TaskSpawner spawner;
    REQUIRE(spawner.spawn("stubborn", [](CancellationContext const&) { std::this_thread::sleep_for(200ms); }).has_value());
    auto result = spawner.shutdown(10ms);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == Error::Code::Timeout);
}
} // TEST_SUITE
