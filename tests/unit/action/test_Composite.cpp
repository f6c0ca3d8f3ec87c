#include <doctest/doctest.h>

#include <termspace/action/Composite.hpp>
#include <termspace/action/Dispatcher.hpp>

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace TS;
using namespace std::chrono_literals;

namespace {

auto succeeding(std::atomic<int>& counter) -> ActionHandlerPtr {
    return makeHandler([&counter](CancellationContext const&) {
        ++counter;
        return ActionResult::success();
    });
}

auto failing(Error::Code code, std::string message) -> ActionHandlerPtr {
    return makeHandler([code, message](CancellationContext const&) { return ActionResult::failure(Error{code, message}); });
}

} // namespace

TEST_SUITE("action.composite") {

TEST_CASE("sequence stops at the first hard failure") {
    std::atomic<int> ran{0};
    auto             composite = sequence({succeeding(ran), failing(Error::Code::ActionFailed, "boom"), succeeding(ran)});
    auto             result    = composite->execute(CancellationContext{});
    CHECK_FALSE(result.ok);
    CHECK(ran == 1);
    REQUIRE(result.error.has_value());
    CHECK(result.error->code == Error::Code::ActionFailed);
}

TEST_CASE("sequence keeps going after a timeout") {
    std::atomic<int> ran{0};
    auto             composite = sequence({failing(Error::Code::Timeout, "slow"), succeeding(ran)});
    auto             result    = composite->execute(CancellationContext{});
    CHECK_FALSE(result.ok);
    CHECK(ran == 1);
}

TEST_CASE("batch aggregates every failure into a Composite error") {
    std::atomic<int>          ran{0};
    std::vector<ActionResult> seen;
    auto composite = batchWithCallback({failing(Error::Code::NotFound, "first"), succeeding(ran), failing(Error::Code::Timeout, "third")},
                                       [&seen](std::vector<ActionResult> const& results) { seen = results; });
    auto result = composite->execute(CancellationContext{});

    CHECK(ran == 1);
    CHECK(seen.size() == 3);
    REQUIRE(result.error.has_value());
    CHECK(result.error->code == Error::Code::Composite);
    REQUIRE(result.error->causes.size() == 2);
    CHECK(result.error->causes[0].code == Error::Code::NotFound);
    CHECK(primaryCause(*result.error).message == "first");
}

TEST_CASE("canceled composites do not run their units") {
    std::atomic<int> ran{0};
    auto             composite = sequence({succeeding(ran)});
    composite->cancel();
    auto result = composite->execute(CancellationContext{});
    CHECK_FALSE(result.ok);
    CHECK(result.error->code == Error::Code::Canceled);
    CHECK(ran == 0);
}

TEST_CASE("exceptions become failed results") {
    auto thrower = makeHandler([](CancellationContext const&) -> ActionResult { throw std::runtime_error("kaput"); });
    auto result  = sequence({thrower})->execute(CancellationContext{});
    CHECK_FALSE(result.ok);
    CHECK(result.error->code == Error::Code::ActionFailed);
}

TEST_CASE("parallelWithLimit never exceeds the limit") {
    std::atomic<int> inFlight{0};
    std::atomic<int> peak{0};
    std::vector<ActionHandlerPtr> handlers;
    for (int i = 0; i < 6; ++i) {
        handlers.push_back(makeHandler([&](CancellationContext const&) {
            int now = ++inFlight;
            int old = peak.load();
            while (now > old && !peak.compare_exchange_weak(old, now)) {}
            std::this_thread::sleep_for(10ms);
            --inFlight;
            return ActionResult::success();
        }));
    }
    auto result = parallelWithLimit(CancellationContext{}, 2, handlers);
    CHECK(result.ok);
    CHECK(peak <= 2);
}

TEST_CASE("retry succeeds once the handler recovers") {
    std::atomic<int> calls{0};
    auto flaky = makeHandler([&calls](CancellationContext const&) {
        if (++calls < 3)
            return ActionResult::failure(Error{Error::Code::ActionFailed, "not yet"});
        return ActionResult::success();
    });
    RetryAction retry(flaky, 5, 1ms);
    CHECK(retry.execute(CancellationContext{}).ok);
    CHECK(retry.attempts() == 3);
}

TEST_CASE("retry gives up after the configured retries") {
    RetryAction retry(failing(Error::Code::ActionFailed, "never"), 2, 1ms);
    auto        result = retry.execute(CancellationContext{});
    CHECK_FALSE(result.ok);
    CHECK(retry.attempts() == 3);
}

TEST_CASE("timeout abandons slow handlers") {
    auto slow = makeHandler([](CancellationContext const&) {
        std::this_thread::sleep_for(200ms);
        return ActionResult::success();
    });
    TimeoutAction timeout(slow, 20ms);
    auto          result = timeout.execute(CancellationContext{});
    CHECK_FALSE(result.ok);
    CHECK(result.error->code == Error::Code::Timeout);
}

TEST_CASE("fallback runs the secondary only on failure") {
    std::atomic<int> ran{0};
    FallbackAction   fallback(failing(Error::Code::ActionFailed, "primary"), succeeding(ran));
    CHECK(fallback.execute(CancellationContext{}).ok);
    CHECK(ran == 1);
}

TEST_CASE("lazy actions build their handler on first use") {
    std::atomic<int> ran{0};
    bool             built = false;
    LazyAction       lazy([&] {
        built = true;
        return succeeding(ran);
    });
    CHECK_FALSE(built);
    CHECK(lazy.execute(CancellationContext{}).ok);
    CHECK(built);
}

TEST_CASE("dispatch handlers report unhandled actions") {
    Dispatcher dispatcher;
    auto       result = makeDispatchHandler(dispatcher, Action{ActionType::Help})->execute(CancellationContext{});
    CHECK_FALSE(result.ok);
    CHECK(result.error->code == Error::Code::NotSupported);
}

} // TEST_SUITE

TEST_SUITE("action.worker_pool") {

TEST_CASE("submitted jobs complete on the workers") {
    WorkerPool                pool(2, 8);
    std::atomic<int>          ran{0};
    std::promise<void>        allDone;
    std::atomic<int>          completed{0};
    for (int i = 0; i < 4; ++i) {
        auto rejected = pool.submit(succeeding(ran), [&](ActionResult const&) {
            if (++completed == 4)
                allDone.set_value();
        });
        CHECK_FALSE(rejected.has_value());
    }
    CHECK(allDone.get_future().wait_for(2s) == std::future_status::ready);
    CHECK(ran == 4);
}

TEST_CASE("a full queue rejects with CapacityExceeded") {
    WorkerPool         pool(1, 1);
    std::promise<void> release;
    auto               gate = release.get_future().share();
    std::promise<void> started;

    auto blocker = makeHandler([gate, &started](CancellationContext const&) {
        started.set_value();
        gate.wait();
        return ActionResult::success();
    });
    REQUIRE_FALSE(pool.submit(blocker).has_value());
    started.get_future().wait();

    std::atomic<int> ran{0};
    REQUIRE_FALSE(pool.submit(succeeding(ran)).has_value());
    auto rejected = pool.submit(succeeding(ran));
    REQUIRE(rejected.has_value());
    CHECK(rejected->code == Error::Code::CapacityExceeded);

    release.set_value();
    pool.stop();
    CHECK(ran == 1);
    auto afterStop = pool.submit(succeeding(ran));
    REQUIRE(afterStop.has_value());
    CHECK(afterStop->code == Error::Code::NotAllowed);
}

} // TEST_SUITE
