#include "../TermSpaceTestWidgets.hpp"

#include <termspace/automation/Operation.hpp>
#include <termspace/platform/HeadlessPlatform.hpp>
#include <termspace/runtime/Runtime.hpp>

#include <doctest/doctest.h>

#include <chrono>

using namespace TS;
using namespace TS::Testing;
using namespace std::chrono_literals;

namespace {

// Fails until it has been run `failures` times.
class FlakyOperation final : public Operation {
public:
    explicit FlakyOperation(int failures) : failures(failures) {}

    auto execute(Controller&) -> Expected<void> override {
        ++this->runs;
        if (this->runs <= this->failures)
            return std::unexpected(Error{Error::Code::Timeout, "not yet"});
        return {};
    }

    int runs = 0;

private:
    int failures;
};

struct Harness {
    HeadlessPlatform           platform;
    Runtime                    runtime{platform, options()};
    Controller                 controller{runtime};
    std::shared_ptr<TestField> a = std::make_shared<TestField>("a");
    std::shared_ptr<TestField> b = std::make_shared<TestField>("b");

    Harness() {
        REQUIRE(this->runtime.start(columnOf({this->a, this->b})).has_value());
    }

    static auto options() -> RuntimeOptions {
        RuntimeOptions opts;
        opts.inputPollTimeout = 10ms;
        opts.workerCount      = 0;
        return opts;
    }
};

} // namespace

TEST_SUITE("automation.operation") {
TEST_CASE("a sequence runs every step in order") {
    Harness h;
    auto    done = h.controller.execute({Ops::input("a", "ab"),
                                         Ops::click("a"),
                                         Ops::navigate(NavigateTo::Next),
                                         Ops::dispatch([] { return Action{ActionType::InputChar}.withTarget("b").withPayload(char32_t{U'z'}); }),
                                         Ops::waitValue("b", "value", "z", 100ms)});
    REQUIRE(done.has_value());
    CHECK(h.a->text() == "ab");
    CHECK(h.a->inspectState()["submits"] == 1);
    CHECK(h.b->text() == "z");
    CHECK(h.runtime.focused() == std::optional<std::string>{"b"});
}

TEST_CASE("a sequence stops at the first failure") {
    Harness h;
    auto    done = h.controller.execute({Ops::input("a", "1"), Ops::click("missing"), Ops::input("a", "2")});
    REQUIRE_FALSE(done.has_value());
    CHECK(done.error().code == Error::Code::NotFound);
    CHECK(h.a->text() == "1");
}

TEST_CASE("a plain batch keeps the work done before a failure") {
    Harness h;
    auto    done = Ops::batch({Ops::input("a", "kept"), Ops::click("missing")})->execute(h.controller);
    REQUIRE_FALSE(done.has_value());
    CHECK(done.error().code == Error::Code::NotFound);
    CHECK(h.a->text() == "kept");
}

TEST_CASE("an atomic batch rolls back on failure") {
    Harness h;
    REQUIRE(h.controller.input("b", "before").has_value());

    auto done = Ops::atomicBatch({Ops::input("a", "lost"), Ops::input("b", "-also"), Ops::click("missing")})->execute(h.controller);
    REQUIRE_FALSE(done.has_value());
    CHECK(done.error().code == Error::Code::ActionFailed);
    CHECK(done.error().message == std::optional<std::string>{"batch operation failed"});
    REQUIRE(done.error().causes.size() == 1);
    CHECK(done.error().causes.front().code == Error::Code::NotFound);

    CHECK(h.a->text().empty());
    CHECK(h.b->text() == "before");
    CHECK(h.controller.state("b", "value").value() == Json("before"));
}

TEST_CASE("an atomic batch that succeeds keeps everything") {
    Harness h;
    REQUIRE(Ops::atomicBatch({Ops::input("a", "x"), Ops::input("b", "y")})->execute(h.controller).has_value());
    CHECK(h.a->text() == "x");
    CHECK(h.b->text() == "y");
}

TEST_CASE("repeat runs its operation count times") {
    Harness         h;
    RepeatOperation repeat(Ops::input("a", "x"), 3, 1ms);
    REQUIRE(repeat.execute(h.controller).has_value());
    CHECK(h.a->text() == "xxx");

    RepeatOperation failing(Ops::click("missing"), 2);
    auto            done = failing.execute(h.controller);
    REQUIRE_FALSE(done.has_value());
    CHECK(done.error().code == Error::Code::ActionFailed);
    CHECK(done.error().message == std::optional<std::string>{"repeat failed at iteration 0"});
}

TEST_CASE("retry succeeds once the operation recovers") {
    Harness        h;
    auto           flaky = std::make_shared<FlakyOperation>(2);
    RetryOperation retry(flaky, 3, 1ms);
    CHECK(retry.execute(h.controller).has_value());
    CHECK(flaky->runs == 3);
}

TEST_CASE("retry gives up after its attempts") {
    Harness        h;
    auto           flaky = std::make_shared<FlakyOperation>(5);
    RetryOperation retry(flaky, 2, 1ms);
    auto           done = retry.execute(h.controller);
    REQUIRE_FALSE(done.has_value());
    CHECK(done.error().code == Error::Code::ActionFailed);
    REQUIRE(done.error().causes.size() == 1);
    CHECK(done.error().causes.front().code == Error::Code::Timeout);
    CHECK(flaky->runs == 2);
}

TEST_CASE("retry stops early when the error is not retryable") {
    Harness        h;
    auto           flaky = std::make_shared<FlakyOperation>(5);
    RetryOperation retry(flaky, 4, 1ms, [](Error const& error) { return error.code != Error::Code::Timeout; });
    CHECK_FALSE(retry.execute(h.controller).has_value());
    CHECK(flaky->runs == 1);
}

TEST_CASE("dispatch without a factory is invalid") {
    Harness h;
    auto    done = Ops::dispatch({})->execute(h.controller);
    REQUIRE_FALSE(done.has_value());
    CHECK(done.error().code == Error::Code::InvalidPayload);
}

TEST_CASE("wait operations time out") {
    Harness h;
    auto    done = Ops::wait([](Snapshot const&) { return false; }, 10ms)->execute(h.controller);
    REQUIRE_FALSE(done.has_value());
    CHECK(done.error().code == Error::Code::Timeout);
}
} // TEST_SUITE
