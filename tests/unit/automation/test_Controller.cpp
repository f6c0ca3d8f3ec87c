#include "../TermSpaceTestWidgets.hpp"

#include <termspace/automation/Controller.hpp>
#include <termspace/platform/HeadlessPlatform.hpp>
#include <termspace/runtime/Runtime.hpp>

#include <doctest/doctest.h>

#include <algorithm>
#include <chrono>
#include <thread>

using namespace TS;
using namespace TS::Testing;
using namespace std::chrono_literals;

namespace {

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

auto ids(std::vector<ComponentInfo> const& found) -> std::vector<std::string> {
    std::vector<std::string> out;
    for (auto const& info : found)
        out.push_back(info.id);
    std::sort(out.begin(), out.end());
    return out;
}

} // namespace

TEST_SUITE("automation.selectors") {
TEST_CASE("wildcard, id and type selectors") {
    Harness h;
    auto    all = h.controller.find("*");
    REQUIRE(all.has_value());
    CHECK(ids(*all) == std::vector<std::string>{"a", "b"});

    auto byId = h.controller.find("#b");
    REQUIRE(byId.has_value());
    REQUIRE(byId->size() == 1);
    CHECK(byId->front().type == "TestField");
    CHECK(byId->front().props["role"] == "field");
    CHECK(byId->front().rect == Rect{0, 1, 10, 1});

    auto byType = h.controller.find(".TestField");
    REQUIRE(byType.has_value());
    CHECK(byType->size() == 2);

    auto noneOfType = h.controller.find(".Button");
    REQUIRE(noneOfType.has_value());
    CHECK(noneOfType->empty());

    auto missing = h.controller.find("#zzz");
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().code == Error::Code::NotFound);
    CHECK(missing.error().message == std::optional<std::string>{"component not found: zzz"});
}

TEST_CASE("attribute selectors match props and state") {
    Harness h;
    REQUIRE(h.controller.input("a", "typed").has_value());

    auto roles = h.controller.find("[role=field]");
    REQUIRE(roles.has_value());
    CHECK(roles->size() == 2);

    auto quoted = h.controller.find("[value=\"typed\"]");
    REQUIRE(quoted.has_value());
    CHECK(ids(*quoted) == std::vector<std::string>{"a"});

    auto numeric = h.controller.find("[ submits = 0 ]");
    REQUIRE(numeric.has_value());
    CHECK(numeric->size() == 2);
}

TEST_CASE("malformed selectors are rejected") {
    Harness h;
    for (auto const* selector : {"a", "#", ".", "[novalue]", "[=x]", "[]"}) {
        CAPTURE(selector);
        auto result = h.controller.find(selector);
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code == Error::Code::MalformedInput);
    }
}
} // TEST_SUITE

TEST_SUITE("automation.controller") {
TEST_CASE("input and click drive real actions") {
    Harness h;
    REQUIRE(h.controller.input("a", "hello").has_value());
    REQUIRE(h.controller.click("a").has_value());

    CHECK(h.a->text() == "hello");
    CHECK(h.controller.state("a", "value").value() == Json("hello"));
    CHECK(h.controller.state("a", "submits").value() == Json(1));
    CHECK(h.runtime.stateTracker().historySize() == 2);

    auto unknown = h.controller.click("ghost");
    REQUIRE_FALSE(unknown.has_value());
    CHECK(unknown.error().code == Error::Code::NotFound);
}

TEST_CASE("disabled components refuse clicks") {
    Harness h;
    h.runtime.transact([&] { h.b->disabled = true; });
    CHECK(h.controller.isDisabled("b").value() == true);
    CHECK(h.controller.isVisible("b").value() == true);

    auto clicked = h.controller.click("b");
    REQUIRE_FALSE(clicked.has_value());
    CHECK(clicked.error().code == Error::Code::NotAllowed);
    CHECK(h.b->actions().empty());
}

TEST_CASE("query filters by id, key and type") {
    Harness h;
    REQUIRE(h.controller.input("b", "x").has_value());

    auto byType = h.controller.query(StateQuery{.componentType = "TestField"});
    REQUIRE(byType.has_value());
    CHECK(byType->size() == 2);
    CHECK((*byType)["b"]["value"] == "x");

    auto byKey = h.controller.query(StateQuery{.componentId = "b", .stateKey = "missing"});
    REQUIRE(byKey.has_value());
    CHECK((*byKey)["missing"].is_null());

    auto unknown = h.controller.query(StateQuery{.componentId = "nobody"});
    REQUIRE_FALSE(unknown.has_value());
    CHECK(unknown.error().code == Error::Code::NotFound);
}

TEST_CASE("setValue writes through a recorded transaction") {
    Harness h;
    REQUIRE(h.controller.setValue("a", "value", "direct").has_value());
    CHECK(h.a->text() == "direct");
    CHECK(h.runtime.stateTracker().historySize() == 1);

    auto readOnly = h.controller.setValue("a", "submits", 5);
    REQUIRE_FALSE(readOnly.has_value());
    CHECK(readOnly.error().code == Error::Code::NotAllowed);

    auto missing = h.controller.setValue("none", "value", "x");
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().code == Error::Code::NotFound);
}

TEST_CASE("navigate moves focus or reports the dead end") {
    Harness h;
    CHECK(h.controller.focused().value() == "a");
    REQUIRE(h.controller.navigate(NavigateTo::Next).has_value());
    CHECK(h.controller.focused().value() == "b");

    auto blocked = h.controller.navigate(NavigateTo::Down);
    REQUIRE_FALSE(blocked.has_value());
    CHECK(blocked.error().code == Error::Code::NotFound);
    CHECK(toString(NavigateTo::Down) == "down");
}

TEST_CASE("waitUntil times out on a condition that never holds") {
    Harness    h;
    auto const start  = std::chrono::steady_clock::now();
    auto       result = h.controller.waitUntil([](Snapshot const&) { return false; }, 30ms);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == Error::Code::Timeout);
    CHECK(std::chrono::steady_clock::now() - start >= 30ms);
}

TEST_CASE("waitUntil stops when the runtime shuts down") {
    Harness h;
    REQUIRE(h.runtime.shutdown(500ms).has_value());
    auto result = h.controller.waitUntil([](Snapshot const&) { return false; }, 2s);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == Error::Code::Canceled);
}

TEST_CASE("waitForValue sees a change made from another thread") {
    Harness     h;
    std::thread writer([&] {
        std::this_thread::sleep_for(20ms);
        Action action{ActionType::InputText};
        action.withTarget("b").withPayload(std::string("late"));
        h.runtime.dispatch(action);
    });
    auto result = h.controller.waitForValue("b", "value", "late", 2s);
    writer.join();
    CHECK(result.has_value());
    CHECK(h.controller.waitForVisible("b", 10ms).has_value());
}

TEST_CASE("watchers follow commits until canceled") {
    Harness                  h;
    std::vector<std::string> values;
    auto                     cancel = h.controller.watch([&](Snapshot const& snapshot) {
        if (auto const* component = snapshot.component("a"))
            values.push_back(component->state.value("value", std::string{}));
    });

    REQUIRE(h.controller.input("a", "1").has_value());
    REQUIRE(h.controller.input("a", "2").has_value());
    cancel();
    REQUIRE(h.controller.input("a", "3").has_value());

    CHECK(values == std::vector<std::string>{"1", "12"});
}
} // TEST_SUITE
