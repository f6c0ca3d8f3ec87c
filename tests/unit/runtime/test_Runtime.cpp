#include "../TermSpaceTestWidgets.hpp"

#include <termspace/platform/HeadlessPlatform.hpp>
#include <termspace/runtime/Runtime.hpp>

#include <doctest/doctest.h>

#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>

using namespace TS;
using namespace TS::Testing;

namespace {

auto quickOptions() -> RuntimeOptions {
    RuntimeOptions options;
    options.inputPollTimeout = std::chrono::milliseconds{10};
    options.inputPushTimeout = std::chrono::milliseconds{5};
    options.frameInterval    = std::chrono::milliseconds{1};
    options.workerCount      = 1;
    return options;
}

struct Fixture {
    HeadlessPlatform           platform{Size{40, 12}};
    Runtime                    runtime{platform, quickOptions()};
    std::shared_ptr<TestField> a = std::make_shared<TestField>("a");
    std::shared_ptr<TestField> b = std::make_shared<TestField>("b");

    Fixture() {
        auto started = this->runtime.start(columnOf({this->a, this->b}));
        REQUIRE(started.has_value());
    }
};

} // namespace

TEST_SUITE("runtime.lifecycle") {
TEST_CASE("start validates its preconditions") {
    HeadlessPlatform platform;
    Runtime          runtime(platform, quickOptions());

    auto early = runtime.update();
    REQUIRE_FALSE(early.has_value());
    CHECK(early.error().code == Error::Code::NotAllowed);

    auto empty = runtime.start(nullptr);
    REQUIRE_FALSE(empty.has_value());
    CHECK(empty.error().code == Error::Code::InvalidPayload);

    auto field = std::make_shared<TestField>("only");
    REQUIRE(runtime.start(columnOf({field})).has_value());
    CHECK(runtime.isStarted());
    CHECK(platform.initialized());

    auto again = runtime.start(columnOf({}));
    REQUIRE_FALSE(again.has_value());
    CHECK(again.error().code == Error::Code::NotAllowed);

    CHECK(runtime.shutdown(std::chrono::milliseconds{500}).has_value());
    CHECK_FALSE(runtime.isStarted());
    CHECK_FALSE(platform.initialized());
    CHECK(runtime.isCanceled());
}

TEST_CASE("start focuses the first focusable component") {
    Fixture f;
    CHECK(f.runtime.focused() == std::optional<std::string>{"a"});
    CHECK(f.a->focused);
    CHECK_FALSE(f.b->focused);
    CHECK(f.runtime.stateTracker().historySize() == 0);
}

TEST_CASE("quit key ends the frame loop") {
    Fixture f;
    REQUIRE(f.runtime.enqueueInput(RawInput::keyPress(U'c', KeyModifiers::Ctrl)));
    auto result = f.runtime.run();
    CHECK(result.has_value());
    CHECK_FALSE(f.runtime.isRunning());
    CHECK_FALSE(f.runtime.isStarted());
    CHECK_FALSE(f.platform.initialized());
}

TEST_CASE("run from another thread stops on request") {
    Fixture        f;
    Expected<void> result;
    std::thread    loop([&] { result = f.runtime.run(); });
    auto const     deadline = std::chrono::steady_clock::now() + std::chrono::seconds{2};
    while (!f.runtime.isRunning() && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(std::chrono::milliseconds{1});
    f.runtime.stop();
    loop.join();
    CHECK(result.has_value());
    CHECK(f.runtime.frames() >= 1);
}
} // TEST_SUITE

TEST_SUITE("runtime.dispatch") {
TEST_CASE("targeted input reaches the component and records one history entry") {
    Fixture f;
    Action  action{ActionType::InputChar};
    action.withTarget("a").withPayload(char32_t{U'x'});

    CHECK(f.runtime.dispatch(action));
    CHECK(f.a->text() == "x");
    CHECK(f.a->actions() == std::vector<ActionType>{ActionType::InputChar});
    CHECK(f.b->actions().empty());
    CHECK(f.runtime.stateTracker().historySize() == 1);

    auto const history = f.runtime.stateTracker().history();
    REQUIRE(history.size() == 1);
    REQUIRE(history.front().component("a") != nullptr);
    CHECK(history.front().component("a")->state["value"] == "");
    CHECK(f.runtime.stateTracker().current().component("a")->state["value"] == "x");
}

TEST_CASE("unhandled actions leave history alone") {
    Fixture f;
    CHECK_FALSE(f.runtime.dispatch(Action{ActionType::ScrollDown}));
    auto result = f.runtime.tryDispatch(Action{ActionType::ScrollDown});
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == Error::Code::NotSupported);
    CHECK(f.runtime.stateTracker().historySize() == 0);
}

TEST_CASE("user default handler runs before the builtins") {
    Fixture f;
    int     seen = 0;
    f.runtime.setDefaultHandler([&](Action const& action) {
        ++seen;
        return action.type == ActionType::NavigateNext;
    });
    CHECK(f.runtime.dispatch(Action{ActionType::NavigateNext}));
    CHECK(seen == 1);
    CHECK(f.runtime.focused() == std::optional<std::string>{"a"});

    CHECK(f.runtime.dispatch(Action{ActionType::NavigatePrev}));
    CHECK(seen == 2);
    CHECK(f.runtime.focused() == std::optional<std::string>{"b"});
}

TEST_CASE("a throwing handler is recovered") {
    Fixture f;
    f.runtime.subscribe(ActionType::Submit, [](Action const&) -> bool { throw std::runtime_error("boom"); });

    Action submit{ActionType::Submit};
    submit.withTarget("a");
    CHECK_FALSE(f.runtime.dispatch(submit));
    CHECK(f.runtime.recovery().panicCount() == 1);
    CHECK(f.platform.restoreCount() == 1);
    CHECK(f.runtime.isStarted());
}

TEST_CASE("transact records one entry for several changes") {
    Fixture f;
    f.runtime.transact([&] {
        f.a->setStateValue("value", "left");
        f.b->setStateValue("value", "right");
    });
    CHECK(f.runtime.stateTracker().historySize() == 1);
    f.runtime.transact([] {});
    CHECK(f.runtime.stateTracker().historySize() == 1);
}

TEST_CASE("submit runs handlers on the worker pool") {
    Fixture            f;
    std::promise<bool> done;
    auto               future = done.get_future();
    auto               failed = f.runtime.submit(makeHandler([](CancellationContext const&) { return ActionResult::success("done"); }),
                                                 [&](ActionResult result) { done.set_value(result.ok); });
    CHECK_FALSE(failed.has_value());
    REQUIRE(future.wait_for(std::chrono::seconds{2}) == std::future_status::ready);
    CHECK(future.get());
}

TEST_CASE("a handler can wait on a dispatch running on another thread") {
    Fixture f;
    f.runtime.subscribe(ActionType::Submit, [&](Action const&) {
        auto nested = batch({makeDispatchHandler(f.runtime.dispatcher(), Action{ActionType::NavigateNext})});
        return nested->execute(f.runtime.context()).ok;
    });

    auto done = std::async(std::launch::async, [&] { return f.runtime.dispatch(Action{ActionType::Submit}); });
    REQUIRE(done.wait_for(std::chrono::seconds{5}) == std::future_status::ready);
    CHECK(done.get());
    CHECK(f.runtime.focused() == std::optional<std::string>{"b"});
}

TEST_CASE("a handled action relayouts its target") {
    Fixture f;
    f.a->growsWithText = true;
    REQUIRE(f.runtime.update().has_value());
    REQUIRE(f.runtime.layoutResult().findBox("a") != nullptr);
    CHECK(f.runtime.layoutResult().findBox("a")->width == 10);

    for (char32_t ch : {U'x', U'y'}) {
        Action typed{ActionType::InputChar};
        typed.withTarget("a").withPayload(ch);
        REQUIRE(f.runtime.dispatch(typed));
    }
    REQUIRE(f.runtime.update().has_value());
    CHECK(f.runtime.layoutResult().findBox("a")->width == 2);
    CHECK(f.runtime.root()->find("a")->bounds().width == 2);
}

TEST_CASE("layout moves between actions are not recorded as undo steps") {
    HeadlessPlatform platform{Size{40, 12}};
    Runtime          runtime{platform, quickOptions()};
    auto             a    = std::make_shared<TestField>("a");
    auto             b    = std::make_shared<TestField>("b");
    auto             root = columnOf({a, b});
    Style            style = root->style();
    style.justify          = Justify::Center;
    root->setStyle(style);
    REQUIRE(runtime.start(std::move(root)).has_value());

    int const startY = runtime.layoutResult().findBox("a")->y;
    runtime.handleWindowSize(40, 30);
    CHECK(runtime.layoutResult().findBox("a")->y != startY);

    CHECK_FALSE(runtime.dispatch(Action{ActionType::ScrollDown}));
    CHECK(runtime.stateTracker().historySize() == 0);

    Action typed{ActionType::InputChar};
    typed.withTarget("a").withPayload(char32_t{U'x'});
    CHECK(runtime.dispatch(typed));
    auto const history = runtime.stateTracker().history();
    REQUIRE(history.size() == 1);
    CHECK(history.front().component("a")->rect == runtime.stateTracker().current().component("a")->rect);
}
} // TEST_SUITE

TEST_SUITE("runtime.input") {
TEST_CASE("typed keys go to the focused component") {
    Fixture f;
    REQUIRE(f.runtime.enqueueInput(RawInput::keyPress(U'h')));
    REQUIRE(f.runtime.enqueueInput(RawInput::keyPress(U'i')));
    REQUIRE(f.runtime.update().has_value());

    CHECK(f.a->text() == "hi");
    CHECK(f.b->text().empty());
    CHECK(f.runtime.stateTracker().historySize() == 2);
}

TEST_CASE("paste arrives as one text action") {
    Fixture f;
    REQUIRE(f.runtime.enqueueInput(RawInput::paste("pasted")));
    REQUIRE(f.runtime.update().has_value());
    CHECK(f.a->text() == "pasted");
    CHECK(f.a->actions() == std::vector<ActionType>{ActionType::InputText});
}

TEST_CASE("tab moves focus and typing follows it") {
    Fixture f;
    REQUIRE(f.runtime.enqueueInput(RawInput::specialKey(SpecialKey::Tab)));
    REQUIRE(f.runtime.enqueueInput(RawInput::keyPress(U'z')));
    REQUIRE(f.runtime.update().has_value());

    CHECK(f.runtime.focused() == std::optional<std::string>{"b"});
    CHECK_FALSE(f.a->focused);
    CHECK(f.b->focused);
    CHECK(f.b->text() == "z");
    CHECK(f.a->text().empty());
    CHECK(f.runtime.focusPath().toString() == "root.b");

    REQUIRE(f.runtime.enqueueInput(RawInput::specialKey(SpecialKey::Tab)));
    REQUIRE(f.runtime.update().has_value());
    CHECK(f.runtime.focused() == std::optional<std::string>{"a"});
}

TEST_CASE("enter submits the focused component") {
    Fixture f;
    REQUIRE(f.runtime.enqueueInput(RawInput::specialKey(SpecialKey::Enter)));
    REQUIRE(f.runtime.update().has_value());
    CHECK(f.a->inspectState()["submits"] == 1);
}

TEST_CASE("mouse press focuses the node under the pointer") {
    Fixture f;
    REQUIRE(f.runtime.enqueueInput(RawInput::mouse(MouseAction::Press, MouseButton::Left, 3, 1)));
    REQUIRE(f.runtime.update().has_value());

    CHECK(f.runtime.focused() == std::optional<std::string>{"b"});
    auto const received = f.b->actions();
    REQUIRE(received.size() == 1);
    CHECK(received.front() == ActionType::MouseClick);
}

TEST_CASE("scripted bytes travel through the reader thread") {
    Fixture f;
    f.platform.script("ok");
    auto const deadline = std::chrono::steady_clock::now() + std::chrono::seconds{2};
    while (f.a->text() != "ok" && std::chrono::steady_clock::now() < deadline) {
        REQUIRE(f.runtime.update().has_value());
        std::this_thread::sleep_for(std::chrono::milliseconds{2});
    }
    CHECK(f.a->text() == "ok");
}

TEST_CASE("undo and redo restore component state") {
    Fixture f;
    REQUIRE(f.runtime.enqueueInput(RawInput::keyPress(U'h')));
    REQUIRE(f.runtime.update().has_value());
    REQUIRE(f.a->text() == "h");

    REQUIRE(f.runtime.enqueueInput(RawInput::keyPress(U'z', KeyModifiers::Ctrl)));
    REQUIRE(f.runtime.update().has_value());
    CHECK(f.a->text().empty());
    CHECK(f.runtime.stateTracker().historySize() == 0);
    CHECK(f.runtime.stateTracker().futureSize() == 1);

    REQUIRE(f.runtime.enqueueInput(RawInput::keyPress(U'y', KeyModifiers::Ctrl)));
    REQUIRE(f.runtime.update().has_value());
    CHECK(f.a->text() == "h");
    CHECK(f.runtime.stateTracker().historySize() == 1);
    CHECK(f.runtime.stateTracker().futureSize() == 0);

    // Nothing left to redo.
    CHECK_FALSE(f.runtime.dispatch(Action{ActionType::Redo}));
}
} // TEST_SUITE

TEST_SUITE("runtime.render") {
TEST_CASE("first frame clears and paints everything") {
    Fixture f;
    REQUIRE(f.runtime.update().has_value());
    REQUIRE(f.runtime.render().has_value());

    CHECK(f.platform.clearCount() == 1);
    CHECK(f.runtime.frames() == 1);
    auto const screen = f.runtime.screen();
    CHECK(screen.size() == Size{40, 12});
    REQUIRE(screen.cell(0, 0) != nullptr);
    CHECK(screen.cell(0, 0)->ch == U'a');
    REQUIRE(screen.cell(0, 1) != nullptr);
    CHECK(screen.cell(0, 1)->ch == U'b');
    CHECK(f.platform.output().find('a') != std::string::npos);
}

TEST_CASE("later frames write only what changed") {
    Fixture f;
    REQUIRE(f.runtime.update().has_value());
    REQUIRE(f.runtime.render().has_value());
    f.platform.clearOutput();

    // Nothing dirty: no frame.
    REQUIRE(f.runtime.render().has_value());
    CHECK(f.runtime.frames() == 1);
    CHECK(f.platform.output().empty());

    REQUIRE(f.runtime.enqueueInput(RawInput::paste("xy")));
    REQUIRE(f.runtime.update().has_value());
    REQUIRE(f.runtime.render().has_value());

    CHECK(f.runtime.frames() == 2);
    CHECK(f.platform.clearCount() == 1);
    auto const output = f.platform.output();
    CHECK(output.find("xy") != std::string::npos);
    CHECK(output.find('b') == std::string::npos);
}

TEST_CASE("resize forces a cleared full repaint") {
    Fixture f;
    REQUIRE(f.runtime.update().has_value());
    REQUIRE(f.runtime.render().has_value());

    REQUIRE(f.runtime.enqueueInput(RawInput::resize(20, 5)));
    REQUIRE(f.runtime.update().has_value());
    REQUIRE(f.runtime.render().has_value());

    CHECK(f.platform.clearCount() == 2);
    CHECK(f.runtime.screen().size() == Size{20, 5});
    CHECK(f.runtime.frames() == 2);
}

TEST_CASE("refresh repaints without clearing") {
    Fixture f;
    REQUIRE(f.runtime.update().has_value());
    REQUIRE(f.runtime.render().has_value());

    CHECK(f.runtime.dispatch(Action{ActionType::Refresh}));
    REQUIRE(f.runtime.update().has_value());
    REQUIRE(f.runtime.render().has_value());
    CHECK(f.runtime.frames() == 2);
    CHECK(f.platform.clearCount() == 1);
}
} // TEST_SUITE
