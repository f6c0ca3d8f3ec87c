#include <doctest/doctest.h>

#include <termspace/action/ActionError.hpp>
#include <termspace/action/Dispatcher.hpp>

#include <memory>
#include <string>
#include <vector>

using namespace TS;

namespace {

auto recordingTarget(std::string id, std::vector<std::string>& calls, bool handles = true) -> std::shared_ptr<Target> {
    return std::make_shared<FunctionTarget>(id, [&calls, id, handles](Action const& action) {
        calls.push_back(id + ":" + std::string(toString(action.type)));
        return handles;
    });
}

} // namespace

TEST_SUITE("action.dispatcher") {

TEST_CASE("global subscribers run before the routed target") {
    Dispatcher               dispatcher;
    std::vector<std::string> calls;
    dispatcher.registerTarget(recordingTarget("name", calls));
    dispatcher.subscribe(ActionType::Submit, [&calls](Action const&) {
        calls.push_back("global");
        return true;
    });

    CHECK(dispatcher.dispatch(Action{ActionType::Submit}.withTarget("name")));
    REQUIRE(calls.size() == 1);
    CHECK(calls.front() == "global");
}

TEST_CASE("unhandled subscribers fall through to the target, then the default") {
    Dispatcher               dispatcher;
    std::vector<std::string> calls;
    dispatcher.registerTarget(recordingTarget("name", calls, false));
    dispatcher.subscribe(ActionType::Submit, [&calls](Action const&) {
        calls.push_back("global");
        return false;
    });
    dispatcher.setDefaultHandler([&calls](Action const&) {
        calls.push_back("default");
        return true;
    });

    CHECK(dispatcher.dispatch(Action{ActionType::Submit}.withTarget("name")));
    CHECK(calls == std::vector<std::string>{"global", "name:submit", "default"});
}

TEST_CASE("subscribers only see their own action type") {
    Dispatcher dispatcher;
    int        seen = 0;
    auto       id   = dispatcher.subscribe(ActionType::Quit, [&seen](Action const&) {
        ++seen;
        return true;
    });
    CHECK_FALSE(dispatcher.dispatch(Action{ActionType::Submit}));
    CHECK(dispatcher.dispatch(Action{ActionType::Quit}));
    CHECK(dispatcher.unsubscribe(id));
    CHECK_FALSE(dispatcher.unsubscribe(id));
    CHECK_FALSE(dispatcher.dispatch(Action{ActionType::Quit}));
    CHECK(seen == 1);
}

TEST_CASE("tryDispatch explains why nothing handled the action") {
    Dispatcher dispatcher;
    auto       missing = dispatcher.tryDispatch(Action{ActionType::Submit}.withTarget("ghost"));
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().code == Error::Code::NotFound);

    auto unhandled = dispatcher.tryDispatch(Action{ActionType::Refresh});
    REQUIRE_FALSE(unhandled.has_value());
    CHECK(unhandled.error().code == Error::Code::NotSupported);
    CHECK(unhandled.error().message == "action not handled: refresh");
}

TEST_CASE("dispatchToFocus targets the focused id") {
    Dispatcher               dispatcher;
    std::vector<std::string> calls;
    dispatcher.registerTarget(recordingTarget("email", calls));
    CHECK_FALSE(dispatcher.dispatchToFocus(Action{ActionType::Backspace}, ""));
    CHECK(dispatcher.dispatchToFocus(Action{ActionType::Backspace}, "email"));
    CHECK(calls == std::vector<std::string>{"email:backspace"});
    CHECK(dispatcher.unregisterTarget("email"));
    CHECK_FALSE(dispatcher.hasTarget("email"));
}

TEST_CASE("the log records routed actions when enabled") {
    Dispatcher               dispatcher;
    std::vector<std::string> calls;
    dispatcher.registerTarget(recordingTarget("name", calls));
    dispatcher.dispatch(Action{ActionType::Submit}.withTarget("name"));
    CHECK(dispatcher.log().empty());

    dispatcher.enableLog(true);
    dispatcher.dispatch(Action{ActionType::Submit}.withTarget("name"));
    dispatcher.dispatch(Action{ActionType::Refresh});
    auto entries = dispatcher.log();
    REQUIRE(entries.size() == 2);
    CHECK(entries[0].handled);
    CHECK_FALSE(entries[1].handled);
    CHECK(dispatcher.stats().targets == 1);
    dispatcher.clearLog();
    CHECK(dispatcher.log().empty());
}

TEST_CASE("TargetChain offers the action to members in order") {
    std::vector<std::string> calls;
    TargetChain              chain("chain");
    chain.addTarget(recordingTarget("first", calls, false));
    chain.addTarget(recordingTarget("second", calls, true));
    chain.addTarget(recordingTarget("third", calls, true));
    CHECK(chain.handleAction(Action{ActionType::Copy}));
    CHECK(calls == std::vector<std::string>{"first:copy", "second:copy"});
}

} // TEST_SUITE

TEST_SUITE("action.action") {

TEST_CASE("action type names round trip") {
    CHECK(toString(ActionType::InputChar) == "input_char");
    CHECK(actionTypeFromString("navigate_next") == ActionType::NavigateNext);
    CHECK_FALSE(actionTypeFromString("teleport").has_value());
    CHECK(isMouse(ActionType::MouseWheel));
    CHECK(isNavigation(ActionType::NavigateUp));
    CHECK_FALSE(isNavigation(ActionType::Submit));
}

TEST_CASE("payloadAs reports missing and mismatched payloads") {
    Action action{ActionType::InputChar};
    CHECK(action.payloadAs<char32_t>().error().code == Error::Code::InvalidPayload);

    action.withPayload(U'x');
    CHECK(action.payloadAs<char32_t>().value() == U'x');
    CHECK_FALSE(action.payloadAs<std::string>().has_value());
    CHECK(action.withTarget("name").toString() == "input_char{name}");
}

TEST_CASE("payload validation produces ActionErrors") {
    Action action{ActionType::InputText};
    auto   missing = validatePayloadType<std::string>(action, "string");
    REQUIRE(missing.has_value());
    CHECK(missing->kind == ActionError::Kind::MissingPayload);

    action.withPayload(42);
    auto mismatch = validatePayloadType<std::string>(action, "string");
    REQUIRE(mismatch.has_value());
    CHECK(mismatch->kind == ActionError::Kind::InvalidPayload);
    CHECK(mismatch->toError().code == Error::Code::InvalidPayload);
}

} // TEST_SUITE
