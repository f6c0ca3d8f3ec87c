#include <doctest/doctest.h>

#include <termspace/state/Diff.hpp>
#include <termspace/state/StateTracker.hpp>

#include <string>
#include <vector>

using namespace TS;

namespace {

auto withValue(Snapshot snapshot, std::string const& id, std::string const& value) -> Snapshot {
    ComponentState component;
    if (auto const* existing = snapshot.component(id))
        component = *existing;
    component.id             = id;
    component.type           = "Input";
    component.state["value"] = value;
    snapshot.setComponent(std::move(component));
    return snapshot;
}

} // namespace

TEST_SUITE("state.diff") {

TEST_CASE("a snapshot has no diff against itself") {
    Snapshot snapshot = withValue(withValue(Snapshot{}, "a", "1"), "b", "2");
    snapshot.focusPath = FocusPath::fromString("root.a");
    auto diff          = computeDiff(snapshot, snapshot);
    CHECK_FALSE(diff.hasChanges());
    CHECK_FALSE(diff.focusChanged);
    CHECK(diff.toString() == "StateDiff{ }");
}

TEST_CASE("added, removed and changed components with their fields") {
    Snapshot before = withValue(withValue(Snapshot{}, "a", "1"), "gone", "x");
    Snapshot after  = withValue(withValue(Snapshot{}, "a", "2"), "new", "y");
    after.component("a")->rect = Rect{1, 1, 3, 1};
    after.focusPath            = FocusPath::fromString("root.a");

    auto diff = computeDiff(before, after);
    CHECK(diff.focusChanged);
    CHECK(diff.isChanged("a"));
    CHECK(diff.changesFor("a") == std::vector<std::string>{"value", "rect"});
    CHECK(diff.isAdded("new"));
    CHECK(diff.isRemoved("gone"));
    CHECK(diff.toString() == R"(StateDiff{ FocusChanged Changed:["a"] Added:["new"] Removed:["gone"] })");
}

TEST_CASE("removed state keys count as changed fields") {
    Snapshot before = withValue(Snapshot{}, "a", "1");
    before.component("a")->state["cursor"] = 3;
    Snapshot after = withValue(Snapshot{}, "a", "1");
    CHECK(computeDiff(before, after).changesFor("a") == std::vector<std::string>{"cursor"});
}

} // TEST_SUITE

TEST_SUITE("state.tracker") {

TEST_CASE("afterAction records history only when content changed") {
    StateTracker tracker;
    Snapshot     live = withValue(Snapshot{}, "a", "1");
    tracker.setCapture([&live] { return live; });
    tracker.update(live);

    auto before = tracker.beforeAction();
    (void)tracker.afterAction(before);
    CHECK(tracker.historySize() == 0);

    before = tracker.beforeAction();
    live   = withValue(live, "a", "2");
    (void)tracker.afterAction(before);
    CHECK(tracker.historySize() == 1);
    CHECK(tracker.componentState("a")->at("value") == "2");
}

TEST_CASE("undo, redo, undo restores the pre-undo state") {
    StateTracker tracker;
    Snapshot     live = withValue(Snapshot{}, "a", "1");
    tracker.setCapture([&live] { return live; });
    tracker.update(live);

    for (auto const* value : {"2", "3"}) {
        auto before = tracker.beforeAction();
        live        = withValue(live, "a", value);
        (void)tracker.afterAction(before);
    }
    REQUIRE(tracker.historySize() == 2);
    auto const latest = tracker.current();

    REQUIRE(tracker.undo());
    auto const afterUndo = tracker.current();
    CHECK(afterUndo.component("a")->state["value"] == "2");
    REQUIRE(tracker.redo());
    CHECK(tracker.current() == latest);
    REQUIRE(tracker.undo());
    CHECK(tracker.current() == afterUndo);
    CHECK(tracker.canRedo());
}

TEST_CASE("a new change drops the redo branch") {
    StateTracker tracker;
    Snapshot     live = withValue(Snapshot{}, "a", "1");
    tracker.setCapture([&live] { return live; });
    tracker.update(live);

    auto before = tracker.beforeAction();
    live        = withValue(live, "a", "2");
    (void)tracker.afterAction(before);
    REQUIRE(tracker.undo());
    CHECK(tracker.futureSize() == 1);

    live   = withValue(tracker.current(), "a", "other");
    before = tracker.beforeAction();
    (void)tracker.afterAction(before);
    CHECK_FALSE(tracker.canRedo());
    CHECK_FALSE(tracker.redo());
}

TEST_CASE("history is bounded and drops the oldest entries") {
    StateTracker tracker(3);
    Snapshot     live;
    tracker.setCapture([&live] { return live; });
    for (int i = 0; i < 6; ++i) {
        auto before = tracker.beforeAction();
        live        = withValue(live, "a", std::to_string(i));
        (void)tracker.afterAction(before);
    }
    auto history = tracker.history();
    REQUIRE(history.size() == 3);
    CHECK(history.front().component("a")->state["value"] == "2");

    tracker.setMaxHistory(1);
    CHECK(tracker.historySize() == 1);
    CHECK(tracker.history().front().component("a")->state["value"] == "4");
}

TEST_CASE("subscribers see commits, undo and redo") {
    StateTracker             tracker;
    std::vector<std::string> events;
    auto id = tracker.subscribe([&events](std::optional<Snapshot> const& old, Snapshot const&) {
        events.push_back(old ? "commit" : "replay");
    });

    Snapshot live = withValue(Snapshot{}, "a", "1");
    tracker.setCapture([&live] { return live; });
    auto before = tracker.beforeAction();
    (void)tracker.afterAction(before);
    REQUIRE(tracker.undo());
    REQUIRE(tracker.redo());
    CHECK(events == std::vector<std::string>{"commit", "replay", "replay"});

    CHECK(tracker.unsubscribe(id));
    REQUIRE(tracker.undo());
    CHECK(events.size() == 3);
}

TEST_CASE("retained snapshots are independent copies") {
    StateTracker tracker;
    tracker.setComponentState("a", Json{{"value", "1"}});
    auto kept = tracker.current();
    tracker.setComponentState("a", Json{{"value", "2"}});
    CHECK(kept.component("a")->state["value"] == "1");
    tracker.setFocusPath(FocusPath::fromString("root.a"));
    CHECK(tracker.focusPath().current() == "a");
}

} // TEST_SUITE
