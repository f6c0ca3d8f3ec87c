#include <doctest/doctest.h>

#include <termspace/core/CancellationContext.hpp>

#include <chrono>
#include <string>
#include <thread>

using namespace TS;
using namespace std::chrono_literals;

TEST_SUITE("core.cancellation") {

TEST_CASE("cancel propagates to children but not to parents") {
    CancellationContext root;
    auto child      = root.withCancel();
    auto grandchild = child.withCancel();

    child.cancel();
    CHECK(child.isCanceled());
    CHECK(grandchild.isCanceled());
    CHECK_FALSE(root.isCanceled());
    REQUIRE(grandchild.err().has_value());
    CHECK(grandchild.err()->code == Error::Code::Canceled);
}

TEST_CASE("timeout reports a Timeout error once the deadline passes") {
    CancellationContext root;
    auto timed = root.withTimeout(20ms);
    CHECK_FALSE(timed.isCanceled());
    CHECK_FALSE(timed.waitFor(200ms));
    REQUIRE(timed.err().has_value());
    CHECK(timed.err()->code == Error::Code::Timeout);
}

TEST_CASE("child deadline never extends the parent's") {
    CancellationContext root;
    auto parent = root.withTimeout(50ms);
    auto child  = parent.withTimeout(10s);
    REQUIRE(parent.deadline().has_value());
    REQUIRE(child.deadline().has_value());
    CHECK(*child.deadline() == *parent.deadline());
}

TEST_CASE("waitFor wakes early on cancel") {
    CancellationContext ctx;
    std::jthread canceler([ctx] {
        std::this_thread::sleep_for(20ms);
        ctx.cancel();
    });
    auto const started = std::chrono::steady_clock::now();
    CHECK_FALSE(ctx.waitFor(5s));
    CHECK(std::chrono::steady_clock::now() - started < 2s);
}

TEST_CASE("values are visible from descendants") {
    CancellationContext root;
    auto withUser = root.withValue("user", std::string("ada"));
    auto child    = withUser.withCancel();
    auto found    = child.value("user");
    REQUIRE(found.has_value());
    CHECK(std::any_cast<std::string>(*found) == "ada");
    CHECK_FALSE(root.value("user").has_value());
}

} // TEST_SUITE
