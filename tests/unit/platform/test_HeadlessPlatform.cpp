#include <doctest/doctest.h>

#include <termspace/platform/HeadlessPlatform.hpp>

#include <array>
#include <chrono>

using namespace TS;
using namespace std::chrono_literals;

TEST_SUITE("platform.headless") {

TEST_CASE("scripted bytes are read back in chunks") {
    HeadlessPlatform platform(Size{20, 4});
    REQUIRE(platform.init().has_value());
    platform.script("hello");

    std::array<char, 3> buffer{};
    auto                first = platform.readInput(buffer, 10ms);
    REQUIRE(first.has_value());
    CHECK(*first == 3);
    CHECK(std::string_view(buffer.data(), 3) == "hel");
    CHECK(platform.pendingInput() == 2);

    auto second = platform.readInput(buffer, 10ms);
    CHECK(*second == 2);
    CHECK(*platform.readInput(buffer, 10ms) == 0);
}

TEST_CASE("writes are captured only while open") {
    HeadlessPlatform platform;
    CHECK_FALSE(platform.writeString("early").has_value());
    REQUIRE(platform.init().has_value());
    REQUIRE(platform.writeString("frame").has_value());
    CHECK(platform.output() == "frame");
    REQUIRE(platform.clear().has_value());
    CHECK(platform.output().empty());
    CHECK(platform.clearCount() == 1);
    REQUIRE(platform.close().has_value());
    CHECK_FALSE(platform.initialized());
}

TEST_CASE("resize is reported once") {
    HeadlessPlatform platform(Size{80, 24});
    CHECK_FALSE(platform.takeResize().has_value());
    platform.resize(Size{100, 30});
    CHECK(platform.size() == Size{100, 30});
    CHECK(platform.takeResize() == std::optional<Size>(Size{100, 30}));
    CHECK_FALSE(platform.takeResize().has_value());
}

} // TEST_SUITE
