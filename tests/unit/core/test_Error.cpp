#include <doctest/doctest.h>

#include <termspace/core/Error.hpp>
#include <termspace/core/FocusPath.hpp>
#include <termspace/core/Geometry.hpp>

using namespace TS;

TEST_SUITE("core.error") {

TEST_CASE("describeError renders label and message") {
    Error error{Error::Code::NotFound, "component not found: name"};
    CHECK(describeError(error) == "not_found:component not found: name");
    CHECK(errorCodeToString(Error::Code::CapacityExceeded) == "capacity_exceeded");
    CHECK(errorCodeToString(Error::Code::IOError) == "io_error");
}

TEST_CASE("composite errors keep every cause and expose the first") {
    Error first{Error::Code::Timeout, "unit 0 timed out"};
    Error second{Error::Code::ActionFailed, "unit 2 failed"};
    Error composite{Error::Code::Composite, "2 of 3 units failed", {first, second}};

    REQUIRE(composite.causes.size() == 2);
    CHECK(primaryCause(composite).code == Error::Code::Timeout);
    CHECK(describeError(composite).find("timeout:unit 0 timed out") != std::string::npos);
}

TEST_CASE("Expected carries either a value or an Error") {
    Expected<int> ok = 7;
    Expected<int> bad = std::unexpected(Error{Error::Code::InvalidPayload, "bad"});
    CHECK(ok.value() == 7);
    REQUIRE_FALSE(bad.has_value());
    CHECK(bad.error().code == Error::Code::InvalidPayload);
}

} // TEST_SUITE

TEST_SUITE("core.geometry") {

TEST_CASE("rect contains is half-open") {
    Rect r{2, 3, 4, 2};
    CHECK(r.contains(2, 3));
    CHECK(r.contains(5, 4));
    CHECK_FALSE(r.contains(6, 4));
    CHECK_FALSE(r.contains(5, 5));
    CHECK(Rect{0, 0, 0, 5}.empty());
}

TEST_CASE("rect intersect clips and yields empty when disjoint") {
    Rect a{0, 0, 10, 10};
    Rect b{5, 5, 10, 10};
    CHECK(a.intersect(b) == Rect{5, 5, 5, 5});
    CHECK(a.intersect(Rect{20, 20, 3, 3}).empty());
}

} // TEST_SUITE

TEST_SUITE("core.focus_path") {

TEST_CASE("string form joins segments with dots") {
    auto path = FocusPath::fromString("form.fields.name");
    CHECK(path.size() == 3);
    CHECK(path.current() == "name");
    CHECK(path.parent().toString() == "form.fields");
    CHECK(path.toString() == "form.fields.name");
    CHECK(FocusPath::fromString("").empty());
}

TEST_CASE("push and pop walk the chain") {
    FocusPath path;
    path.push("form");
    path.push("email");
    CHECK(path.append("x").toString() == "form.email.x");
    CHECK(path.pop() == std::optional<std::string>("email"));
    CHECK(path.pop() == std::optional<std::string>("form"));
    CHECK_FALSE(path.pop().has_value());
}

} // TEST_SUITE
