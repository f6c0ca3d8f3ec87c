#ifdef TS_LOG_DEBUG
#include <doctest/doctest.h>

#include "log/TaggedLogger.hpp"

#include <functional>
#include <iostream>
#include <sstream>
#include <string>

namespace {

auto captureStderr(std::function<void()> const& fn) -> std::string {
    std::ostringstream buffer;
    auto*              original = std::cerr.rdbuf(buffer.rdbuf());
    fn();
    std::cerr.rdbuf(original);
    return buffer.str();
}

} // namespace

TEST_SUITE("log.tagged_logger") {

TEST_CASE("disabled logger drops messages") {
    auto output = captureStderr([] {
        TS::TaggedLogger logger;
        logger.log_impl("should not appear", std::source_location::current(), "Runtime");
        logger.flush();
    });
    CHECK(output.empty());
}

TEST_CASE("enabled logger writes tags, thread and message") {
    auto output = captureStderr([] {
        TS::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.setThreadName("Worker-7");
        logger.log_impl("hello log", std::source_location::current(), "Runtime", "Focus");
        logger.flush();
    });
    CHECK(output.find("[Focus][Runtime]") != std::string::npos);
    CHECK(output.find("[Worker-7]") != std::string::npos);
    CHECK(output.find("hello log") != std::string::npos);
}

TEST_CASE("default skip set hides chatty subsystems") {
    auto output = captureStderr([] {
        TS::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.log_impl("decoded key", std::source_location::current(), "Input");
        logger.flush();
    });
    CHECK(output.empty());

    auto cleared = captureStderr([] {
        TS::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.setSkipTags({});
        logger.log_impl("decoded key", std::source_location::current(), "Input");
        logger.flush();
    });
    CHECK(cleared.find("decoded key") != std::string::npos);
}

TEST_CASE("enabled tag set gates output") {
    auto output = captureStderr([] {
        TS::TaggedLogger logger;
        logger.setLoggingEnabled(true);
        logger.setEnabledTags({"State"});
        logger.log_impl("keep me", std::source_location::current(), "State");
        logger.log_impl("drop me", std::source_location::current(), "State", "Dispatcher");
        logger.flush();
    });
    CHECK(output.find("keep me") != std::string::npos);
    CHECK(output.find("drop me") == std::string::npos);
}

TEST_CASE("location is shortened to parent directory and file") {
    auto output = captureStderr([] {
        TS::TaggedLogger logger;
        logger.setLoggingEnabled(true);
#line 42 "dir/subdir/LoggerChild.cpp"
        logger.log_impl("has parent", std::source_location::current(), "Solo");
#line 89 "tests/unit/log/test_TaggedLogger.cpp"
        logger.flush();
    });
    CHECK(output.find("subdir/LoggerChild.cpp:42") != std::string::npos);
}

} // TEST_SUITE
#endif // TS_LOG_DEBUG
