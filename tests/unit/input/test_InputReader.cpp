#include <doctest/doctest.h>

#include <termspace/input/BoundedQueue.hpp>
#include <termspace/input/InputReader.hpp>
#include <termspace/platform/HeadlessPlatform.hpp>

#include <chrono>
#include <thread>
#include <vector>

using namespace TS;
using namespace std::chrono_literals;

TEST_SUITE("input.bounded_queue") {

TEST_CASE("fifo order and capacity") {
    BoundedQueue<int> queue(2);
    CHECK(queue.tryPush(1));
    CHECK(queue.tryPush(2));
    CHECK(queue.full());
    CHECK_FALSE(queue.tryPush(3));
    CHECK(queue.tryPop() == std::optional<int>(1));
    CHECK(queue.tryPush(3));
    CHECK(queue.drain(10) == std::vector<int>{2, 3});
    CHECK_FALSE(queue.tryPop().has_value());
}

TEST_CASE("a blocked producer resumes when room appears") {
    BoundedQueue<int> queue(1);
    REQUIRE(queue.tryPush(1));
    std::jthread consumer([&queue] {
        std::this_thread::sleep_for(20ms);
        (void)queue.tryPop();
    });
    CHECK(queue.push(2, 2s));
    CHECK(queue.size() == 1);
}

TEST_CASE("close wakes waiters and keeps queued items") {
    BoundedQueue<int> queue(4);
    REQUIRE(queue.tryPush(7));
    queue.close();
    CHECK(queue.closed());
    CHECK_FALSE(queue.tryPush(8));
    CHECK(queue.pop(1s) == std::optional<int>(7));
    CHECK_FALSE(queue.pop(1s).has_value());
}

} // TEST_SUITE

TEST_SUITE("input.reader") {

TEST_CASE("bytes from the platform arrive decoded and in order") {
    HeadlessPlatform       platform(Size{40, 10});
    BoundedQueue<RawInput> queue(16);
    REQUIRE(platform.init().has_value());
    InputReader reader(platform, queue, InputReader::Options{.pollTimeout = 10ms, .pushTimeout = 5ms});

    platform.script("hi\x1b[B");
    platform.resize(Size{50, 12});
    std::jthread worker([&reader](std::stop_token token) { (void)reader.run(token); });

    std::vector<RawInput> got;
    auto const            deadline = std::chrono::steady_clock::now() + 2s;
    while (got.size() < 4 && std::chrono::steady_clock::now() < deadline) {
        if (auto input = queue.pop(50ms))
            got.push_back(*input);
    }
    worker.request_stop();
    worker.join();

    REQUIRE(got.size() == 4);
    CHECK(got[0] == RawInput::resize(50, 12));
    CHECK(got[1] == RawInput::keyPress(U'h'));
    CHECK(got[2] == RawInput::keyPress(U'i'));
    CHECK(got[3] == RawInput::specialKey(SpecialKey::Down));
    CHECK(reader.published() == 4);
}

TEST_CASE("a full queue stalls the reader without dropping input") {
    HeadlessPlatform       platform;
    BoundedQueue<RawInput> queue(1);
    REQUIRE(platform.init().has_value());
    InputReader reader(platform, queue, InputReader::Options{.pollTimeout = 10ms, .pushTimeout = 5ms});

    platform.script("abc");
    std::jthread worker([&reader](std::stop_token token) { (void)reader.run(token); });

    std::this_thread::sleep_for(50ms);
    CHECK(reader.stalls() > 0);

    std::vector<char32_t> keys;
    auto const            deadline = std::chrono::steady_clock::now() + 2s;
    while (keys.size() < 3 && std::chrono::steady_clock::now() < deadline) {
        if (auto input = queue.pop(50ms))
            keys.push_back(input->key);
    }
    worker.request_stop();
    worker.join();
    CHECK(keys == std::vector<char32_t>{U'a', U'b', U'c'});
}

TEST_CASE("a lone escape is flushed after an idle read") {
    HeadlessPlatform       platform;
    BoundedQueue<RawInput> queue(4);
    REQUIRE(platform.init().has_value());
    InputReader reader(platform, queue, InputReader::Options{.pollTimeout = 10ms, .pushTimeout = 5ms});

    platform.script("\x1b");
    std::jthread worker([&reader](std::stop_token token) { (void)reader.run(token); });
    auto         input = queue.pop(2s);
    worker.request_stop();
    worker.join();

    REQUIRE(input.has_value());
    CHECK(*input == RawInput::specialKey(SpecialKey::Escape));
}

} // TEST_SUITE
