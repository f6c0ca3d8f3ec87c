#include <termspace/input/InputReader.hpp>
#include <termspace/platform/Platform.hpp>

#include "log/TaggedLogger.hpp"

#include <vector>

namespace TS {

InputReader::InputReader(Platform& platform, BoundedQueue<RawInput>& queue)
    : InputReader(platform, queue, Options{}) {}

InputReader::InputReader(Platform& platform, BoundedQueue<RawInput>& queue, Options options)
    : platform(platform), queue(queue), options(options) {}

auto InputReader::run(std::stop_token token) -> std::optional<Error> {
#if defined(TS_LOG_DEBUG)
    set_thread_name("InputReader");
#endif
    ts_log("InputReader started", "Input");
    std::vector<char> chunk(this->options.readChunk == 0 ? 1 : this->options.readChunk);

    while (!token.stop_requested()) {
        if (auto resized = this->platform.takeResize()) {
            if (!this->publish(RawInput::resize(resized->width, resized->height), token))
                break;
        }

        auto n = this->platform.readInput(chunk, this->options.pollTimeout);
        if (!n) {
            ts_log("InputReader read failed: " + describeError(n.error()), "Input");
            this->queue.close();
            return n.error();
        }

        std::vector<RawInput> decoded;
        if (*n == 0)
            decoded = this->decoder.flush();
        else
            decoded = this->decoder.feed(std::string_view(chunk.data(), *n));

        for (auto& input : decoded) {
            if (!this->publish(std::move(input), token)) {
                ts_log("InputReader stopping with undelivered input", "Input");
                return std::nullopt;
            }
        }
    }
    ts_log("InputReader stopped", "Input");
    return std::nullopt;
}

auto InputReader::publish(RawInput input, std::stop_token const& token) -> bool {
    if (input.timestamp == RawInput::Clock::time_point{})
        input.timestamp = RawInput::Clock::now();
    while (!this->queue.push(input, this->options.pushTimeout)) {
        if (token.stop_requested() || this->queue.closed())
            return false;
        this->stalls_.fetch_add(1);
    }
    this->published_.fetch_add(1);
    return true;
}

} // namespace TS
