#pragma once
#include <termspace/core/Error.hpp>
#include <termspace/input/BoundedQueue.hpp>
#include <termspace/input/InputDecoder.hpp>
#include <termspace/input/RawInput.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <optional>
#include <stop_token>

namespace TS {

class Platform;

/**
 * Background read loop: pulls bytes from the platform, decodes them and
 * publishes RawInput onto the queue drained by the main loop.
 *
 * The read waits at most pollTimeout so a stop request is observed promptly.
 * An idle timeout flushes the decoder, which is how a lone ESC becomes an
 * Escape key. A full queue blocks the loop in pushTimeout slices until the
 * consumer catches up or a stop is requested; input is never dropped.
 */
class InputReader {
public:
    struct Options {
        std::chrono::milliseconds pollTimeout{100};
        std::chrono::milliseconds pushTimeout{10};
        std::size_t               readChunk = 256;
    };

    InputReader(Platform& platform, BoundedQueue<RawInput>& queue);
    InputReader(Platform& platform, BoundedQueue<RawInput>& queue, Options options);

    // Runs until stop is requested, the queue closes or the platform fails.
    auto run(std::stop_token token) -> std::optional<Error>;

    [[nodiscard]] auto published() const -> std::uint64_t { return this->published_.load(); }
    [[nodiscard]] auto stalls() const -> std::uint64_t { return this->stalls_.load(); }

private:
    auto publish(RawInput input, std::stop_token const& token) -> bool;

    Platform&                  platform;
    BoundedQueue<RawInput>&    queue;
    Options                    options;
    InputDecoder               decoder;
    std::atomic<std::uint64_t> published_{0};
    std::atomic<std::uint64_t> stalls_{0};
};

} // namespace TS
