#pragma once
#include <termspace/platform/Platform.hpp>

#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>

namespace TS {

// In-memory terminal: scripted input bytes and captured output.
class HeadlessPlatform final : public Platform {
public:
    explicit HeadlessPlatform(Size size = {80, 24});

    auto init() -> Expected<void> override;
    auto close() -> Expected<void> override;
    [[nodiscard]] auto size() const -> Size override;
    auto readInput(std::span<char> buffer, std::chrono::milliseconds timeout) -> Expected<std::size_t> override;
    auto writeString(std::string_view text) -> Expected<void> override;
    auto clear() -> Expected<void> override;
    auto takeResize() -> std::optional<Size> override;
    auto restoreTerminal() noexcept -> void override;

    // Queues bytes to be returned by readInput.
    auto script(std::string bytes) -> void;
    auto resize(Size size) -> void;

    [[nodiscard]] auto output() const -> std::string;
    auto clearOutput() -> void;
    [[nodiscard]] auto initialized() const -> bool;
    [[nodiscard]] auto clearCount() const -> int;
    [[nodiscard]] auto restoreCount() const -> int;
    [[nodiscard]] auto pendingInput() const -> std::size_t;

private:
    mutable std::mutex      mutex;
    std::condition_variable inputReady;
    std::deque<std::string> scripted;
    std::string             captured;
    Size                    current;
    std::optional<Size>     pendingResize;
    bool                    open     = false;
    int                     clears   = 0;
    int                     restores = 0;
};

} // namespace TS
