#pragma once
#include <termspace/platform/Platform.hpp>

#include <termios.h>

#include <atomic>
#include <mutex>

namespace TS {

/**
 * POSIX terminal backend.
 *
 * init() switches the input descriptor to raw mode, enters the alternate
 * screen, hides the cursor and enables SGR mouse reporting. close() and
 * restoreTerminal() undo this in reverse: cooked mode, cursor shown,
 * alternate screen left, output flushed.
 */
class TerminalPlatform final : public Platform {
public:
    struct Options {
        int  inputFd     = 0;
        int  outputFd    = 1;
        bool mouse       = true;
        bool altScreen   = true;
    };

    TerminalPlatform();
    explicit TerminalPlatform(Options options);
    ~TerminalPlatform() override;

    TerminalPlatform(TerminalPlatform const&)                    = delete;
    auto operator=(TerminalPlatform const&) -> TerminalPlatform& = delete;

    auto init() -> Expected<void> override;
    auto close() -> Expected<void> override;
    [[nodiscard]] auto size() const -> Size override;
    auto readInput(std::span<char> buffer, std::chrono::milliseconds timeout) -> Expected<std::size_t> override;
    auto writeString(std::string_view text) -> Expected<void> override;
    auto clear() -> Expected<void> override;
    auto takeResize() -> std::optional<Size> override;
    auto restoreTerminal() noexcept -> void override;

private:
    auto writeAll(std::string_view text) noexcept -> bool;

    Options           options;
    termios           original{};
    std::atomic<bool> raw{false};
    std::mutex        writeMutex;
};

} // namespace TS
