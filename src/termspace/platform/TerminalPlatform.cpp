#include <termspace/platform/TerminalPlatform.hpp>

#include "log/TaggedLogger.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <poll.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace TS {

namespace {

std::atomic<bool> gResizePending{false};

void onWindowChange(int) {
    gResizePending.store(true, std::memory_order_relaxed);
}

constexpr std::string_view kEnterAltScreen{"\x1b[?1049h"};
constexpr std::string_view kLeaveAltScreen{"\x1b[?1049l"};
constexpr std::string_view kHideCursor{"\x1b[?25l"};
constexpr std::string_view kShowCursor{"\x1b[?25h"};
constexpr std::string_view kMouseOn{"\x1b[?1000h\x1b[?1002h\x1b[?1006h"};
constexpr std::string_view kMouseOff{"\x1b[?1006l\x1b[?1002l\x1b[?1000l"};
constexpr std::string_view kPasteOn{"\x1b[?2004h"};
constexpr std::string_view kPasteOff{"\x1b[?2004l"};

auto errnoError(std::string const& what) -> Error {
    return Error{Error::Code::IOError, what + ": " + std::strerror(errno)};
}

} // namespace

TerminalPlatform::TerminalPlatform()
    : TerminalPlatform(Options{}) {}

TerminalPlatform::TerminalPlatform(Options options)
    : options(options) {}

TerminalPlatform::~TerminalPlatform() {
    this->restoreTerminal();
}

auto TerminalPlatform::init() -> Expected<void> {
    if (this->raw.load())
        return {};
    if (!::isatty(this->options.inputFd))
        return std::unexpected(Error{Error::Code::NotSupported, "input is not a terminal"});
    if (::tcgetattr(this->options.inputFd, &this->original) != 0)
        return std::unexpected(errnoError("tcgetattr failed"));

    termios rawMode = this->original;
    rawMode.c_lflag &= ~(ECHO | ICANON | ISIG | IEXTEN);
    rawMode.c_iflag &= ~(BRKINT | ICRNL | INPCK | ISTRIP | IXON);
    rawMode.c_cflag |= CS8;
    rawMode.c_oflag &= ~(OPOST);
    rawMode.c_cc[VMIN]  = 0;
    rawMode.c_cc[VTIME] = 0;
    if (::tcsetattr(this->options.inputFd, TCSAFLUSH, &rawMode) != 0)
        return std::unexpected(errnoError("tcsetattr failed"));
    this->raw.store(true);

    struct sigaction action{};
    action.sa_handler = onWindowChange;
    sigemptyset(&action.sa_mask);
    ::sigaction(SIGWINCH, &action, nullptr);

    std::string setup;
    if (this->options.altScreen)
        setup += kEnterAltScreen;
    setup += kHideCursor;
    setup += kPasteOn;
    if (this->options.mouse)
        setup += kMouseOn;
    if (!this->writeAll(setup))
        return std::unexpected(errnoError("terminal setup write failed"));
    ts_log("TerminalPlatform entered raw mode", "Runtime");
    return {};
}

auto TerminalPlatform::close() -> Expected<void> {
    if (!this->raw.load())
        return {};
    this->restoreTerminal();
    std::signal(SIGWINCH, SIG_DFL);
    return {};
}

auto TerminalPlatform::size() const -> Size {
    winsize ws{};
    if (::ioctl(this->options.outputFd, TIOCGWINSZ, &ws) != 0 || ws.ws_col == 0)
        return Size{80, 24};
    return Size{ws.ws_col, ws.ws_row};
}

auto TerminalPlatform::readInput(std::span<char> buffer, std::chrono::milliseconds timeout) -> Expected<std::size_t> {
    pollfd fd{this->options.inputFd, POLLIN, 0};
    int    ready = ::poll(&fd, 1, static_cast<int>(timeout.count()));
    if (ready < 0) {
        if (errno == EINTR)
            return std::size_t{0};
        return std::unexpected(errnoError("poll failed"));
    }
    if (ready == 0)
        return std::size_t{0};
    if (fd.revents & (POLLERR | POLLHUP | POLLNVAL))
        return std::unexpected(Error{Error::Code::IOError, "input descriptor closed"});

    auto n = ::read(this->options.inputFd, buffer.data(), buffer.size());
    if (n < 0) {
        if (errno == EINTR || errno == EAGAIN)
            return std::size_t{0};
        return std::unexpected(errnoError("read failed"));
    }
    return static_cast<std::size_t>(n);
}

auto TerminalPlatform::writeString(std::string_view text) -> Expected<void> {
    if (!this->writeAll(text))
        return std::unexpected(errnoError("write failed"));
    return {};
}

auto TerminalPlatform::clear() -> Expected<void> {
    return this->writeString("\x1b[2J\x1b[H");
}

auto TerminalPlatform::takeResize() -> std::optional<Size> {
    if (!gResizePending.exchange(false))
        return std::nullopt;
    return this->size();
}

auto TerminalPlatform::restoreTerminal() noexcept -> void {
    if (!this->raw.exchange(false))
        return;
    ::tcsetattr(this->options.inputFd, TCSAFLUSH, &this->original);
    std::string teardown{kShowCursor};
    if (this->options.mouse)
        teardown += kMouseOff;
    teardown += kPasteOff;
    if (this->options.altScreen)
        teardown += kLeaveAltScreen;
    (void)this->writeAll(teardown);
    ::tcdrain(this->options.outputFd);
}

auto TerminalPlatform::writeAll(std::string_view text) noexcept -> bool {
    std::lock_guard lock(this->writeMutex);
    while (!text.empty()) {
        auto n = ::write(this->options.outputFd, text.data(), text.size());
        if (n < 0) {
            if (errno == EINTR)
                continue;
            return false;
        }
        text.remove_prefix(static_cast<std::size_t>(n));
    }
    return true;
}

} // namespace TS
