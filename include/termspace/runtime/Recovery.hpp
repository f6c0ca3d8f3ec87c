#pragma once
#include <termspace/core/Error.hpp>

#include <chrono>
#include <cstddef>
#include <deque>
#include <exception>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace TS {

class Platform;

struct PanicReport {
    std::chrono::system_clock::time_point            time;
    std::string                                      where;
    std::string                                      value;
    std::vector<std::pair<std::string, std::string>> environment;
    // Stack of the recovering thread; empty where std::stacktrace is unavailable.
    std::string                                      stack;
};

class PanicHandler {
public:
    virtual ~PanicHandler()                                   = default;
    virtual auto handlePanic(PanicReport const& report) -> void = 0;
};

// Writes "[PANIC] <where>: <value>" through the sink (stderr by default).
class LoggingPanicHandler final : public PanicHandler {
public:
    using Sink = std::function<void(std::string const&)>;

    explicit LoggingPanicHandler(Sink sink = {});
    auto handlePanic(PanicReport const& report) -> void override;

private:
    Sink        sink;
    std::string prefix = "[PANIC] ";
};

class MetricsPanicHandler final : public PanicHandler {
public:
    explicit MetricsPanicHandler(std::size_t maxRecords = 16);

    auto handlePanic(PanicReport const& report) -> void override;

    [[nodiscard]] auto panicCount() const -> std::size_t;
    [[nodiscard]] auto records() const -> std::vector<PanicReport>;
    auto reset() -> void;

private:
    mutable std::mutex      mutex;
    std::size_t             count = 0;
    std::size_t             maxRecords;
    std::deque<PanicReport> recent;
};

/**
 * Last line of defence for faults escaping a task or the main loop.
 *
 * handle() restores the terminal through the attached platform (cooked mode,
 * cursor shown, alternate screen left, output flushed) before anything else,
 * then writes the "=== PANIC ===" report to stderr and the optional panic
 * log, then runs the registered handlers in order.
 */
class Recovery {
public:
    struct Options {
        std::filesystem::path panicLogPath;
        // Rethrow from guard() after handling instead of returning an Error.
        bool                  rethrow     = false;
        bool                  writeStderr = true;
    };

    Recovery();
    explicit Recovery(Options options);

    auto setPlatform(Platform* platform) -> void;
    auto addHandler(std::shared_ptr<PanicHandler> handler) -> void;

    auto handle(std::exception_ptr fault, std::string const& where) -> Error;

    template <typename Fn>
    auto guard(std::string const& where, Fn&& fn) -> std::optional<Error> {
        try {
            std::forward<Fn>(fn)();
            return std::nullopt;
        } catch (...) {
            auto error = this->handle(std::current_exception(), where);
            if (this->options.rethrow)
                throw;
            return error;
        }
    }

    [[nodiscard]] static auto describe(std::exception_ptr fault) -> std::string;
    [[nodiscard]] static auto formatReport(PanicReport const& report) -> std::string;

    [[nodiscard]] auto panicCount() const -> std::size_t;

private:
    auto restoreTerminal() noexcept -> void;

    Options                                    options;
    mutable std::mutex                         mutex;
    Platform*                                  platform = nullptr;
    std::vector<std::shared_ptr<PanicHandler>> handlers;
    std::size_t                                panics = 0;
};

} // namespace TS
