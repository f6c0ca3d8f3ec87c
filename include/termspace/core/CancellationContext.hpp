#pragma once
#include <termspace/core/Error.hpp>

#include <any>
#include <chrono>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>

namespace TS {

/**
 * Cooperative cancellation handle shared by the runtime, spawned tasks and
 * composite actions.
 *
 * A context is a cheap copyable handle onto shared state. Children created
 * with withCancel/withTimeout/withDeadline are canceled when their parent is;
 * canceling a child never affects the parent. A context whose deadline has
 * passed reports itself canceled with a Timeout error.
 *
 * Nothing is ever interrupted: tasks observe isCanceled() or waitFor() and
 * return on their own.
 */
class CancellationContext {
public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    CancellationContext();

    auto cancel() const -> void;
    [[nodiscard]] auto isCanceled() const -> bool;
    // Canceled, Timeout (deadline exceeded) or nothing while still live.
    [[nodiscard]] auto err() const -> std::optional<Error>;
    [[nodiscard]] auto deadline() const -> std::optional<TimePoint>;
    [[nodiscard]] auto token() const -> std::stop_token;

    [[nodiscard]] auto withCancel() const -> CancellationContext;
    [[nodiscard]] auto withTimeout(Clock::duration timeout) const -> CancellationContext;
    [[nodiscard]] auto withDeadline(TimePoint when) const -> CancellationContext;
    [[nodiscard]] auto withValue(std::string key, std::any value) const -> CancellationContext;
    [[nodiscard]] auto value(std::string const& key) const -> std::optional<std::any>;

    // Sleeps for up to `duration`. Returns false if the context was canceled
    // (or its deadline passed) before the time elapsed.
    auto waitFor(Clock::duration duration) const -> bool;

private:
    struct State;
    explicit CancellationContext(std::shared_ptr<State> state);
    auto makeChild(std::optional<TimePoint> when) const -> CancellationContext;

    std::shared_ptr<State> state;
};

} // namespace TS
