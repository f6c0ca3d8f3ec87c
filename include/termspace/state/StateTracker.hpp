#pragma once
#include <termspace/state/Diff.hpp>
#include <termspace/state/Snapshot.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace TS {

/**
 * Owns the current snapshot plus bounded undo (past) and redo (future) stacks.
 *
 * beforeAction()/afterAction() bracket an update: afterAction captures the
 * new state and, when its content differs from the bracketed copy, records
 * that copy as history and drops the redo branch. Subscribers are called on
 * the committing thread, in registration order, after the lock is released.
 */
class StateTracker {
public:
    using SubscriptionId = std::uint64_t;
    // old is empty for undo and redo.
    using Listener       = std::function<void(std::optional<Snapshot> const& old, Snapshot const& current)>;
    // Produces the live state for afterAction; the current snapshot is used when unset.
    using CaptureFn      = std::function<Snapshot()>;

    static constexpr std::size_t kDefaultMaxHistory = 100;

    explicit StateTracker(std::size_t maxHistory = kDefaultMaxHistory);

    [[nodiscard]] auto current() const -> Snapshot;
    auto update(Snapshot next) -> void;

    [[nodiscard]] auto beforeAction() const -> Snapshot;
    auto afterAction(Snapshot const& before) -> Snapshot;
    auto setCapture(CaptureFn fn) -> void;

    auto undo() -> bool;
    auto redo() -> bool;
    [[nodiscard]] auto canUndo() const -> bool;
    [[nodiscard]] auto canRedo() const -> bool;

    // Oldest first.
    [[nodiscard]] auto history() const -> std::vector<Snapshot>;
    auto clearHistory() -> void;
    auto clearFuture() -> void;
    [[nodiscard]] auto historySize() const -> std::size_t;
    [[nodiscard]] auto futureSize() const -> std::size_t;
    [[nodiscard]] auto maxHistory() const -> std::size_t;
    auto setMaxHistory(std::size_t max) -> void;

    auto setComponentState(std::string const& id, Json state) -> void;
    [[nodiscard]] auto componentState(std::string const& id) const -> std::optional<Json>;
    auto setFocusPath(FocusPath path) -> void;
    [[nodiscard]] auto focusPath() const -> FocusPath;

    auto subscribe(Listener listener) -> SubscriptionId;
    auto unsubscribe(SubscriptionId id) -> bool;

private:
    struct Subscription {
        SubscriptionId id;
        Listener       listener;
    };

    auto trimLocked() -> void;
    auto notify(std::optional<Snapshot> const& old, Snapshot const& current) -> void;

    mutable std::shared_mutex mutex;
    Snapshot                  current_;
    std::deque<Snapshot>      past;
    std::vector<Snapshot>     future;
    std::size_t               maxHistory_;
    CaptureFn                 capture;

    mutable std::mutex        listenerMutex;
    std::vector<Subscription> listeners;
    SubscriptionId            nextSubscription = 1;
};

} // namespace TS
