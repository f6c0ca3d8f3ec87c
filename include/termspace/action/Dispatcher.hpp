#pragma once
#include <termspace/action/Action.hpp>
#include <termspace/action/Target.hpp>
#include <termspace/core/Error.hpp>

#include <parallel_hashmap/phmap.h>

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace TS {

using SubscriptionId = std::uint64_t;

/**
 * Routes Actions through a fixed priority chain:
 *   1. global subscribers for the action's type, in registration order,
 *   2. the registered target named by Action::target (if any),
 *   3. the default handler.
 * The first stage that reports "handled" ends the chain.
 *
 * Thread-safety: registries are guarded by a reader/writer lock. Handlers are
 * invoked with no lock held so they may call back into the dispatcher.
 */
class Dispatcher {
public:
    using Handler = std::function<bool(Action const&)>;

    struct LogEntry {
        Action                    action;
        std::string               target;
        bool                      handled = false;
        std::chrono::microseconds duration{0};
    };

    struct Stats {
        std::size_t targets        = 0;
        std::size_t globalHandlers = 0;
        std::size_t logSize        = 0;
        bool        logEnabled     = false;
    };

    static constexpr std::size_t kMaxLogEntries = 1000;

    Dispatcher() = default;

    Dispatcher(Dispatcher const&)                    = delete;
    auto operator=(Dispatcher const&) -> Dispatcher& = delete;

    auto registerTarget(std::shared_ptr<Target> target) -> void;
    auto unregisterTarget(std::string const& id) -> bool;
    [[nodiscard]] auto target(std::string const& id) const -> std::shared_ptr<Target>;
    [[nodiscard]] auto hasTarget(std::string const& id) const -> bool;

    auto subscribe(ActionType type, Handler handler) -> SubscriptionId;
    auto unsubscribe(SubscriptionId id) -> bool;
    auto setDefaultHandler(Handler handler) -> void;

    // Returns true when some stage handled the action.
    auto dispatch(Action const& action) -> bool;
    // Same routing, with the reason reported when nothing handled it.
    auto tryDispatch(Action const& action) -> Expected<void>;
    auto dispatchToFocus(Action action, std::string const& focusedId) -> bool;
    auto dispatchToTarget(std::string const& id, Action action) -> bool;

    auto enableLog(bool enabled) -> void;
    [[nodiscard]] auto log() const -> std::vector<LogEntry>;
    auto clearLog() -> void;

    [[nodiscard]] auto stats() const -> Stats;
    [[nodiscard]] auto toString() const -> std::string;

private:
    struct Subscription {
        SubscriptionId id;
        Handler        handler;
    };

    auto record(Action const& action, bool handled, std::chrono::steady_clock::time_point started) -> void;

    mutable std::shared_mutex                                           mutex;
    phmap::flat_hash_map<std::string, std::shared_ptr<Target>>         targets;
    phmap::flat_hash_map<ActionType, std::vector<Subscription>>        globalHandlers;
    Handler                                                             defaultHandler;
    SubscriptionId                                                      nextSubscription = 1;

    mutable std::mutex   logMutex;
    bool                 logEnabled = false;
    std::deque<LogEntry> entries;
};

} // namespace TS
