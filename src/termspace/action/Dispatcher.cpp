#include <termspace/action/Dispatcher.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <mutex>

namespace TS {

auto Dispatcher::registerTarget(std::shared_ptr<Target> target) -> void {
    if (!target)
        return;
    auto id = target->id();
    ts_log("Dispatcher::registerTarget " + id, "Dispatcher");
    std::unique_lock<std::shared_mutex> lock(this->mutex);
    this->targets[id] = std::move(target);
}

auto Dispatcher::unregisterTarget(std::string const& id) -> bool {
    std::unique_lock<std::shared_mutex> lock(this->mutex);
    return this->targets.erase(id) > 0;
}

auto Dispatcher::target(std::string const& id) const -> std::shared_ptr<Target> {
    std::shared_lock<std::shared_mutex> lock(this->mutex);
    auto                                it = this->targets.find(id);
    if (it == this->targets.end())
        return nullptr;
    return it->second;
}

auto Dispatcher::hasTarget(std::string const& id) const -> bool {
    std::shared_lock<std::shared_mutex> lock(this->mutex);
    return this->targets.contains(id);
}

auto Dispatcher::subscribe(ActionType type, Handler handler) -> SubscriptionId {
    std::unique_lock<std::shared_mutex> lock(this->mutex);
    auto                                id = this->nextSubscription++;
    this->globalHandlers[type].push_back(Subscription{id, std::move(handler)});
    return id;
}

auto Dispatcher::unsubscribe(SubscriptionId id) -> bool {
    std::unique_lock<std::shared_mutex> lock(this->mutex);
    for (auto& [type, subscriptions] : this->globalHandlers) {
        auto it = std::find_if(subscriptions.begin(), subscriptions.end(), [id](Subscription const& s) { return s.id == id; });
        if (it != subscriptions.end()) {
            subscriptions.erase(it);
            return true;
        }
    }
    return false;
}

auto Dispatcher::setDefaultHandler(Handler handler) -> void {
    std::unique_lock<std::shared_mutex> lock(this->mutex);
    this->defaultHandler = std::move(handler);
}

auto Dispatcher::dispatch(Action const& action) -> bool {
    auto const started = std::chrono::steady_clock::now();

    // Copy the routing inputs so handlers run without the lock.
    std::vector<Handler>    subscribers;
    std::shared_ptr<Target> routed;
    Handler                 fallback;
    {
        std::shared_lock<std::shared_mutex> lock(this->mutex);
        if (auto it = this->globalHandlers.find(action.type); it != this->globalHandlers.end()) {
            subscribers.reserve(it->second.size());
            for (auto const& subscription : it->second)
                subscribers.push_back(subscription.handler);
        }
        if (!action.target.empty()) {
            if (auto it = this->targets.find(action.target); it != this->targets.end())
                routed = it->second;
        }
        fallback = this->defaultHandler;
    }

    bool handled = false;
    for (auto const& subscriber : subscribers) {
        if (subscriber && subscriber(action)) {
            handled = true;
            break;
        }
    }
    if (!handled && routed)
        handled = routed->handleAction(action);
    if (!handled && fallback)
        handled = fallback(action);

    if (!handled)
        ts_log("Dispatcher::dispatch unhandled " + action.toString(), "Dispatcher");
    this->record(action, handled, started);
    return handled;
}

auto Dispatcher::tryDispatch(Action const& action) -> Expected<void> {
    if (this->dispatch(action))
        return {};
    if (!action.target.empty() && !this->hasTarget(action.target))
        return std::unexpected(Error{Error::Code::NotFound, "target component not found: " + action.target});
    return std::unexpected(Error{Error::Code::NotSupported, "action not handled: " + std::string(TS::toString(action.type))});
}

auto Dispatcher::dispatchToFocus(Action action, std::string const& focusedId) -> bool {
    if (focusedId.empty())
        return false;
    action.target = focusedId;
    return this->dispatch(action);
}

auto Dispatcher::dispatchToTarget(std::string const& id, Action action) -> bool {
    action.target = id;
    return this->dispatch(action);
}

auto Dispatcher::enableLog(bool enabled) -> void {
    std::lock_guard<std::mutex> lock(this->logMutex);
    this->logEnabled = enabled;
}

auto Dispatcher::log() const -> std::vector<LogEntry> {
    std::lock_guard<std::mutex> lock(this->logMutex);
    return {this->entries.begin(), this->entries.end()};
}

auto Dispatcher::clearLog() -> void {
    std::lock_guard<std::mutex> lock(this->logMutex);
    this->entries.clear();
}

auto Dispatcher::record(Action const& action, bool handled, std::chrono::steady_clock::time_point started) -> void {
    std::lock_guard<std::mutex> lock(this->logMutex);
    if (!this->logEnabled)
        return;
    auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - started);
    this->entries.push_back(LogEntry{action, action.target, handled, elapsed});
    while (this->entries.size() > kMaxLogEntries)
        this->entries.pop_front();
}

auto Dispatcher::stats() const -> Stats {
    Stats result;
    {
        std::shared_lock<std::shared_mutex> lock(this->mutex);
        result.targets = this->targets.size();
        for (auto const& [type, subscriptions] : this->globalHandlers)
            result.globalHandlers += subscriptions.size();
    }
    std::lock_guard<std::mutex> lock(this->logMutex);
    result.logSize    = this->entries.size();
    result.logEnabled = this->logEnabled;
    return result;
}

auto Dispatcher::toString() const -> std::string {
    auto s = this->stats();
    return "Dispatcher{targets=" + std::to_string(s.targets) + ", handlers=" + std::to_string(s.globalHandlers) + "}";
}

} // namespace TS
