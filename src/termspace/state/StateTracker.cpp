#include <termspace/state/StateTracker.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <mutex>

namespace TS {

StateTracker::StateTracker(std::size_t maxHistory)
    : maxHistory_(maxHistory) {}

auto StateTracker::current() const -> Snapshot {
    std::shared_lock lock(this->mutex);
    return this->current_;
}

auto StateTracker::update(Snapshot next) -> void {
    std::optional<Snapshot> old;
    Snapshot                installed;
    {
        std::unique_lock lock(this->mutex);
        old            = std::move(this->current_);
        this->current_ = std::move(next);
        installed      = this->current_;
    }
    this->notify(old, installed);
}

auto StateTracker::beforeAction() const -> Snapshot {
    std::shared_lock lock(this->mutex);
    return this->current_;
}

auto StateTracker::afterAction(Snapshot const& before) -> Snapshot {
    CaptureFn captureFn;
    {
        std::shared_lock lock(this->mutex);
        captureFn = this->capture;
    }
    // The capture callback reads live components; keep it outside the lock.
    std::optional<Snapshot> captured;
    if (captureFn)
        captured = captureFn();

    Snapshot after;
    bool     recorded = false;
    {
        std::unique_lock lock(this->mutex);
        if (captured)
            this->current_ = std::move(*captured);
        after = this->current_;
        if (!after.sameContent(before)) {
            this->future.clear();
            this->past.push_back(before);
            this->trimLocked();
            recorded = true;
        }
    }
    if (recorded) {
        ts_log("StateTracker recorded history entry", "State");
        this->notify(before, after);
    }
    return after;
}

auto StateTracker::setCapture(CaptureFn fn) -> void {
    std::unique_lock lock(this->mutex);
    this->capture = std::move(fn);
}

auto StateTracker::undo() -> bool {
    Snapshot installed;
    {
        std::unique_lock lock(this->mutex);
        if (this->past.empty())
            return false;
        this->future.push_back(std::move(this->current_));
        this->current_ = std::move(this->past.back());
        this->past.pop_back();
        installed = this->current_;
    }
    this->notify(std::nullopt, installed);
    return true;
}

auto StateTracker::redo() -> bool {
    Snapshot installed;
    {
        std::unique_lock lock(this->mutex);
        if (this->future.empty())
            return false;
        this->past.push_back(std::move(this->current_));
        this->trimLocked();
        this->current_ = std::move(this->future.back());
        this->future.pop_back();
        installed = this->current_;
    }
    this->notify(std::nullopt, installed);
    return true;
}

auto StateTracker::canUndo() const -> bool {
    std::shared_lock lock(this->mutex);
    return !this->past.empty();
}

auto StateTracker::canRedo() const -> bool {
    std::shared_lock lock(this->mutex);
    return !this->future.empty();
}

auto StateTracker::history() const -> std::vector<Snapshot> {
    std::shared_lock lock(this->mutex);
    return {this->past.begin(), this->past.end()};
}

auto StateTracker::clearHistory() -> void {
    std::unique_lock lock(this->mutex);
    this->past.clear();
    this->future.clear();
}

auto StateTracker::clearFuture() -> void {
    std::unique_lock lock(this->mutex);
    this->future.clear();
}

auto StateTracker::historySize() const -> std::size_t {
    std::shared_lock lock(this->mutex);
    return this->past.size();
}

auto StateTracker::futureSize() const -> std::size_t {
    std::shared_lock lock(this->mutex);
    return this->future.size();
}

auto StateTracker::maxHistory() const -> std::size_t {
    std::shared_lock lock(this->mutex);
    return this->maxHistory_;
}

auto StateTracker::setMaxHistory(std::size_t max) -> void {
    std::unique_lock lock(this->mutex);
    this->maxHistory_ = max;
    this->trimLocked();
}

auto StateTracker::setComponentState(std::string const& id, Json state) -> void {
    std::unique_lock lock(this->mutex);
    auto& component = this->current_.components[id];
    component.id    = id;
    component.state = std::move(state);
}

auto StateTracker::componentState(std::string const& id) const -> std::optional<Json> {
    std::shared_lock lock(this->mutex);
    if (auto const* component = this->current_.component(id))
        return component->state;
    return std::nullopt;
}

auto StateTracker::setFocusPath(FocusPath path) -> void {
    std::unique_lock lock(this->mutex);
    this->current_.focusPath = std::move(path);
}

auto StateTracker::focusPath() const -> FocusPath {
    std::shared_lock lock(this->mutex);
    return this->current_.focusPath;
}

auto StateTracker::subscribe(Listener listener) -> SubscriptionId {
    std::lock_guard lock(this->listenerMutex);
    auto id = this->nextSubscription++;
    this->listeners.push_back(Subscription{id, std::move(listener)});
    return id;
}

auto StateTracker::unsubscribe(SubscriptionId id) -> bool {
    std::lock_guard lock(this->listenerMutex);
    auto it = std::find_if(this->listeners.begin(), this->listeners.end(), [id](Subscription const& s) { return s.id == id; });
    if (it == this->listeners.end())
        return false;
    this->listeners.erase(it);
    return true;
}

auto StateTracker::trimLocked() -> void {
    while (this->past.size() > this->maxHistory_)
        this->past.pop_front();
}

auto StateTracker::notify(std::optional<Snapshot> const& old, Snapshot const& current) -> void {
    std::vector<Subscription> copy;
    {
        std::lock_guard lock(this->listenerMutex);
        copy = this->listeners;
    }
    for (auto const& subscription : copy)
        subscription.listener(old, current);
}

} // namespace TS
