#include <termspace/core/CancellationContext.hpp>

#include <condition_variable>
#include <functional>
#include <mutex>

namespace TS {

struct CancellationContext::State {
    std::stop_source                                        source;
    std::optional<TimePoint>                                deadline;
    std::shared_ptr<State>                                  parent;
    std::unique_ptr<std::stop_callback<std::function<void()>>> parentLink;
    std::string                                             key;
    std::any                                                value;
    bool                                                    hasValue = false;
    std::mutex                                              mutex;
    std::condition_variable_any                             cv;
};

CancellationContext::CancellationContext() : state(std::make_shared<State>()) {}

CancellationContext::CancellationContext(std::shared_ptr<State> state) : state(std::move(state)) {}

auto CancellationContext::cancel() const -> void {
    if (this->state->source.request_stop()) {
        std::lock_guard<std::mutex> lock(this->state->mutex);
        this->state->cv.notify_all();
    }
}

auto CancellationContext::isCanceled() const -> bool {
    return this->err().has_value();
}

auto CancellationContext::err() const -> std::optional<Error> {
    if (this->state->source.stop_requested())
        return Error{Error::Code::Canceled, "context canceled"};
    if (this->state->deadline && Clock::now() >= *this->state->deadline)
        return Error{Error::Code::Timeout, "context deadline exceeded"};
    return std::nullopt;
}

auto CancellationContext::deadline() const -> std::optional<TimePoint> {
    return this->state->deadline;
}

auto CancellationContext::token() const -> std::stop_token {
    return this->state->source.get_token();
}

auto CancellationContext::makeChild(std::optional<TimePoint> when) const -> CancellationContext {
    auto child    = std::make_shared<State>();
    child->parent = this->state;

    child->deadline = this->state->deadline;
    if (when && (!child->deadline || *when < *child->deadline))
        child->deadline = when;

    std::weak_ptr<State> weakChild = child;
    child->parentLink = std::make_unique<std::stop_callback<std::function<void()>>>(
            this->state->source.get_token(), std::function<void()>{[weakChild] {
                if (auto locked = weakChild.lock()) {
                    locked->source.request_stop();
                    std::lock_guard<std::mutex> lock(locked->mutex);
                    locked->cv.notify_all();
                }
            }});
    return CancellationContext{std::move(child)};
}

auto CancellationContext::withCancel() const -> CancellationContext {
    return this->makeChild(std::nullopt);
}

auto CancellationContext::withTimeout(Clock::duration timeout) const -> CancellationContext {
    return this->makeChild(Clock::now() + timeout);
}

auto CancellationContext::withDeadline(TimePoint when) const -> CancellationContext {
    return this->makeChild(when);
}

auto CancellationContext::withValue(std::string key, std::any value) const -> CancellationContext {
    auto child      = this->makeChild(std::nullopt);
    child.state->key      = std::move(key);
    child.state->value    = std::move(value);
    child.state->hasValue = true;
    return child;
}

auto CancellationContext::value(std::string const& key) const -> std::optional<std::any> {
    for (auto current = this->state; current; current = current->parent) {
        if (current->hasValue && current->key == key)
            return current->value;
    }
    return std::nullopt;
}

auto CancellationContext::waitFor(Clock::duration duration) const -> bool {
    auto until = Clock::now() + duration;
    if (this->state->deadline && *this->state->deadline < until)
        until = *this->state->deadline;

    std::unique_lock<std::mutex> lock(this->state->mutex);
    this->state->cv.wait_until(lock, this->state->source.get_token(), until, [] { return false; });
    lock.unlock();
    return !this->isCanceled();
}

} // namespace TS
