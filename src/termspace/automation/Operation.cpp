#include <termspace/automation/Operation.hpp>

#include <termspace/runtime/Runtime.hpp>

#include "log/TaggedLogger.hpp"

#include <thread>

namespace TS {

auto ClickOperation::execute(Controller& controller) -> Expected<void> {
    return controller.click(this->componentId);
}

auto InputOperation::execute(Controller& controller) -> Expected<void> {
    return controller.input(this->componentId, this->text);
}

auto NavigateOperation::execute(Controller& controller) -> Expected<void> {
    return controller.navigate(this->direction);
}

auto WaitOperation::execute(Controller& controller) -> Expected<void> {
    return controller.waitUntil(this->condition, this->timeout);
}

auto DispatchOperation::execute(Controller& controller) -> Expected<void> {
    if (!this->make)
        return std::unexpected(Error{Error::Code::InvalidPayload, "dispatch operation without an action"});
    return controller.dispatch(this->make());
}

auto BatchOperation::execute(Controller& controller) -> Expected<void> {
    auto const before = controller.inspect();
    for (auto const& op : this->ops) {
        if (!op)
            continue;
        auto done = op->execute(controller);
        if (done)
            continue;
        if (!this->atomic)
            return done;

        ts_log("Atomic batch failed, rolling back: " + describeError(done.error()), "Automation");
        auto& runtime = controller.runtime();
        runtime.transact([&] { runtime.applySnapshot(before); });
        return std::unexpected(Error{Error::Code::ActionFailed, "batch operation failed", {done.error()}});
    }
    return {};
}

auto RepeatOperation::execute(Controller& controller) -> Expected<void> {
    if (!this->op)
        return {};
    for (int i = 0; i < this->count; ++i) {
        if (auto done = this->op->execute(controller); !done)
            return std::unexpected(Error{Error::Code::ActionFailed, "repeat failed at iteration " + std::to_string(i), {done.error()}});
        if (this->delay.count() > 0 && i + 1 < this->count)
            std::this_thread::sleep_for(this->delay);
    }
    return {};
}

auto RetryOperation::execute(Controller& controller) -> Expected<void> {
    if (!this->op || this->maxAttempts <= 0)
        return std::unexpected(Error{Error::Code::InvalidPayload, "retry operation needs an operation and at least one attempt"});

    std::optional<Error> last;
    for (int attempt = 0; attempt < this->maxAttempts; ++attempt) {
        auto done = this->op->execute(controller);
        if (done)
            return {};
        last = done.error();
        if (this->shouldRetry && !this->shouldRetry(*last))
            break;
        if (attempt + 1 < this->maxAttempts)
            std::this_thread::sleep_for(this->delay);
    }
    return std::unexpected(Error{Error::Code::ActionFailed, "retry failed after " + std::to_string(this->maxAttempts) + " attempts", {*last}});
}

namespace Ops {

auto click(std::string id) -> OperationPtr {
    return std::make_shared<ClickOperation>(std::move(id));
}

auto input(std::string id, std::string text) -> OperationPtr {
    return std::make_shared<InputOperation>(std::move(id), std::move(text));
}

auto navigate(NavigateTo direction) -> OperationPtr {
    return std::make_shared<NavigateOperation>(direction);
}

auto wait(Controller::Condition condition, std::chrono::milliseconds timeout) -> OperationPtr {
    return std::make_shared<WaitOperation>(std::move(condition), timeout);
}

auto waitValue(std::string id, std::string key, Json expected, std::chrono::milliseconds timeout) -> OperationPtr {
    auto condition = [id = std::move(id), key = std::move(key), expected = std::move(expected)](Snapshot const& snapshot) {
        auto const* component = snapshot.component(id);
        if (component == nullptr || !component->state.is_object())
            return false;
        auto it = component->state.find(key);
        return it != component->state.end() && *it == expected;
    };
    return std::make_shared<WaitOperation>(std::move(condition), timeout);
}

auto dispatch(std::function<Action()> make) -> OperationPtr {
    return std::make_shared<DispatchOperation>(std::move(make));
}

auto batch(std::vector<OperationPtr> ops) -> OperationPtr {
    return std::make_shared<BatchOperation>(false, std::move(ops));
}

auto atomicBatch(std::vector<OperationPtr> ops) -> OperationPtr {
    return std::make_shared<BatchOperation>(true, std::move(ops));
}

} // namespace Ops

} // namespace TS
