#pragma once
#include <termspace/automation/Controller.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace TS {

// One step of a scripted automation sequence.
class Operation {
public:
    virtual ~Operation()                                   = default;
    virtual auto execute(Controller& controller) -> Expected<void> = 0;
};

using OperationPtr = std::shared_ptr<Operation>;

class ClickOperation final : public Operation {
public:
    explicit ClickOperation(std::string id) : componentId(std::move(id)) {}
    auto execute(Controller& controller) -> Expected<void> override;

private:
    std::string componentId;
};

class InputOperation final : public Operation {
public:
    InputOperation(std::string id, std::string text) : componentId(std::move(id)), text(std::move(text)) {}
    auto execute(Controller& controller) -> Expected<void> override;

private:
    std::string componentId;
    std::string text;
};

class NavigateOperation final : public Operation {
public:
    explicit NavigateOperation(NavigateTo direction) : direction(direction) {}
    auto execute(Controller& controller) -> Expected<void> override;

private:
    NavigateTo direction;
};

class WaitOperation final : public Operation {
public:
    WaitOperation(Controller::Condition condition, std::chrono::milliseconds timeout)
        : condition(std::move(condition)), timeout(timeout) {}
    auto execute(Controller& controller) -> Expected<void> override;

private:
    Controller::Condition     condition;
    std::chrono::milliseconds timeout;
};

// The action is built when the step runs, not when the sequence is assembled.
class DispatchOperation final : public Operation {
public:
    explicit DispatchOperation(std::function<Action()> make) : make(std::move(make)) {}
    auto execute(Controller& controller) -> Expected<void> override;

private:
    std::function<Action()> make;
};

/**
 * Runs its children in order. An atomic batch puts the UI back to the
 * state it had before the batch when a child fails; the failure is returned
 * as ActionFailed with the child error as cause.
 */
class BatchOperation final : public Operation {
public:
    BatchOperation(bool atomic, std::vector<OperationPtr> ops) : atomic(atomic), ops(std::move(ops)) {}
    auto execute(Controller& controller) -> Expected<void> override;

private:
    bool                      atomic;
    std::vector<OperationPtr> ops;
};

class RepeatOperation final : public Operation {
public:
    RepeatOperation(OperationPtr op, int count, std::chrono::milliseconds delay = {})
        : op(std::move(op)), count(count), delay(delay) {}
    auto execute(Controller& controller) -> Expected<void> override;

private:
    OperationPtr              op;
    int                       count;
    std::chrono::milliseconds delay;
};

class RetryOperation final : public Operation {
public:
    using ShouldRetry = std::function<bool(Error const&)>;

    RetryOperation(OperationPtr op, int maxAttempts, std::chrono::milliseconds delay, ShouldRetry shouldRetry = {})
        : op(std::move(op)), maxAttempts(maxAttempts), delay(delay), shouldRetry(std::move(shouldRetry)) {}
    auto execute(Controller& controller) -> Expected<void> override;

private:
    OperationPtr              op;
    int                       maxAttempts;
    std::chrono::milliseconds delay;
    ShouldRetry               shouldRetry;
};

namespace Ops {

[[nodiscard]] auto click(std::string id) -> OperationPtr;
[[nodiscard]] auto input(std::string id, std::string text) -> OperationPtr;
[[nodiscard]] auto navigate(NavigateTo direction) -> OperationPtr;
[[nodiscard]] auto wait(Controller::Condition condition, std::chrono::milliseconds timeout) -> OperationPtr;
[[nodiscard]] auto waitValue(std::string id, std::string key, Json expected, std::chrono::milliseconds timeout) -> OperationPtr;
[[nodiscard]] auto dispatch(std::function<Action()> make) -> OperationPtr;
[[nodiscard]] auto batch(std::vector<OperationPtr> ops) -> OperationPtr;
[[nodiscard]] auto atomicBatch(std::vector<OperationPtr> ops) -> OperationPtr;

} // namespace Ops

} // namespace TS
