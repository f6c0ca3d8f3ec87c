#pragma once
#include <termspace/action/Action.hpp>
#include <termspace/core/CancellationContext.hpp>
#include <termspace/core/Error.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <thread>
#include <vector>

namespace TS {

class Dispatcher;

struct ActionResult {
    bool                 ok = true;
    std::optional<Error> error;
    std::string          message;
    nlohmann::json       data;

    [[nodiscard]] static auto success(std::string message = {}) -> ActionResult;
    [[nodiscard]] static auto failure(Error error) -> ActionResult;
};

// One unit of work inside a composite. Implementations should check the
// context before doing anything expensive.
class ActionHandler {
public:
    virtual ~ActionHandler() = default;
    virtual auto execute(CancellationContext const& ctx) -> ActionResult = 0;
};

using ActionHandlerPtr = std::shared_ptr<ActionHandler>;

[[nodiscard]] auto makeHandler(std::function<ActionResult(CancellationContext const&)> fn) -> ActionHandlerPtr;

// Dispatches a concrete Action; unhandled actions fail with NotSupported.
[[nodiscard]] auto makeDispatchHandler(Dispatcher& dispatcher, Action action) -> ActionHandlerPtr;

/**
 * Runs a list of handlers either one after another or all at once.
 *
 * Sequential: the context and the cancel flag are checked before each unit;
 * the first non-recoverable failure stops the run. Canceled and Timeout
 * failures count as recoverable.
 *
 * Concurrent: every unit gets its own thread and a child context; the call
 * returns once all of them finished. Failures aggregate into one Composite
 * error whose first cause is the earliest failing unit.
 */
class CompositeAction : public ActionHandler {
public:
    enum class Mode {
        Sequential,
        Concurrent
    };

    using Callback = std::function<void(std::vector<ActionResult> const&)>;

    CompositeAction(Mode mode, std::vector<ActionHandlerPtr> handlers, Callback callback = {});

    auto execute(CancellationContext const& ctx) -> ActionResult override;

    auto cancel() -> void;
    [[nodiscard]] auto isCanceled() const -> bool;
    [[nodiscard]] auto mode() const -> Mode { return this->runMode; }
    [[nodiscard]] auto size() const -> std::size_t { return this->handlers.size(); }

private:
    auto executeSequential(CancellationContext const& ctx) -> std::vector<ActionResult>;
    auto executeConcurrent(CancellationContext const& ctx) -> std::vector<ActionResult>;

    Mode                          runMode;
    std::vector<ActionHandlerPtr> handlers;
    Callback                      callback;
    std::atomic<bool>             canceled{false};

    std::mutex                         runningMutex;
    std::optional<CancellationContext> running;
};

[[nodiscard]] auto batch(std::vector<ActionHandlerPtr> handlers) -> std::shared_ptr<CompositeAction>;
[[nodiscard]] auto sequence(std::vector<ActionHandlerPtr> handlers) -> std::shared_ptr<CompositeAction>;
[[nodiscard]] auto batchWithCallback(std::vector<ActionHandlerPtr> handlers, CompositeAction::Callback callback)
        -> std::shared_ptr<CompositeAction>;

// Folds unit results into one: ok, the single error, or a Composite error.
[[nodiscard]] auto aggregateResults(std::vector<ActionResult> const& results) -> ActionResult;

// Runs every handler with at most `limit` in flight at once.
[[nodiscard]] auto parallelWithLimit(CancellationContext const& ctx, std::size_t limit, std::vector<ActionHandlerPtr> const& handlers)
        -> ActionResult;

class RetryAction : public ActionHandler {
public:
    RetryAction(ActionHandlerPtr handler, int maxRetries, std::chrono::milliseconds delay);
    auto execute(CancellationContext const& ctx) -> ActionResult override;
    [[nodiscard]] auto attempts() const -> int { return this->lastAttempts.load(); }

private:
    ActionHandlerPtr          handler;
    int                       maxRetries;
    std::chrono::milliseconds delay;
    std::atomic<int>          lastAttempts{0};
};

// Races the wrapped handler against a deadline. On timeout the handler keeps
// running on its own thread; its result is discarded.
class TimeoutAction : public ActionHandler {
public:
    TimeoutAction(ActionHandlerPtr handler, std::chrono::milliseconds timeout);
    auto execute(CancellationContext const& ctx) -> ActionResult override;

private:
    ActionHandlerPtr          handler;
    std::chrono::milliseconds timeout;
};

class FallbackAction : public ActionHandler {
public:
    FallbackAction(ActionHandlerPtr primary, ActionHandlerPtr secondary);
    auto execute(CancellationContext const& ctx) -> ActionResult override;

private:
    ActionHandlerPtr primary;
    ActionHandlerPtr secondary;
};

class LazyAction : public ActionHandler {
public:
    using Factory = std::function<ActionHandlerPtr()>;

    explicit LazyAction(Factory factory);
    auto execute(CancellationContext const& ctx) -> ActionResult override;

private:
    Factory factory;
};

/**
 * Fixed set of workers draining a bounded job queue.
 *
 * submit() never blocks: a full queue is reported as CapacityExceeded.
 * submitWithTimeout() waits up to the timeout for room. stop() lets workers
 * finish the queued jobs, then joins them.
 */
class WorkerPool {
public:
    using Completion = std::function<void(ActionResult)>;

    explicit WorkerPool(std::size_t workerCount, std::size_t queueCapacity = 100);
    ~WorkerPool();

    WorkerPool(WorkerPool const&)                    = delete;
    auto operator=(WorkerPool const&) -> WorkerPool& = delete;

    auto submit(ActionHandlerPtr handler, Completion done = {}) -> std::optional<Error>;
    auto submitWithTimeout(ActionHandlerPtr handler, std::chrono::milliseconds timeout, Completion done = {}) -> std::optional<Error>;
    auto stop() -> void;

    [[nodiscard]] auto pending() const -> std::size_t;
    [[nodiscard]] auto size() const -> std::size_t { return this->workers.size(); }

private:
    struct Job {
        ActionHandlerPtr handler;
        Completion       done;
    };

    auto workerFunction() -> void;

    std::vector<std::jthread> workers;
    std::queue<Job>           jobs;
    std::size_t               capacity;
    mutable std::mutex        mutex;
    std::condition_variable   jobCV;
    std::condition_variable   spaceCV;
    std::atomic<bool>         shuttingDown{false};
    CancellationContext       context;
};

} // namespace TS
