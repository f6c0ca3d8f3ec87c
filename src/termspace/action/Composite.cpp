#include <termspace/action/Composite.hpp>
#include <termspace/action/Dispatcher.hpp>

#include "log/TaggedLogger.hpp"

#include <exception>
#include <semaphore>

namespace TS {

namespace {

class FunctionHandler final : public ActionHandler {
public:
    explicit FunctionHandler(std::function<ActionResult(CancellationContext const&)> fn) : fn(std::move(fn)) {}

    auto execute(CancellationContext const& ctx) -> ActionResult override {
        if (!this->fn)
            return ActionResult::failure(Error{Error::Code::InvalidError, "empty action function"});
        return this->fn(ctx);
    }

private:
    std::function<ActionResult(CancellationContext const&)> fn;
};

class DispatchHandler final : public ActionHandler {
public:
    DispatchHandler(Dispatcher& dispatcher, Action action) : dispatcher(dispatcher), action(std::move(action)) {}

    auto execute(CancellationContext const& ctx) -> ActionResult override {
        if (auto err = ctx.err())
            return ActionResult::failure(*err);
        if (auto result = this->dispatcher.tryDispatch(this->action); !result)
            return ActionResult::failure(result.error());
        return ActionResult::success(this->action.toString());
    }

private:
    Dispatcher& dispatcher;
    Action      action;
};

auto canceledResult() -> ActionResult {
    return ActionResult::failure(Error{Error::Code::Canceled, "action canceled"});
}

auto isRecoverable(Error const& error) -> bool {
    return error.code == Error::Code::Canceled || error.code == Error::Code::Timeout;
}

// Task boundary: exceptions escaping a handler become failed results.
auto runUnit(ActionHandlerPtr const& handler, CancellationContext const& ctx) -> ActionResult {
    if (!handler)
        return ActionResult::failure(Error{Error::Code::InvalidError, "null action handler"});
    try {
        return handler->execute(ctx);
    } catch (std::exception const& e) {
        ts_log(std::string("action handler threw: ") + e.what(), "Composite", "Error");
        return ActionResult::failure(Error{Error::Code::ActionFailed, std::string("action threw: ") + e.what()});
    } catch (...) {
        ts_log("action handler threw a non-standard exception", "Composite", "Error");
        return ActionResult::failure(Error{Error::Code::ActionFailed, "action threw a non-standard exception"});
    }
}

auto errorOf(ActionResult const& result) -> Error {
    if (result.error)
        return *result.error;
    return Error{Error::Code::ActionFailed, result.message.empty() ? "action failed" : result.message};
}

} // namespace

auto ActionResult::success(std::string message) -> ActionResult {
    ActionResult result;
    result.ok      = true;
    result.message = std::move(message);
    return result;
}

auto ActionResult::failure(Error error) -> ActionResult {
    ActionResult result;
    result.ok      = false;
    result.message = error.message.value_or(std::string{});
    result.error   = std::move(error);
    return result;
}

auto makeHandler(std::function<ActionResult(CancellationContext const&)> fn) -> ActionHandlerPtr {
    return std::make_shared<FunctionHandler>(std::move(fn));
}

auto makeDispatchHandler(Dispatcher& dispatcher, Action action) -> ActionHandlerPtr {
    return std::make_shared<DispatchHandler>(dispatcher, std::move(action));
}

auto aggregateResults(std::vector<ActionResult> const& results) -> ActionResult {
    std::vector<Error> errors;
    for (auto const& result : results) {
        if (!result.ok)
            errors.push_back(errorOf(result));
    }
    if (errors.empty())
        return ActionResult::success();
    if (errors.size() == 1)
        return ActionResult::failure(std::move(errors.front()));
    auto message = std::to_string(errors.size()) + " errors occurred, first: " + describeError(errors.front());
    return ActionResult::failure(Error{Error::Code::Composite, std::move(message), std::move(errors)});
}

CompositeAction::CompositeAction(Mode mode, std::vector<ActionHandlerPtr> handlers, Callback callback)
    : runMode(mode), handlers(std::move(handlers)), callback(std::move(callback)) {}

auto CompositeAction::cancel() -> void {
    this->canceled = true;
    std::lock_guard<std::mutex> lock(this->runningMutex);
    if (this->running)
        this->running->cancel();
}

auto CompositeAction::isCanceled() const -> bool {
    return this->canceled.load();
}

auto CompositeAction::execute(CancellationContext const& ctx) -> ActionResult {
    if (this->canceled)
        return canceledResult();

    auto runCtx = ctx.withCancel();
    {
        std::lock_guard<std::mutex> lock(this->runningMutex);
        this->running = runCtx;
    }

    auto results = this->runMode == Mode::Sequential ? this->executeSequential(runCtx) : this->executeConcurrent(runCtx);

    {
        std::lock_guard<std::mutex> lock(this->runningMutex);
        this->running.reset();
    }
    if (this->callback)
        this->callback(results);
    return aggregateResults(results);
}

auto CompositeAction::executeSequential(CancellationContext const& ctx) -> std::vector<ActionResult> {
    std::vector<ActionResult> results;
    results.reserve(this->handlers.size());
    for (auto const& handler : this->handlers) {
        if (this->canceled || ctx.isCanceled()) {
            ts_log("CompositeAction sequential run canceled", "Composite");
            results.push_back(canceledResult());
            break;
        }
        auto result = runUnit(handler, ctx);
        bool stop   = !result.ok && !isRecoverable(errorOf(result));
        results.push_back(std::move(result));
        if (stop)
            break;
    }
    return results;
}

auto CompositeAction::executeConcurrent(CancellationContext const& ctx) -> std::vector<ActionResult> {
    std::vector<ActionResult> results(this->handlers.size());
    {
        std::vector<std::jthread> workers;
        workers.reserve(this->handlers.size());
        for (std::size_t i = 0; i < this->handlers.size(); ++i) {
            workers.emplace_back([this, &results, &ctx, i] {
                if (this->canceled || ctx.isCanceled()) {
                    results[i] = canceledResult();
                    return;
                }
                results[i] = runUnit(this->handlers[i], ctx);
            });
        }
        // jthread joins on destruction: this scope is the wait barrier.
    }
    return results;
}

auto batch(std::vector<ActionHandlerPtr> handlers) -> std::shared_ptr<CompositeAction> {
    return std::make_shared<CompositeAction>(CompositeAction::Mode::Concurrent, std::move(handlers));
}

auto sequence(std::vector<ActionHandlerPtr> handlers) -> std::shared_ptr<CompositeAction> {
    return std::make_shared<CompositeAction>(CompositeAction::Mode::Sequential, std::move(handlers));
}

auto batchWithCallback(std::vector<ActionHandlerPtr> handlers, CompositeAction::Callback callback) -> std::shared_ptr<CompositeAction> {
    return std::make_shared<CompositeAction>(CompositeAction::Mode::Concurrent, std::move(handlers), std::move(callback));
}

auto parallelWithLimit(CancellationContext const& ctx, std::size_t limit, std::vector<ActionHandlerPtr> const& handlers) -> ActionResult {
    if (limit == 0)
        limit = 1;
    std::counting_semaphore<> slots(static_cast<std::ptrdiff_t>(limit));
    std::vector<ActionResult> results(handlers.size());
    {
        std::vector<std::jthread> workers;
        workers.reserve(handlers.size());
        for (std::size_t i = 0; i < handlers.size(); ++i) {
            workers.emplace_back([&, i] {
                while (!slots.try_acquire_for(std::chrono::milliseconds{10})) {
                    if (ctx.isCanceled()) {
                        results[i] = canceledResult();
                        return;
                    }
                }
                if (ctx.isCanceled())
                    results[i] = canceledResult();
                else
                    results[i] = runUnit(handlers[i], ctx);
                slots.release();
            });
        }
    }

    std::vector<Error> errors;
    for (auto const& result : results) {
        if (!result.ok)
            errors.push_back(errorOf(result));
    }
    if (errors.empty())
        return ActionResult::success();
    return ActionResult::failure(Error{Error::Code::Composite, "some actions failed", std::move(errors)});
}

RetryAction::RetryAction(ActionHandlerPtr handler, int maxRetries, std::chrono::milliseconds delay)
    : handler(std::move(handler)), maxRetries(maxRetries < 0 ? 0 : maxRetries), delay(delay) {}

auto RetryAction::execute(CancellationContext const& ctx) -> ActionResult {
    std::optional<Error> last;
    for (int attempt = 0; attempt <= this->maxRetries; ++attempt) {
        if (attempt > 0 && !ctx.waitFor(this->delay))
            return ActionResult::failure(ctx.err().value_or(Error{Error::Code::Canceled, "action canceled"}));
        if (auto err = ctx.err())
            return ActionResult::failure(*err);

        this->lastAttempts = attempt + 1;
        auto result        = runUnit(this->handler, ctx);
        if (result.ok)
            return result;
        last = errorOf(result);
        ts_log("RetryAction attempt " + std::to_string(attempt + 1) + " failed: " + describeError(*last), "Composite");
    }
    auto message = "after " + std::to_string(this->maxRetries) + " retries: " + describeError(*last);
    auto code    = last->code;
    return ActionResult::failure(Error{code, std::move(message), {std::move(*last)}});
}

TimeoutAction::TimeoutAction(ActionHandlerPtr handler, std::chrono::milliseconds timeout)
    : handler(std::move(handler)), timeout(timeout) {}

auto TimeoutAction::execute(CancellationContext const& ctx) -> ActionResult {
    struct Race {
        std::mutex                  mutex;
        std::condition_variable     cv;
        std::optional<ActionResult> result;
    };

    auto race = std::make_shared<Race>();
    std::thread([race, handler = this->handler, ctx] {
        auto result = runUnit(handler, ctx);
        std::lock_guard<std::mutex> lock(race->mutex);
        race->result = std::move(result);
        race->cv.notify_all();
    }).detach();

    std::unique_lock<std::mutex> lock(race->mutex);
    if (!race->cv.wait_for(lock, this->timeout, [&race] { return race->result.has_value(); })) {
        ts_log("TimeoutAction expired; task orphaned", "Composite");
        return ActionResult::failure(
                Error{Error::Code::Timeout, "action timeout after " + std::to_string(this->timeout.count()) + "ms"});
    }
    return *race->result;
}

FallbackAction::FallbackAction(ActionHandlerPtr primary, ActionHandlerPtr secondary)
    : primary(std::move(primary)), secondary(std::move(secondary)) {}

auto FallbackAction::execute(CancellationContext const& ctx) -> ActionResult {
    auto result = runUnit(this->primary, ctx);
    if (result.ok || !this->secondary)
        return result;
    return runUnit(this->secondary, ctx);
}

LazyAction::LazyAction(Factory factory) : factory(std::move(factory)) {}

auto LazyAction::execute(CancellationContext const& ctx) -> ActionResult {
    if (!this->factory)
        return ActionResult::failure(Error{Error::Code::InvalidError, "lazy action has no factory"});
    auto built = this->factory();
    if (!built)
        return ActionResult::failure(Error{Error::Code::ActionFailed, "lazy action factory returned nothing"});
    return runUnit(built, ctx);
}

WorkerPool::WorkerPool(std::size_t workerCount, std::size_t queueCapacity) : capacity(queueCapacity == 0 ? 1 : queueCapacity) {
    if (workerCount == 0)
        workerCount = 1;
    for (std::size_t i = 0; i < workerCount; ++i)
        this->workers.emplace_back(&WorkerPool::workerFunction, this);
    ts_log("WorkerPool constructed with workers=" + std::to_string(workerCount), "Composite");
}

WorkerPool::~WorkerPool() {
    this->stop();
}

auto WorkerPool::submit(ActionHandlerPtr handler, Completion done) -> std::optional<Error> {
    std::lock_guard<std::mutex> lock(this->mutex);
    if (this->shuttingDown)
        return Error{Error::Code::NotAllowed, "worker pool stopped"};
    if (this->jobs.size() >= this->capacity)
        return Error{Error::Code::CapacityExceeded, "worker pool queue is full"};
    this->jobs.push(Job{std::move(handler), std::move(done)});
    this->jobCV.notify_one();
    return std::nullopt;
}

auto WorkerPool::submitWithTimeout(ActionHandlerPtr handler, std::chrono::milliseconds timeout, Completion done) -> std::optional<Error> {
    std::unique_lock<std::mutex> lock(this->mutex);
    bool room = this->spaceCV.wait_for(lock, timeout, [this] { return this->shuttingDown || this->jobs.size() < this->capacity; });
    if (this->shuttingDown)
        return Error{Error::Code::NotAllowed, "worker pool stopped"};
    if (!room)
        return Error{Error::Code::Timeout, "worker pool submit timed out"};
    this->jobs.push(Job{std::move(handler), std::move(done)});
    this->jobCV.notify_one();
    return std::nullopt;
}

auto WorkerPool::stop() -> void {
    {
        std::lock_guard<std::mutex> lock(this->mutex);
        if (this->shuttingDown && this->workers.empty())
            return;
        this->shuttingDown = true;
        this->jobCV.notify_all();
        this->spaceCV.notify_all();
    }
    for (auto& worker : this->workers) {
        if (worker.joinable())
            worker.join();
    }
    this->workers.clear();
    this->context.cancel();
    ts_log("WorkerPool stopped", "Composite");
}

auto WorkerPool::pending() const -> std::size_t {
    std::lock_guard<std::mutex> lock(this->mutex);
    return this->jobs.size();
}

auto WorkerPool::workerFunction() -> void {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(this->mutex);
            this->jobCV.wait(lock, [this] { return this->shuttingDown || !this->jobs.empty(); });
            if (this->shuttingDown && this->jobs.empty())
                break;
            job = std::move(this->jobs.front());
            this->jobs.pop();
            this->spaceCV.notify_one();
        }
        auto result = runUnit(job.handler, this->context);
        if (job.done)
            job.done(std::move(result));
    }
}

} // namespace TS
