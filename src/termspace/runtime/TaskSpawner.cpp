#include <termspace/runtime/Recovery.hpp>
#include <termspace/runtime/TaskSpawner.hpp>

#include "log/TaggedLogger.hpp"

namespace TS {

TaskSpawner::TaskSpawner(CancellationContext parent, Recovery* recovery)
    : ctx(parent.withCancel()), recovery(recovery) {}

TaskSpawner::~TaskSpawner() {
    if (auto result = this->shutdown(std::chrono::milliseconds{1000}); !result)
        ts_log("TaskSpawner destroyed with running tasks: " + describeError(result.error()), "TaskSpawner");
}

auto TaskSpawner::spawn(std::string name, Task task) -> Expected<TaskId> {
    std::lock_guard lock(this->entriesMutex);
    if (this->closed)
        return std::unexpected(Error{Error::Code::NotAllowed, "task spawner is shut down"});
    if (this->ctx.isCanceled())
        return std::unexpected(Error{Error::Code::Canceled, "context canceled"});

    auto const id = this->nextId++;
    {
        std::lock_guard sharedLock(this->shared->mutex);
        ++this->shared->active;
    }

    auto shared   = this->shared;
    auto context  = this->ctx;
    auto recovery = this->recovery;
    std::thread thread([shared, context, recovery, name, task = std::move(task)]() {
#if defined(TS_LOG_DEBUG)
        set_thread_name(name);
#endif
        ts_log("Task started: " + name, "TaskSpawner");
        try {
            task(context);
        } catch (...) {
            if (recovery != nullptr) {
                recovery->handle(std::current_exception(), "task " + name);
            } else {
                ts_log("Task " + name + " failed: " + Recovery::describe(std::current_exception()), "TaskSpawner", "Error");
            }
        }
        ts_log("Task finished: " + name, "TaskSpawner");
        {
            std::lock_guard sharedLock(shared->mutex);
            --shared->active;
        }
        shared->exited.notify_all();
    });
    this->entries.push_back(Entry{id, std::move(name), std::move(thread)});
    return id;
}

auto TaskSpawner::shutdown(std::chrono::milliseconds timeout) -> Expected<void> {
    std::vector<Entry> toJoin;
    {
        std::lock_guard lock(this->entriesMutex);
        this->closed = true;
        toJoin.swap(this->entries);
    }
    this->ctx.cancel();

    std::size_t leftover = 0;
    {
        std::unique_lock sharedLock(this->shared->mutex);
        this->shared->exited.wait_for(sharedLock, timeout, [&] { return this->shared->active == 0; });
        leftover = this->shared->active;
    }

    if (leftover == 0) {
        for (auto& entry : toJoin)
            if (entry.thread.joinable())
                entry.thread.join();
        return {};
    }

    // Threads may finish between the wait and here; a late joiner would block,
    // so everything is detached once the deadline has passed.
    for (auto& entry : toJoin)
        if (entry.thread.joinable())
            entry.thread.detach();
    ts_log("TaskSpawner shutdown timed out with " + std::to_string(leftover) + " running", "TaskSpawner");
    return std::unexpected(Error{Error::Code::Timeout, "shutdown timed out with " + std::to_string(leftover) + " tasks running"});
}

auto TaskSpawner::running() const -> std::size_t {
    std::lock_guard sharedLock(this->shared->mutex);
    return this->shared->active;
}

auto TaskSpawner::spawned() const -> std::size_t {
    std::lock_guard lock(this->entriesMutex);
    return static_cast<std::size_t>(this->nextId - 1);
}

} // namespace TS
