#pragma once
#include <termspace/core/CancellationContext.hpp>
#include <termspace/core/Error.hpp>

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace TS {

class Recovery;

/**
 * Runs caller tasks on dedicated threads under one cancellation context.
 *
 * Tasks observe cancellation through the context they are handed. A fault
 * escaping a task is routed to the Recovery layer when one is attached and
 * logged otherwise. shutdown() cancels the context and waits; tasks still
 * running at the deadline are detached and reported as a Timeout error.
 */
class TaskSpawner {
public:
    using TaskId = std::uint64_t;
    using Task   = std::function<void(CancellationContext const&)>;

    explicit TaskSpawner(CancellationContext parent = CancellationContext{}, Recovery* recovery = nullptr);
    ~TaskSpawner();

    TaskSpawner(TaskSpawner const&)                    = delete;
    auto operator=(TaskSpawner const&) -> TaskSpawner& = delete;

    auto spawn(std::string name, Task task) -> Expected<TaskId>;
    auto shutdown(std::chrono::milliseconds timeout) -> Expected<void>;

    [[nodiscard]] auto running() const -> std::size_t;
    [[nodiscard]] auto spawned() const -> std::size_t;
    [[nodiscard]] auto context() const -> CancellationContext { return this->ctx; }
    [[nodiscard]] auto isCanceled() const -> bool { return this->ctx.isCanceled(); }

private:
    // Shared with the task threads so a detached straggler never touches a
    // destroyed spawner.
    struct Shared {
        std::mutex              mutex;
        std::condition_variable exited;
        std::size_t             active = 0;
    };

    struct Entry {
        TaskId      id;
        std::string name;
        std::thread thread;
    };

    CancellationContext     ctx;
    Recovery*               recovery;
    std::shared_ptr<Shared> shared = std::make_shared<Shared>();
    mutable std::mutex      entriesMutex;
    std::vector<Entry>      entries;
    TaskId                  nextId = 1;
    bool                    closed = false;
};

} // namespace TS
