#pragma once
#include <termspace/action/Composite.hpp>
#include <termspace/action/Dispatcher.hpp>
#include <termspace/core/CancellationContext.hpp>
#include <termspace/core/Error.hpp>
#include <termspace/focus/FocusManager.hpp>
#include <termspace/input/BoundedQueue.hpp>
#include <termspace/input/InputReader.hpp>
#include <termspace/input/KeyMap.hpp>
#include <termspace/input/RawInput.hpp>
#include <termspace/layout/LayoutEngine.hpp>
#include <termspace/layout/LayoutNode.hpp>
#include <termspace/paint/CellBuffer.hpp>
#include <termspace/paint/DirtyTracker.hpp>
#include <termspace/runtime/Recovery.hpp>
#include <termspace/runtime/RuntimeOptions.hpp>
#include <termspace/runtime/TaskSpawner.hpp>
#include <termspace/state/StateTracker.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace TS {

class Platform;

/**
 * Owns every subsystem and drives the frame loop.
 *
 * One frame is update() followed by render(). update() drains the input
 * queue and turns each input into at most one dispatched Action, bracketed
 * by a state capture so every state-changing input becomes one undo step;
 * then it lays the tree out against the terminal size. render() paints the
 * Paintable components into a cell buffer and writes only the spans that
 * differ from the previous frame.
 *
 * The input reader runs on a TaskSpawner thread and is the only producer of
 * the queue besides enqueueInput(). Everything else runs on the thread that
 * calls update()/render()/run(); action handlers may re-enter the runtime,
 * from any thread, since no frame lock is held while they run.
 */
class Runtime {
public:
    explicit Runtime(Platform& platform, RuntimeOptions options = {});
    ~Runtime();

    Runtime(Runtime const&)                    = delete;
    auto operator=(Runtime const&) -> Runtime& = delete;

    // Installs the tree, initializes the platform and starts the input reader.
    auto start(std::unique_ptr<LayoutNode> root) -> Expected<void>;
    auto update() -> Expected<void>;
    auto render() -> Expected<void>;
    // Frames until stop() or cancellation, then shuts down.
    auto run() -> Expected<void>;
    auto stop() -> void;
    auto shutdown(std::chrono::milliseconds timeout) -> Expected<void>;

    [[nodiscard]] auto isRunning() const -> bool { return this->running.load(); }
    [[nodiscard]] auto isStarted() const -> bool { return this->started; }

    // Non-blocking; false when the queue is full or closed.
    auto enqueueInput(RawInput input) -> bool;
    auto handleWindowSize(int width, int height) -> void;
    auto invalidate() -> void;
    auto invalidateNode(std::string const& id) -> void;

    // Dispatches inside a state capture. False when nothing handled it.
    auto dispatch(Action const& action) -> bool;
    auto tryDispatch(Action const& action) -> Expected<void>;
    auto registerTarget(std::shared_ptr<Target> target) -> void;
    auto unregisterTarget(std::string const& id) -> bool;
    auto subscribe(ActionType type, Dispatcher::Handler handler) -> SubscriptionId;
    auto unsubscribe(SubscriptionId id) -> bool;
    auto setDefaultHandler(Dispatcher::Handler handler) -> void;

    auto pushScope(std::string id, std::string const& rootId, bool modal = false) -> bool;
    auto popScope() -> std::optional<FocusScope>;
    auto focusNext() -> std::optional<std::string>;
    auto focusPrev() -> std::optional<std::string>;
    auto focusSpecific(std::string const& id) -> bool;
    [[nodiscard]] auto focused() const -> std::optional<std::string>;
    [[nodiscard]] auto focusPath() const -> FocusPath;

    // Runs handler on the worker pool; NotSupported when the pool is disabled.
    auto submit(ActionHandlerPtr handler, WorkerPool::Completion done = {}) -> std::optional<Error>;
    auto spawn(std::string name, TaskSpawner::Task task) -> Expected<TaskSpawner::TaskId>;
    [[nodiscard]] auto isCanceled() const -> bool { return this->ctx.isCanceled(); }
    [[nodiscard]] auto context() const -> CancellationContext { return this->ctx; }

    // Snapshot of the live tree: Inspectable components plus the focus path.
    [[nodiscard]] auto captureSnapshot() const -> Snapshot;
    // Pushes component state from snapshot back into the live components.
    auto applySnapshot(Snapshot const& snapshot) -> void;
    // Runs fn between two state captures, recording one history entry when
    // it changed anything.
    auto transact(std::function<void()> const& fn) -> void;

    [[nodiscard]] auto root() -> LayoutNode* { return this->rootNode.get(); }
    [[nodiscard]] auto component(std::string const& id) const -> std::shared_ptr<Component>;
    [[nodiscard]] auto layoutResult() const -> LayoutResult;
    [[nodiscard]] auto screen() const -> CellBuffer;
    [[nodiscard]] auto frames() const -> std::uint64_t { return this->frameCount.load(); }

    [[nodiscard]] auto dispatcher() -> Dispatcher& { return this->dispatcher_; }
    [[nodiscard]] auto focusManager() -> FocusManager& { return this->focus; }
    [[nodiscard]] auto stateTracker() -> StateTracker& { return this->tracker; }
    [[nodiscard]] auto keyMap() -> KeyMap& { return this->keys; }
    [[nodiscard]] auto layoutEngine() -> LayoutEngine& { return this->layoutEngine_; }
    [[nodiscard]] auto recovery() -> Recovery& { return this->recovery_; }
    [[nodiscard]] auto platform() -> Platform& { return this->platform_; }
    [[nodiscard]] auto options() const -> RuntimeOptions const& { return this->options_; }

private:
    auto installBuiltins() -> void;
    auto handleBuiltin(Action const& action) -> bool;
    auto registerComponentTargets() -> void;
    auto onFocusChanged(std::optional<std::string> const& previous, std::optional<std::string> const& current) -> void;

    auto processInput(RawInput const& input) -> void;
    auto processMouse(RawInput const& input) -> void;
    // Runs handlers without holding frameMutex.
    auto dispatchAction(Action const& action) -> bool;
    auto markTargetDirtyLocked(std::string const& id) -> void;
    auto rebaseline() -> void;
    auto relayoutLocked() -> void;
    auto resizeLocked(Size size) -> void;
    auto paintLocked() -> void;

    Platform&      platform_;
    RuntimeOptions options_;

    CancellationContext ctx;
    Recovery            recovery_;
    TaskSpawner         tasks;
    Dispatcher          dispatcher_;
    FocusManager        focus;
    StateTracker        tracker;
    KeyMap              keys;
    LayoutEngine        layoutEngine_;

    BoundedQueue<RawInput>       queue;
    std::unique_ptr<InputReader> reader;
    std::unique_ptr<WorkerPool>  workers;

    // Guards the tree, buffers and layout. Never held while handlers run.
    mutable std::recursive_mutex frameMutex;
    std::unique_ptr<LayoutNode>  rootNode;
    LayoutResult                 lastLayout;
    Size                         screenSize;
    CellBuffer                   front;
    CellBuffer                   back;
    DirtyTracker                 dirty;
    std::vector<std::string>     registeredTargets;
    bool                         layoutMoved = false;

    std::mutex          defaultMutex;
    Dispatcher::Handler userDefault;

    std::atomic<bool>          started{false};
    std::atomic<bool>          running{false};
    std::atomic<std::uint64_t> frameCount{0};
};

} // namespace TS
