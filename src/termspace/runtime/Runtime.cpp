#include <termspace/runtime/Runtime.hpp>

#include <termspace/action/Target.hpp>
#include <termspace/paint/PaintContext.hpp>
#include <termspace/platform/Platform.hpp>
#include <termspace/runtime/Inspectable.hpp>

#include "log/TaggedLogger.hpp"

#include <parallel_hashmap/phmap.h>

#include <algorithm>
#include <utility>

namespace TS {

namespace {

// Actions reach components by component id; nodes without one by node id.
auto targetIdFor(LayoutNode const& node) -> std::string {
    if (auto const& widget = node.component())
        return widget->id();
    return node.id();
}

auto mouseActionType(MouseAction action) -> std::optional<ActionType> {
    switch (action) {
    case MouseAction::Press:
        return ActionType::MouseClick;
    case MouseAction::Release:
        return ActionType::MouseRelease;
    case MouseAction::Motion:
        return ActionType::MouseMotion;
    case MouseAction::WheelUp:
    case MouseAction::WheelDown:
        return ActionType::MouseWheel;
    case MouseAction::None:
        break;
    }
    return std::nullopt;
}

} // namespace

Runtime::Runtime(Platform& platform, RuntimeOptions options)
    : platform_(platform),
      options_(std::move(options)),
      recovery_(Recovery::Options{this->options_.panicLogPath, this->options_.rethrowPanics}),
      tasks(this->ctx, &this->recovery_),
      tracker(this->options_.historyCapacity),
      layoutEngine_(this->options_.layoutCacheCapacity),
      queue(this->options_.inputQueueCapacity) {
    this->recovery_.setPlatform(&this->platform_);
    if (this->options_.workerCount > 0)
        this->workers = std::make_unique<WorkerPool>(this->options_.workerCount);
    this->focus.setListener([this](std::optional<std::string> const& previous, std::optional<std::string> const& current) {
        this->onFocusChanged(previous, current);
    });
    this->tracker.setCapture([this] { return this->captureSnapshot(); });
    this->installBuiltins();
}

Runtime::~Runtime() {
    if (auto done = this->shutdown(std::chrono::milliseconds(1000)); !done)
        ts_log("Runtime shutdown failed: " + describeError(done.error()), "Runtime", "Error");
}

auto Runtime::start(std::unique_ptr<LayoutNode> root) -> Expected<void> {
    std::lock_guard lock(this->frameMutex);
    if (this->started)
        return std::unexpected(Error{Error::Code::NotAllowed, "runtime already started"});
    if (this->isCanceled())
        return std::unexpected(Error{Error::Code::Canceled, "runtime was shut down"});
    if (!root)
        return std::unexpected(Error{Error::Code::InvalidPayload, "root node is null"});

    if (auto ready = this->platform_.init(); !ready)
        return std::unexpected(ready.error());

    this->rootNode = std::move(root);
    this->focus.setRoot(this->rootNode.get());
    this->registerComponentTargets();
    this->resizeLocked(this->platform_.size());
    // Baseline so the first input records exactly one history entry.
    this->tracker.update(this->captureSnapshot());
    this->layoutMoved = false;

    this->reader = std::make_unique<InputReader>(this->platform_,
                                                 this->queue,
                                                 InputReader::Options{.pollTimeout = this->options_.inputPollTimeout,
                                                                      .pushTimeout = this->options_.inputPushTimeout});
    auto* input = this->reader.get();
    auto  task  = this->tasks.spawn("input", [input](CancellationContext const& taskCtx) {
#if defined(TS_LOG_DEBUG)
        set_thread_name("Input");
#endif
        if (auto error = input->run(taskCtx.token()))
            ts_log("Input reader stopped: " + describeError(*error), "Runtime", "Error");
    });
    if (!task) {
        if (auto closed = this->platform_.close(); !closed)
            ts_log("Platform close failed: " + describeError(closed.error()), "Runtime", "Error");
        return std::unexpected(task.error());
    }

    this->started = true;
    ts_log("Runtime started with root " + this->rootNode->id(), "Runtime");
    return {};
}

auto Runtime::update() -> Expected<void> {
    if (!this->started)
        return std::unexpected(Error{Error::Code::NotAllowed, "runtime not started"});

    auto inputs = this->queue.drain(this->queue.capacity());
    bool moved  = false;
    auto fault  = this->recovery_.guard("update", [&] {
        for (auto const& input : inputs)
            this->processInput(input);
        std::lock_guard lock(this->frameMutex);
        this->relayoutLocked();
        moved = std::exchange(this->layoutMoved, false);
    });
    if (fault)
        return std::unexpected(*fault);
    if (moved)
        this->rebaseline();
    return {};
}

auto Runtime::render() -> Expected<void> {
    std::lock_guard lock(this->frameMutex);
    if (!this->started)
        return std::unexpected(Error{Error::Code::NotAllowed, "runtime not started"});
    // Input backlog first; the frame is repainted once the queue drains.
    if (this->queue.full()) {
        ts_log("Render skipped, input queue full", "Runtime");
        return {};
    }
    if (!this->dirty.hasDirty())
        return {};

    std::optional<Error> failure;
    auto                 fault = this->recovery_.guard("render", [&] {
        bool const full = this->dirty.isAllDirty() && this->front.size() != this->back.size();
        this->paintLocked();
        if (full) {
            if (auto cleared = this->platform_.clear(); !cleared) {
                failure = cleared.error();
                return;
            }
        }
        auto const spans = this->back.diff(this->front);
        if (!spans.empty()) {
            if (auto written = this->platform_.writeString(this->back.renderSpans(spans)); !written) {
                failure = written.error();
                return;
            }
        }
        this->front = this->back;
        this->dirty.clear();
        ++this->frameCount;
    });
    if (fault)
        return std::unexpected(*fault);
    if (failure)
        return std::unexpected(*failure);
    return {};
}

auto Runtime::run() -> Expected<void> {
    if (!this->isStarted())
        return std::unexpected(Error{Error::Code::NotAllowed, "runtime not started"});

    this->running = true;
    std::optional<Error> failure;
    while (this->running.load() && !this->isCanceled()) {
        auto const frameStart = std::chrono::steady_clock::now();
        if (auto updated = this->update(); !updated) {
            failure = updated.error();
            break;
        }
        if (auto rendered = this->render(); !rendered) {
            failure = rendered.error();
            break;
        }
        if (this->queue.closed()) {
            ts_log("Input closed, leaving frame loop", "Runtime");
            break;
        }
        auto const elapsed = std::chrono::steady_clock::now() - frameStart;
        if (elapsed < this->options_.frameInterval)
            this->ctx.waitFor(this->options_.frameInterval - elapsed);
    }
    this->running = false;

    auto down = this->shutdown(std::chrono::milliseconds(1000));
    if (failure)
        return std::unexpected(*failure);
    return down;
}

auto Runtime::stop() -> void {
    ts_log("Runtime stop requested", "Runtime");
    this->running = false;
}

auto Runtime::shutdown(std::chrono::milliseconds timeout) -> Expected<void> {
    this->running = false;
    this->ctx.cancel();
    this->queue.close();
    if (this->workers)
        this->workers->stop();

    auto joined = this->tasks.shutdown(timeout);

    std::optional<Error> closeError;
    {
        std::lock_guard lock(this->frameMutex);
        if (this->started) {
            this->started = false;
            if (auto closed = this->platform_.close(); !closed)
                closeError = closed.error();
        }
    }
    if (!joined)
        return joined;
    if (closeError)
        return std::unexpected(*closeError);
    return {};
}

auto Runtime::enqueueInput(RawInput input) -> bool {
    return this->queue.tryPush(std::move(input));
}

auto Runtime::handleWindowSize(int width, int height) -> void {
    bool moved = false;
    {
        std::lock_guard lock(this->frameMutex);
        this->resizeLocked(Size{std::max(width, 0), std::max(height, 0)});
        moved = std::exchange(this->layoutMoved, false);
    }
    if (moved)
        this->rebaseline();
}

auto Runtime::invalidate() -> void {
    std::lock_guard lock(this->frameMutex);
    this->layoutEngine_.invalidate();
    if (this->rootNode)
        this->rootNode->markDirty();
    this->dirty.markAll();
}

auto Runtime::invalidateNode(std::string const& id) -> void {
    std::lock_guard lock(this->frameMutex);
    this->layoutEngine_.invalidateNode(id);
    if (!this->rootNode)
        return;
    if (auto* node = this->rootNode->find(id)) {
        node->markDirty();
        this->dirty.mark(node->bounds());
    }
}

auto Runtime::dispatch(Action const& action) -> bool {
    return this->dispatchAction(action);
}

auto Runtime::tryDispatch(Action const& action) -> Expected<void> {
    if (this->dispatchAction(action))
        return {};
    return std::unexpected(Error{Error::Code::NotSupported, "action not handled: " + std::string(TS::toString(action.type))});
}

auto Runtime::registerTarget(std::shared_ptr<Target> target) -> void {
    this->dispatcher_.registerTarget(std::move(target));
}

auto Runtime::unregisterTarget(std::string const& id) -> bool {
    return this->dispatcher_.unregisterTarget(id);
}

auto Runtime::subscribe(ActionType type, Dispatcher::Handler handler) -> SubscriptionId {
    return this->dispatcher_.subscribe(type, std::move(handler));
}

auto Runtime::unsubscribe(SubscriptionId id) -> bool {
    return this->dispatcher_.unsubscribe(id);
}

auto Runtime::setDefaultHandler(Dispatcher::Handler handler) -> void {
    std::lock_guard lock(this->defaultMutex);
    this->userDefault = std::move(handler);
}

auto Runtime::pushScope(std::string id, std::string const& rootId, bool modal) -> bool {
    std::lock_guard lock(this->frameMutex);
    return this->focus.pushScope(std::move(id), rootId, modal);
}

auto Runtime::popScope() -> std::optional<FocusScope> {
    std::lock_guard lock(this->frameMutex);
    return this->focus.popScope();
}

auto Runtime::focusNext() -> std::optional<std::string> {
    std::lock_guard lock(this->frameMutex);
    return this->focus.focusNext();
}

auto Runtime::focusPrev() -> std::optional<std::string> {
    std::lock_guard lock(this->frameMutex);
    return this->focus.focusPrev();
}

auto Runtime::focusSpecific(std::string const& id) -> bool {
    std::lock_guard lock(this->frameMutex);
    return this->focus.focusSpecific(id);
}

auto Runtime::focused() const -> std::optional<std::string> {
    return this->focus.focused();
}

auto Runtime::focusPath() const -> FocusPath {
    return this->focus.focusPath();
}

auto Runtime::submit(ActionHandlerPtr handler, WorkerPool::Completion done) -> std::optional<Error> {
    if (!this->workers)
        return Error{Error::Code::NotSupported, "worker pool disabled"};
    return this->workers->submit(std::move(handler), std::move(done));
}

auto Runtime::spawn(std::string name, TaskSpawner::Task task) -> Expected<TaskSpawner::TaskId> {
    return this->tasks.spawn(std::move(name), std::move(task));
}

auto Runtime::captureSnapshot() const -> Snapshot {
    std::lock_guard lock(this->frameMutex);
    Snapshot snapshot;
    snapshot.focusPath = this->focus.focusPath();
    if (!this->rootNode)
        return snapshot;
    this->rootNode->visit([&snapshot](LayoutNode const& node) {
        auto const& widget = node.component();
        if (!widget)
            return;
        auto const* inspectable = capability<Inspectable>(widget.get());
        if (inspectable == nullptr)
            return;
        ComponentState state;
        state.id       = widget->id();
        state.type     = widget->type();
        state.props    = inspectable->inspectProps();
        state.state    = inspectable->inspectState();
        state.rect     = node.bounds();
        state.visible  = inspectable->isVisible();
        state.disabled = inspectable->isDisabled();
        snapshot.setComponent(std::move(state));
    });
    return snapshot;
}

auto Runtime::applySnapshot(Snapshot const& snapshot) -> void {
    std::lock_guard lock(this->frameMutex);
    if (!this->rootNode)
        return;
    this->rootNode->visit([&snapshot](LayoutNode& node) {
        auto const& widget = node.component();
        if (!widget)
            return;
        auto* inspectable = capability<Inspectable>(widget.get());
        if (inspectable == nullptr)
            return;
        if (auto const* state = snapshot.component(widget->id()))
            inspectable->restoreState(state->state);
        node.markDirty();
    });
    if (!snapshot.focusPath.empty())
        (void)this->focus.focusSpecific(snapshot.focusPath.current());
    this->focus.refresh();
    this->dirty.markAll();
}

auto Runtime::transact(std::function<void()> const& fn) -> void {
    auto const before = this->captureSnapshot();
    fn();
    this->tracker.afterAction(before);
    this->focus.refresh();
    std::lock_guard lock(this->frameMutex);
    // fn may have changed anything that feeds measure().
    if (this->rootNode)
        this->rootNode->markDirty();
    this->dirty.markAll();
}

auto Runtime::component(std::string const& id) const -> std::shared_ptr<Component> {
    std::lock_guard            lock(this->frameMutex);
    std::shared_ptr<Component> found;
    if (!this->rootNode)
        return found;
    this->rootNode->visit([&](LayoutNode const& node) {
        if (found)
            return;
        auto const& widget = node.component();
        if (widget && (widget->id() == id || node.id() == id))
            found = widget;
    });
    return found;
}

auto Runtime::layoutResult() const -> LayoutResult {
    std::lock_guard lock(this->frameMutex);
    return this->lastLayout;
}

auto Runtime::screen() const -> CellBuffer {
    std::lock_guard lock(this->frameMutex);
    return this->front;
}

auto Runtime::installBuiltins() -> void {
    this->dispatcher_.setDefaultHandler([this](Action const& action) -> bool {
        Dispatcher::Handler fallback;
        {
            std::lock_guard lock(this->defaultMutex);
            fallback = this->userDefault;
        }
        if (fallback && fallback(action))
            return true;
        return this->handleBuiltin(action);
    });
}

auto Runtime::handleBuiltin(Action const& action) -> bool {
    switch (action.type) {
    case ActionType::NavigateNext:
        return this->focus.focusNext().has_value();
    case ActionType::NavigatePrev:
        return this->focus.focusPrev().has_value();
    case ActionType::NavigateFirst:
        return this->focus.focusFirst().has_value();
    case ActionType::NavigateLast:
        return this->focus.focusLast().has_value();
    case ActionType::NavigateUp:
        return this->focus.focusDirection(NavDirection::Up).has_value();
    case ActionType::NavigateDown:
        return this->focus.focusDirection(NavDirection::Down).has_value();
    case ActionType::NavigateLeft:
        return this->focus.focusDirection(NavDirection::Left).has_value();
    case ActionType::NavigateRight:
        return this->focus.focusDirection(NavDirection::Right).has_value();
    case ActionType::Undo:
        if (!this->tracker.undo())
            return false;
        this->applySnapshot(this->tracker.current());
        return true;
    case ActionType::Redo:
        if (!this->tracker.redo())
            return false;
        this->applySnapshot(this->tracker.current());
        return true;
    case ActionType::Quit:
        this->stop();
        return true;
    case ActionType::Refresh:
        this->invalidate();
        return true;
    default:
        return false;
    }
}

auto Runtime::registerComponentTargets() -> void {
    for (auto const& id : this->registeredTargets)
        this->dispatcher_.unregisterTarget(id);
    this->registeredTargets.clear();

    this->rootNode->visit([this](LayoutNode& node) {
        if (auto target = std::dynamic_pointer_cast<Target>(node.component())) {
            this->registeredTargets.push_back(target->id());
            this->dispatcher_.registerTarget(std::move(target));
        }
    });
    ts_log("Registered " + std::to_string(this->registeredTargets.size()) + " component targets", "Runtime");
}

auto Runtime::onFocusChanged(std::optional<std::string> const& previous, std::optional<std::string> const& current) -> void {
    ts_log("Focus " + previous.value_or("<none>") + " -> " + current.value_or("<none>"), "Runtime", "Focus");
    std::lock_guard lock(this->frameMutex);
    this->dirty.markAll();
}

auto Runtime::processInput(RawInput const& input) -> void {
    switch (input.type) {
    case InputType::Key:
    case InputType::Paste: {
        auto action = this->keys.map(input);
        if (!action)
            return;
        if (auto id = this->focus.focused(); id && this->rootNode) {
            if (auto const* node = this->rootNode->find(*id))
                action->withTarget(targetIdFor(*node));
        }
        this->dispatchAction(*action);
        return;
    }
    case InputType::Mouse:
        this->processMouse(input);
        return;
    case InputType::Resize: {
        std::lock_guard lock(this->frameMutex);
        this->resizeLocked(Size{input.width, input.height});
        return;
    }
    case InputType::Signal:
        ts_log("Signal received, stopping", "Runtime");
        this->stop();
        return;
    case InputType::None:
        return;
    }
}

auto Runtime::processMouse(RawInput const& input) -> void {
    auto const type = mouseActionType(input.mouseAction);
    if (!type || !this->rootNode)
        return;

    MousePayload payload{input.mouseX, input.mouseY, input.mouseButton, 0};
    if (input.mouseAction == MouseAction::WheelUp)
        payload.wheelDelta = -1;
    else if (input.mouseAction == MouseAction::WheelDown)
        payload.wheelDelta = 1;

    Action action{*type};
    action.withPayload(payload);

    auto* hit = hitTest(*this->rootNode, input.mouseX, input.mouseY);
    if (hit != nullptr) {
        if (input.mouseAction == MouseAction::Press) {
            for (auto* node = hit; node != nullptr; node = node->parent()) {
                if (this->focus.focusSpecific(node->id()))
                    break;
            }
        }
        // Nearest ancestor that can receive actions.
        LayoutNode* receiver = hit;
        for (auto* node = hit; node != nullptr; node = node->parent()) {
            if (this->dispatcher_.hasTarget(targetIdFor(*node))) {
                receiver = node;
                break;
            }
        }
        action.withTarget(targetIdFor(*receiver));
    }
    this->dispatchAction(action);
}

auto Runtime::dispatchAction(Action const& action) -> bool {
    // Undo and redo move through history themselves.
    bool const recordsHistory = action.type != ActionType::Undo && action.type != ActionType::Redo;
    // Taken fresh: layout may have moved boxes since the last commit.
    auto const before = this->captureSnapshot();

    bool handled = false;
    auto fault   = this->recovery_.guard("dispatch " + action.toString(), [&] { handled = this->dispatcher_.dispatch(action); });
    if (fault)
        ts_log("Dispatch failed: " + describeError(*fault), "Runtime", "Error");

    if (recordsHistory)
        this->tracker.afterAction(before);
    if (handled) {
        this->focus.refresh();
        std::lock_guard lock(this->frameMutex);
        this->markTargetDirtyLocked(action.target);
        this->dirty.markAll();
    }
    return handled;
}

// The handler may have changed what the target measures to, so its cached
// layout (and its ancestors') must be recomputed.
auto Runtime::markTargetDirtyLocked(std::string const& id) -> void {
    if (!this->rootNode)
        return;
    LayoutNode* node = id.empty() ? nullptr : this->rootNode->find(id);
    if (node == nullptr && !id.empty()) {
        this->rootNode->visit([&node, &id](LayoutNode& candidate) {
            if (node == nullptr && candidate.component() && candidate.component()->id() == id)
                node = &candidate;
        });
    }
    if (node == nullptr)
        node = this->rootNode.get();
    node->markDirty();
}

// Moves the history baseline to the current tree without recording an entry.
auto Runtime::rebaseline() -> void {
    this->tracker.update(this->captureSnapshot());
}

auto Runtime::relayoutLocked() -> void {
    if (!this->rootNode)
        return;
    auto next = this->layoutEngine_.layout(*this->rootNode, Constraints::loose(this->screenSize.width, this->screenSize.height));
    if (next.boxes != this->lastLayout.boxes) {
        this->dirty.markAll();
        this->focus.refresh();
        this->layoutMoved = true;
    }
    this->lastLayout = std::move(next);
}

auto Runtime::resizeLocked(Size size) -> void {
    ts_log("Resize to " + std::to_string(size.width) + "x" + std::to_string(size.height), "Runtime");
    this->screenSize = size;
    this->back.resize(size.width, size.height);
    // Forces a full repaint on the next render.
    this->front = CellBuffer{};
    this->dirty.setBounds(size);
    this->dirty.markAll();
    this->layoutEngine_.invalidate();
    this->relayoutLocked();
}

auto Runtime::paintLocked() -> void {
    this->back.clear();
    if (!this->rootNode)
        return;

    phmap::flat_hash_map<std::string, LayoutNode*> nodes;
    this->rootNode->visit([&nodes](LayoutNode& node) { nodes.emplace(node.id(), &node); });

    auto order = this->lastLayout.boxes;
    std::stable_sort(order.begin(), order.end(), [](LayoutBox const& a, LayoutBox const& b) { return a.zIndex < b.zIndex; });

    auto const focusedId = this->focus.focused();
    auto const path      = this->focus.focusPath();
    for (auto const& box : order) {
        auto it = nodes.find(box.nodeId);
        if (it == nodes.end())
            continue;
        LayoutNode& node = *it->second;
        PaintContext paintCtx(this->back, node.bounds());
        paintCtx.zIndex    = box.zIndex;
        paintCtx.focusPath = path;
        paintCtx.focused   = focusedId && *focusedId == node.id();

        auto const& widget = node.component();
        if (!widget) {
            if (node.kind() == NodeKind::Text && !node.text().empty())
                paintCtx.drawText(0, 0, node.text());
            continue;
        }
        if (auto const* inspectable = capability<Inspectable>(widget.get())) {
            if (!inspectable->isVisible())
                continue;
            paintCtx.disabled = inspectable->isDisabled();
        }
        if (auto* paintable = capability<Paintable>(widget.get()))
            paintable->paint(paintCtx);
    }
}

} // namespace TS
