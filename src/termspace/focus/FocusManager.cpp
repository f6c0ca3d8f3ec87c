#include <termspace/focus/FocusManager.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <iterator>
#include <mutex>

namespace TS {

namespace {

auto isFocusableNode(LayoutNode const& node) -> bool {
    auto const* focusable = capability<Focusable>(node.component().get());
    return focusable != nullptr && focusable->isFocusable();
}

auto pathTo(LayoutNode const* root, std::string const& id) -> FocusPath {
    if (root == nullptr)
        return FocusPath{{id}};
    auto const* node = root->find(id);
    if (node == nullptr)
        return FocusPath{{id}};
    std::vector<std::string> segments;
    for (auto const* current = node; current != nullptr; current = current->parent())
        segments.push_back(current->id());
    std::reverse(segments.begin(), segments.end());
    return FocusPath{std::move(segments)};
}

auto firstOf(std::vector<std::string> const& ids, std::optional<std::string> const&) -> std::optional<std::string> {
    if (ids.empty())
        return std::nullopt;
    return ids.front();
}

auto lastOf(std::vector<std::string> const& ids, std::optional<std::string> const&) -> std::optional<std::string> {
    if (ids.empty())
        return std::nullopt;
    return ids.back();
}

} // namespace

auto FocusManager::collectFocusables(LayoutNode const& subtree) -> std::vector<std::string> {
    std::vector<std::string> ids;
    subtree.visit([&ids](LayoutNode const& node) {
        if (isFocusableNode(node))
            ids.push_back(node.id());
    });
    return ids;
}

auto FocusManager::rescanLocked() -> void {
    for (auto& scope : this->scopes) {
        LayoutNode const* scopeRoot = this->root == nullptr ? nullptr : this->root->find(scope.rootId);
        scope.focusables            = scopeRoot == nullptr ? std::vector<std::string>{} : collectFocusables(*scopeRoot);
        if (auto focused = scope.focused()) {
            if (scope.isFocusable(*focused))
                scope.focusPath = pathTo(this->root, *focused);
            else
                scope.focusPath = FocusPath{};
        }
    }
}

auto FocusManager::setRoot(LayoutNode* tree) -> void {
    Change change;
    {
        std::unique_lock<std::shared_mutex> lock(this->mutex);
        change.previous = this->focusedLocked();
        this->root      = tree;
        if (this->scopes.empty() && tree != nullptr)
            this->scopes.push_back(FocusScope{std::string(kRootScope), tree->id(), {}, {}, false});
        this->rescanLocked();
        change.current = this->focusedLocked();
        if (!change.current) {
            auto available = this->availableLocked();
            if (!available.empty())
                change = Change{change.previous, this->setFocusLocked(available.front()).current};
        }
        ts_log("FocusManager::setRoot focusables=" + std::to_string(this->availableLocked().size()), "Focus");
    }
    this->notify(change);
}

auto FocusManager::refresh() -> void {
    Change change;
    {
        std::unique_lock<std::shared_mutex> lock(this->mutex);
        change.previous = this->focusedLocked();
        this->rescanLocked();
        change.current = this->focusedLocked();
    }
    this->notify(change);
}

auto FocusManager::pushScope(std::string id, std::string const& rootId, bool modal) -> bool {
    FocusScope scope;
    {
        std::shared_lock<std::shared_mutex> lock(this->mutex);
        LayoutNode const* scopeRoot = this->root == nullptr ? nullptr : this->root->find(rootId);
        if (scopeRoot == nullptr)
            return false;
        scope.focusables = collectFocusables(*scopeRoot);
    }
    scope.id     = std::move(id);
    scope.rootId = rootId;
    scope.modal  = modal;
    this->pushScope(std::move(scope));
    return true;
}

auto FocusManager::pushScope(FocusScope scope) -> void {
    Change change;
    {
        std::unique_lock<std::shared_mutex> lock(this->mutex);
        change.previous = this->focusedLocked();
        ts_log("FocusManager::pushScope " + scope.id, "Focus");
        this->scopes.push_back(std::move(scope));
        change.current = this->focusedLocked();
        if (!change.current) {
            auto available = this->availableLocked();
            if (!available.empty())
                change.current = this->setFocusLocked(available.front()).current;
        }
    }
    this->notify(change);
}

auto FocusManager::popScope() -> std::optional<FocusScope> {
    std::optional<FocusScope> popped;
    Change                    change;
    {
        std::unique_lock<std::shared_mutex> lock(this->mutex);
        if (this->scopes.empty())
            return std::nullopt;
        change.previous = this->focusedLocked();
        popped          = std::move(this->scopes.back());
        this->scopes.pop_back();
        change.current = this->focusedLocked();
        ts_log("FocusManager::popScope " + popped->id, "Focus");
    }
    this->notify(change);
    return popped;
}

auto FocusManager::currentScope() const -> std::optional<FocusScope> {
    std::shared_lock<std::shared_mutex> lock(this->mutex);
    if (this->scopes.empty())
        return std::nullopt;
    return this->scopes.back();
}

auto FocusManager::scopeDepth() const -> std::size_t {
    std::shared_lock<std::shared_mutex> lock(this->mutex);
    return this->scopes.size();
}

auto FocusManager::pushTrap(FocusTrap trap) -> void {
    Change change;
    {
        std::unique_lock<std::shared_mutex> lock(this->mutex);
        change.previous = this->focusedLocked();
        ts_log("FocusManager::pushTrap " + trap.id, "Focus");
        this->traps.push_back(TrapEntry{std::move(trap), change.previous});
        change.current = change.previous;
        auto available = this->availableLocked();
        if (!change.current || std::find(available.begin(), available.end(), *change.current) == available.end()) {
            if (!available.empty())
                change.current = this->setFocusLocked(available.front()).current;
        }
    }
    this->notify(change);
}

auto FocusManager::popTrap() -> std::optional<FocusTrap> {
    std::optional<FocusTrap> popped;
    Change                   change;
    {
        std::unique_lock<std::shared_mutex> lock(this->mutex);
        if (this->traps.empty())
            return std::nullopt;
        change.previous = this->focusedLocked();
        auto entry      = std::move(this->traps.back());
        this->traps.pop_back();
        popped         = std::move(entry.trap);
        change.current = change.previous;
        auto available = this->availableLocked();
        if (entry.restore && std::find(available.begin(), available.end(), *entry.restore) != available.end())
            change.current = this->setFocusLocked(entry.restore).current;
        ts_log("FocusManager::popTrap " + popped->id, "Focus");
    }
    this->notify(change);
    return popped;
}

auto FocusManager::removeTrap(std::string_view id) -> bool {
    {
        std::unique_lock<std::shared_mutex> lock(this->mutex);
        auto it = std::find_if(this->traps.begin(), this->traps.end(), [id](TrapEntry const& e) { return e.trap.id == id; });
        if (it == this->traps.end())
            return false;
        if (std::next(it) != this->traps.end()) {
            this->traps.erase(it);
            return true;
        }
    }
    // Removing the top trap behaves like popping it.
    return this->popTrap().has_value();
}

auto FocusManager::activeTrap() const -> std::optional<FocusTrap> {
    std::shared_lock<std::shared_mutex> lock(this->mutex);
    if (this->traps.empty())
        return std::nullopt;
    return this->traps.back().trap;
}

auto FocusManager::isTrapActive(std::string_view id) const -> bool {
    std::shared_lock<std::shared_mutex> lock(this->mutex);
    return !this->traps.empty() && this->traps.back().trap.id == id;
}

auto FocusManager::trapDepth() const -> std::size_t {
    std::shared_lock<std::shared_mutex> lock(this->mutex);
    return this->traps.size();
}

auto FocusManager::clearTraps() -> void {
    std::unique_lock<std::shared_mutex> lock(this->mutex);
    this->traps.clear();
}

auto FocusManager::availableLocked() const -> std::vector<std::string> {
    if (this->scopes.empty())
        return {};
    auto const& scope = this->scopes.back();
    if (this->traps.empty())
        return scope.focusables;

    auto const&       trap     = this->traps.back().trap;
    LayoutNode const* trapRoot = this->root == nullptr ? nullptr : this->root->find(trap.rootId);
    if (trapRoot == nullptr)
        return {};
    std::vector<std::string> inside;
    for (auto const& id : scope.focusables) {
        if (trapRoot->find(id) != nullptr)
            inside.push_back(id);
    }
    return inside;
}

auto FocusManager::focusedLocked() const -> std::optional<std::string> {
    if (this->scopes.empty())
        return std::nullopt;
    return this->scopes.back().focused();
}

auto FocusManager::setFocusLocked(std::optional<std::string> const& id) -> Change {
    Change change{this->focusedLocked(), id};
    if (this->scopes.empty())
        return Change{};
    auto& scope     = this->scopes.back();
    scope.focusPath = id ? pathTo(this->root, *id) : FocusPath{};
    return change;
}

auto FocusManager::move(std::optional<std::string> (*pick)(std::vector<std::string> const&, std::optional<std::string> const&))
        -> std::optional<std::string> {
    Change change;
    {
        std::unique_lock<std::shared_mutex> lock(this->mutex);
        auto target = pick(this->availableLocked(), this->focusedLocked());
        if (!target)
            return std::nullopt;
        change = this->setFocusLocked(target);
    }
    this->notify(change);
    return change.current;
}

auto FocusManager::focusNext() -> std::optional<std::string> {
    return this->move(&cycleNext);
}

auto FocusManager::focusPrev() -> std::optional<std::string> {
    return this->move(&cyclePrev);
}

auto FocusManager::focusFirst() -> std::optional<std::string> {
    return this->move(&firstOf);
}

auto FocusManager::focusLast() -> std::optional<std::string> {
    return this->move(&lastOf);
}

auto FocusManager::focusSpecific(std::string const& id) -> bool {
    Change change;
    {
        std::unique_lock<std::shared_mutex> lock(this->mutex);
        auto available = this->availableLocked();
        if (std::find(available.begin(), available.end(), id) == available.end())
            return false;
        change = this->setFocusLocked(id);
    }
    this->notify(change);
    return true;
}

auto FocusManager::focusDirection(NavDirection direction) -> std::optional<std::string> {
    Change change;
    {
        std::unique_lock<std::shared_mutex> lock(this->mutex);
        if (this->root == nullptr)
            return std::nullopt;
        std::vector<FocusCandidate> candidates;
        for (auto const& id : this->availableLocked()) {
            if (auto const* node = this->root->find(id))
                candidates.push_back(FocusCandidate{id, node->bounds()});
        }
        auto target = GeometricNavigator::findNext(candidates, this->focusedLocked(), direction);
        if (!target)
            return std::nullopt;
        change = this->setFocusLocked(target);
    }
    this->notify(change);
    return change.current;
}

auto FocusManager::focused() const -> std::optional<std::string> {
    std::shared_lock<std::shared_mutex> lock(this->mutex);
    return this->focusedLocked();
}

auto FocusManager::hasFocus(std::string_view id) const -> bool {
    std::shared_lock<std::shared_mutex> lock(this->mutex);
    auto                                current = this->focusedLocked();
    return current && *current == id;
}

auto FocusManager::focusPath() const -> FocusPath {
    std::shared_lock<std::shared_mutex> lock(this->mutex);
    if (this->scopes.empty())
        return {};
    return this->scopes.back().focusPath;
}

auto FocusManager::focusables() const -> std::vector<std::string> {
    std::shared_lock<std::shared_mutex> lock(this->mutex);
    return this->availableLocked();
}

auto FocusManager::clear() -> void {
    Change change;
    {
        std::unique_lock<std::shared_mutex> lock(this->mutex);
        change.previous = this->focusedLocked();
        this->scopes.clear();
        this->traps.clear();
    }
    this->notify(change);
}

auto FocusManager::setListener(Listener fn) -> void {
    std::unique_lock<std::shared_mutex> lock(this->mutex);
    this->listener = std::move(fn);
}

auto FocusManager::notify(Change const& change) -> void {
    if (!change.changed())
        return;
    LayoutNode* tree = nullptr;
    Listener    fn;
    {
        std::shared_lock<std::shared_mutex> lock(this->mutex);
        tree = this->root;
        fn   = this->listener;
    }
    if (tree != nullptr) {
        auto tell = [tree](std::optional<std::string> const& id, bool focused) {
            if (!id)
                return;
            if (auto* node = tree->find(*id)) {
                if (auto* focusable = capability<Focusable>(node->component().get()))
                    focusable->setFocused(focused);
            }
        };
        tell(change.previous, false);
        tell(change.current, true);
    }
    ts_log("focus " + change.previous.value_or("<none>") + " -> " + change.current.value_or("<none>"), "Focus");
    if (fn)
        fn(change.previous, change.current);
}

} // namespace TS
