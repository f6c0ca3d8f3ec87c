#pragma once
#include <termspace/core/FocusPath.hpp>
#include <termspace/focus/FocusScope.hpp>
#include <termspace/focus/GeometricNavigator.hpp>
#include <termspace/layout/LayoutNode.hpp>

#include <functional>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace TS {

/**
 * Owns the focus scope stack and the trap stack.
 *
 * The effective focusable set is the top scope's list, narrowed to the
 * subtree of the top trap when one exists. Every move stays inside that set,
 * so navigation never leaves an active trap. Failed moves return nullopt or
 * false and leave focus untouched.
 *
 * The layout tree is borrowed: setRoot() must be called again whenever the
 * tree is rebuilt. Focus changes are reported to the components through
 * Focusable::setFocused and to the listener, outside the manager's lock.
 */
class FocusManager {
public:
    using Listener = std::function<void(std::optional<std::string> const& previous, std::optional<std::string> const& current)>;

    static constexpr std::string_view kRootScope = "root";

    FocusManager() = default;

    FocusManager(FocusManager const&)                    = delete;
    auto operator=(FocusManager const&) -> FocusManager& = delete;

    // Installs a (re)built tree, rescans every scope and focuses the first
    // focusable when nothing is focused yet.
    auto setRoot(LayoutNode* root) -> void;
    auto refresh() -> void;
    [[nodiscard]] static auto collectFocusables(LayoutNode const& subtree) -> std::vector<std::string>;

    // Scope over the subtree rooted at rootId. Returns false if it is unknown.
    auto pushScope(std::string id, std::string const& rootId, bool modal = false) -> bool;
    auto pushScope(FocusScope scope) -> void;
    auto popScope() -> std::optional<FocusScope>;
    [[nodiscard]] auto currentScope() const -> std::optional<FocusScope>;
    [[nodiscard]] auto scopeDepth() const -> std::size_t;

    auto pushTrap(FocusTrap trap) -> void;
    auto popTrap() -> std::optional<FocusTrap>;
    auto removeTrap(std::string_view id) -> bool;
    [[nodiscard]] auto activeTrap() const -> std::optional<FocusTrap>;
    [[nodiscard]] auto isTrapActive(std::string_view id) const -> bool;
    [[nodiscard]] auto trapDepth() const -> std::size_t;
    auto clearTraps() -> void;

    auto focusNext() -> std::optional<std::string>;
    auto focusPrev() -> std::optional<std::string>;
    auto focusFirst() -> std::optional<std::string>;
    auto focusLast() -> std::optional<std::string>;
    auto focusSpecific(std::string const& id) -> bool;
    auto focusDirection(NavDirection direction) -> std::optional<std::string>;

    [[nodiscard]] auto focused() const -> std::optional<std::string>;
    [[nodiscard]] auto hasFocus(std::string_view id) const -> bool;
    [[nodiscard]] auto focusPath() const -> FocusPath;
    // The effective focusable set.
    [[nodiscard]] auto focusables() const -> std::vector<std::string>;

    // Drops scopes, traps and focus.
    auto clear() -> void;

    auto setListener(Listener listener) -> void;

private:
    struct TrapEntry {
        FocusTrap                  trap;
        std::optional<std::string> restore;
    };

    struct Change {
        std::optional<std::string> previous;
        std::optional<std::string> current;

        [[nodiscard]] auto changed() const -> bool { return previous != current; }
    };

    [[nodiscard]] auto availableLocked() const -> std::vector<std::string>;
    [[nodiscard]] auto focusedLocked() const -> std::optional<std::string>;
    auto setFocusLocked(std::optional<std::string> const& id) -> Change;
    auto rescanLocked() -> void;
    auto move(std::optional<std::string> (*pick)(std::vector<std::string> const&, std::optional<std::string> const&))
            -> std::optional<std::string>;
    auto notify(Change const& change) -> void;

    mutable std::shared_mutex mutex;
    LayoutNode*               root = nullptr;
    std::vector<FocusScope>   scopes;
    std::vector<TrapEntry>    traps;
    Listener                  listener;
};

} // namespace TS
