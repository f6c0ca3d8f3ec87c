#pragma once
#include <termspace/core/FocusPath.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace TS {

// Capability: widgets that can receive input focus.
class Focusable {
public:
    virtual ~Focusable() = default;
    [[nodiscard]] virtual auto isFocusable() const -> bool = 0;
    virtual auto setFocused(bool focused) -> void {}
};

// Cyclic moves over an ordered id list. An unknown or missing current id
// counts as "before the first" for next and "after the last" for prev.
[[nodiscard]] auto cycleNext(std::vector<std::string> const& ids, std::optional<std::string> const& current) -> std::optional<std::string>;
[[nodiscard]] auto cyclePrev(std::vector<std::string> const& ids, std::optional<std::string> const& current) -> std::optional<std::string>;

/**
 * A bounded navigation domain: the focusable ids under one root, in tree
 * order, plus the current focus path inside it. The active scope is always
 * the top of the manager's stack.
 */
struct FocusScope {
    std::string              id;
    std::string              rootId;
    std::vector<std::string> focusables;
    FocusPath                focusPath;
    bool                     modal = false;

    [[nodiscard]] auto focused() const -> std::optional<std::string>;
    [[nodiscard]] auto hasFocus(std::string_view candidate) const -> bool;
    [[nodiscard]] auto isFocusable(std::string_view candidate) const -> bool;

    // Each returns the newly focused id, nullopt when nothing is focusable.
    auto focusNext() -> std::optional<std::string>;
    auto focusPrev() -> std::optional<std::string>;
    auto focusFirst() -> std::optional<std::string>;
    auto focusLast() -> std::optional<std::string>;
    auto focusSpecific(std::string const& candidate) -> bool;
};

enum class TrapType : std::uint8_t {
    Modal = 0,
    Menu,
    Popover
};

[[nodiscard]] auto toString(TrapType type) -> std::string_view;

// Restricts navigation to the subtree rooted at rootId while it is the top
// of the trap stack. Activity is derived from stack position on every query.
struct FocusTrap {
    std::string id;
    TrapType    type = TrapType::Modal;
    std::string rootId;
};

} // namespace TS
