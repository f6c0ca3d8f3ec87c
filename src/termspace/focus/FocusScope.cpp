#include <termspace/focus/FocusScope.hpp>

#include <algorithm>

namespace TS {

namespace {
auto indexOf(std::vector<std::string> const& ids, std::optional<std::string> const& current) -> long {
    if (!current)
        return -1;
    auto it = std::find(ids.begin(), ids.end(), *current);
    return it == ids.end() ? -1 : static_cast<long>(it - ids.begin());
}
} // namespace

auto cycleNext(std::vector<std::string> const& ids, std::optional<std::string> const& current) -> std::optional<std::string> {
    if (ids.empty())
        return std::nullopt;
    auto const n   = static_cast<long>(ids.size());
    auto       idx = indexOf(ids, current);
    return ids[static_cast<std::size_t>((idx + 1) % n)];
}

auto cyclePrev(std::vector<std::string> const& ids, std::optional<std::string> const& current) -> std::optional<std::string> {
    if (ids.empty())
        return std::nullopt;
    auto idx = indexOf(ids, current);
    if (idx <= 0)
        idx = static_cast<long>(ids.size());
    return ids[static_cast<std::size_t>(idx - 1)];
}

auto FocusScope::focused() const -> std::optional<std::string> {
    if (this->focusPath.empty())
        return std::nullopt;
    return this->focusPath.current();
}

auto FocusScope::hasFocus(std::string_view candidate) const -> bool {
    return !this->focusPath.empty() && this->focusPath.current() == candidate;
}

auto FocusScope::isFocusable(std::string_view candidate) const -> bool {
    return std::find(this->focusables.begin(), this->focusables.end(), candidate) != this->focusables.end();
}

auto FocusScope::focusNext() -> std::optional<std::string> {
    auto next = cycleNext(this->focusables, this->focused());
    if (next)
        this->focusPath = FocusPath{{*next}};
    return next;
}

auto FocusScope::focusPrev() -> std::optional<std::string> {
    auto prev = cyclePrev(this->focusables, this->focused());
    if (prev)
        this->focusPath = FocusPath{{*prev}};
    return prev;
}

auto FocusScope::focusFirst() -> std::optional<std::string> {
    if (this->focusables.empty())
        return std::nullopt;
    this->focusPath = FocusPath{{this->focusables.front()}};
    return this->focusables.front();
}

auto FocusScope::focusLast() -> std::optional<std::string> {
    if (this->focusables.empty())
        return std::nullopt;
    this->focusPath = FocusPath{{this->focusables.back()}};
    return this->focusables.back();
}

auto FocusScope::focusSpecific(std::string const& candidate) -> bool {
    if (!this->isFocusable(candidate))
        return false;
    this->focusPath = FocusPath{{candidate}};
    return true;
}

auto toString(TrapType type) -> std::string_view {
    switch (type) {
    case TrapType::Modal:
        return "modal";
    case TrapType::Menu:
        return "menu";
    case TrapType::Popover:
        return "popover";
    }
    return "modal";
}

} // namespace TS
