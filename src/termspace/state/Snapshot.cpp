#include <termspace/state/Snapshot.hpp>

#include <array>

namespace TS {

namespace {

constexpr std::array<std::string_view, 4> kModalTypeNames{"dialog", "alert", "confirm", "menu"};

} // namespace

auto toString(ModalType type) -> std::string_view {
    auto index = static_cast<std::size_t>(type);
    return index < kModalTypeNames.size() ? kModalTypeNames[index] : "unknown";
}

auto modalTypeFromString(std::string_view name) -> std::optional<ModalType> {
    for (std::size_t i = 0; i < kModalTypeNames.size(); ++i)
        if (kModalTypeNames[i] == name)
            return static_cast<ModalType>(i);
    return std::nullopt;
}

auto Snapshot::now() -> Clock::time_point {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(Clock::now());
}

auto Snapshot::component(std::string const& id) const -> ComponentState const* {
    auto it = this->components.find(id);
    return it == this->components.end() ? nullptr : &it->second;
}

auto Snapshot::component(std::string const& id) -> ComponentState* {
    auto it = this->components.find(id);
    return it == this->components.end() ? nullptr : &it->second;
}

auto Snapshot::setComponent(ComponentState value) -> void {
    auto id                     = value.id;
    this->components[std::move(id)] = std::move(value);
}

auto Snapshot::removeComponent(std::string const& id) -> bool {
    return this->components.erase(id) > 0;
}

auto Snapshot::sameContent(Snapshot const& other) const -> bool {
    return this->focusPath == other.focusPath && this->components == other.components && this->modals == other.modals
           && this->metadata == other.metadata;
}

} // namespace TS
