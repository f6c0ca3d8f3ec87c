#pragma once
#include <termspace/core/FocusPath.hpp>
#include <termspace/core/Geometry.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace TS {

using Json = nlohmann::json;

// Introspectable state of one component at snapshot time.
struct ComponentState {
    std::string id;
    std::string type;
    Json        props = Json::object(); // static configuration
    Json        state = Json::object(); // runtime values
    Rect        rect;
    bool        visible  = true;
    bool        disabled = false;

    auto operator==(ComponentState const&) const -> bool = default;
};

enum class ModalType : std::uint8_t {
    Dialog = 0,
    Alert,
    Confirm,
    Menu
};

[[nodiscard]] auto toString(ModalType type) -> std::string_view;
[[nodiscard]] auto modalTypeFromString(std::string_view name) -> std::optional<ModalType>;

struct ModalState {
    std::string id;
    ModalType   type = ModalType::Dialog;
    std::string focus;
    bool        open     = false;
    bool        closable = true;

    auto operator==(ModalState const&) const -> bool = default;
};

struct CellRef {
    int x = 0;
    int y = 0;

    auto operator==(CellRef const&) const -> bool = default;
};

struct DirtyRegions {
    std::vector<CellRef> cells;
    std::vector<Rect>    rects;

    [[nodiscard]] auto empty() const -> bool { return cells.empty() && rects.empty(); }
    auto operator==(DirtyRegions const&) const -> bool = default;
};

/**
 * Complete UI state at one instant.
 *
 * Snapshots are plain values: copying one produces an independent deep copy,
 * so a retained snapshot never observes later edits to live state.
 * Components are keyed by id and iterate in id order.
 */
struct Snapshot {
    using Clock = std::chrono::system_clock;

    Clock::time_point                     timestamp = Snapshot::now();
    FocusPath                             focusPath;
    std::map<std::string, ComponentState> components;
    std::vector<ModalState>               modals;
    DirtyRegions                          dirty;
    Json                                  metadata = Json::object();

    // Millisecond precision so a timestamp survives serialization unchanged.
    [[nodiscard]] static auto now() -> Clock::time_point;

    [[nodiscard]] auto component(std::string const& id) const -> ComponentState const*;
    [[nodiscard]] auto component(std::string const& id) -> ComponentState*;
    auto setComponent(ComponentState value) -> void;
    auto removeComponent(std::string const& id) -> bool;

    // Equality of focus, components, modals and metadata; timestamp and dirty
    // regions are ignored.
    [[nodiscard]] auto sameContent(Snapshot const& other) const -> bool;

    auto operator==(Snapshot const&) const -> bool = default;
};

} // namespace TS
