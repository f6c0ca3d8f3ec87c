#pragma once
#include <termspace/action/ActionType.hpp>
#include <termspace/core/Error.hpp>

#include <any>
#include <chrono>
#include <cstdint>
#include <string>
#include <typeinfo>

namespace TS {

enum class MouseButton : std::uint8_t {
    None = 0,
    Left,
    Middle,
    Right
};

[[nodiscard]] auto toString(MouseButton button) -> std::string_view;

// Payload of the mouse_* actions. Coordinates are 0-based screen cells.
struct MousePayload {
    int         x = 0;
    int         y = 0;
    MouseButton button = MouseButton::None;
    int         wheelDelta = 0; // -1 up, +1 down, 0 otherwise
};

struct Action {
    using Clock = std::chrono::system_clock;

    Action();
    explicit Action(ActionType type);

    auto withPayload(std::any value) -> Action&;
    auto withSource(std::string id) -> Action&;
    auto withTarget(std::string id) -> Action&;

    [[nodiscard]] auto hasPayload() const -> bool { return this->payload.has_value(); }

    template <typename T>
    [[nodiscard]] auto payloadAs() const -> Expected<T>;

    // "type" or "type{target}".
    [[nodiscard]] auto toString() const -> std::string;

    ActionType        type = ActionType::Refresh;
    std::any          payload;
    std::string       source;
    std::string       target;
    Clock::time_point timestamp;
};

template <typename T>
auto Action::payloadAs() const -> Expected<T> {
    if (!this->payload.has_value())
        return std::unexpected(Error{Error::Code::InvalidPayload, "missing payload for " + std::string(TS::toString(this->type))});
    if (auto const* value = std::any_cast<T>(&this->payload))
        return *value;
    return std::unexpected(Error{Error::Code::InvalidPayload,
                                 std::string("payload type mismatch for ") + std::string(TS::toString(this->type)) + ": expected "
                                         + typeid(T).name() + ", got " + this->payload.type().name()});
}

} // namespace TS
