#pragma once
#include <termspace/action/Action.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace TS {

enum class InputType : std::uint8_t {
    None = 0,
    Key,
    Mouse,
    Resize,
    Paste,
    Signal
};

enum class SpecialKey : std::uint8_t {
    None = 0,
    Escape,
    Enter,
    Tab,
    Backspace,
    Delete,
    Insert,
    Up,
    Down,
    Left,
    Right,
    Home,
    End,
    PageUp,
    PageDown,
    F1,
    F2,
    F3,
    F4,
    F5,
    F6,
    F7,
    F8,
    F9,
    F10,
    F11,
    F12,
    Space
};

enum class KeyModifiers : std::uint8_t {
    None  = 0,
    Shift = 1u << 0,
    Ctrl  = 1u << 1,
    Alt   = 1u << 2,
    Meta  = 1u << 3
};

[[nodiscard]] constexpr auto operator|(KeyModifiers lhs, KeyModifiers rhs) -> KeyModifiers {
    return static_cast<KeyModifiers>(static_cast<std::uint8_t>(lhs) | static_cast<std::uint8_t>(rhs));
}

[[nodiscard]] constexpr auto operator&(KeyModifiers lhs, KeyModifiers rhs) -> KeyModifiers {
    return static_cast<KeyModifiers>(static_cast<std::uint8_t>(lhs) & static_cast<std::uint8_t>(rhs));
}

[[nodiscard]] constexpr auto hasModifier(KeyModifiers value, KeyModifiers flag) -> bool {
    return (value & flag) != KeyModifiers::None;
}

enum class MouseAction : std::uint8_t {
    None = 0,
    Press,
    Release,
    Motion,
    WheelUp,
    WheelDown
};

enum class InputSignal : std::uint8_t {
    None = 0,
    Interrupt,
    Terminate,
    Hangup
};

// Decoded terminal input, before any semantic interpretation.
struct RawInput {
    using Clock = std::chrono::steady_clock;

    InputType    type      = InputType::None;
    char32_t     key       = 0;
    SpecialKey   special   = SpecialKey::None;
    KeyModifiers modifiers = KeyModifiers::None;

    int         mouseX      = 0;
    int         mouseY      = 0;
    MouseButton mouseButton = MouseButton::None;
    MouseAction mouseAction = MouseAction::None;

    int width  = 0;
    int height = 0;

    std::string text; // paste contents
    InputSignal signal = InputSignal::None;

    Clock::time_point timestamp{};

    [[nodiscard]] static auto keyPress(char32_t ch, KeyModifiers mods = KeyModifiers::None) -> RawInput;
    [[nodiscard]] static auto specialKey(SpecialKey key, KeyModifiers mods = KeyModifiers::None) -> RawInput;
    [[nodiscard]] static auto mouse(MouseAction action, MouseButton button, int x, int y) -> RawInput;
    [[nodiscard]] static auto resize(int width, int height) -> RawInput;
    [[nodiscard]] static auto paste(std::string text) -> RawInput;

    auto operator==(RawInput const& other) const -> bool;
};

[[nodiscard]] auto toString(SpecialKey key) -> std::string_view;
[[nodiscard]] auto specialKeyFromString(std::string_view name) -> SpecialKey;
// "C-A-S-<key>" with the modifiers present on the input.
[[nodiscard]] auto describeKey(RawInput const& input) -> std::string;
[[nodiscard]] auto toUtf8(char32_t codepoint) -> std::string;

} // namespace TS
