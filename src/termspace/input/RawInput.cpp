#include <termspace/input/RawInput.hpp>

#include <array>
#include <utility>

namespace TS {

namespace {
constexpr std::array<std::pair<SpecialKey, std::string_view>, 27> kKeyNames{{
        {SpecialKey::Escape, "Esc"},
        {SpecialKey::Enter, "Enter"},
        {SpecialKey::Tab, "Tab"},
        {SpecialKey::Backspace, "Backspace"},
        {SpecialKey::Delete, "Delete"},
        {SpecialKey::Insert, "Insert"},
        {SpecialKey::Up, "Up"},
        {SpecialKey::Down, "Down"},
        {SpecialKey::Left, "Left"},
        {SpecialKey::Right, "Right"},
        {SpecialKey::Home, "Home"},
        {SpecialKey::End, "End"},
        {SpecialKey::PageUp, "PageUp"},
        {SpecialKey::PageDown, "PageDown"},
        {SpecialKey::F1, "F1"},
        {SpecialKey::F2, "F2"},
        {SpecialKey::F3, "F3"},
        {SpecialKey::F4, "F4"},
        {SpecialKey::F5, "F5"},
        {SpecialKey::F6, "F6"},
        {SpecialKey::F7, "F7"},
        {SpecialKey::F8, "F8"},
        {SpecialKey::F9, "F9"},
        {SpecialKey::F10, "F10"},
        {SpecialKey::F11, "F11"},
        {SpecialKey::F12, "F12"},
        {SpecialKey::Space, "Space"},
}};
} // namespace

auto RawInput::keyPress(char32_t ch, KeyModifiers mods) -> RawInput {
    RawInput input;
    input.type      = InputType::Key;
    input.key       = ch;
    input.modifiers = mods;
    input.timestamp = Clock::now();
    return input;
}

auto RawInput::specialKey(SpecialKey key, KeyModifiers mods) -> RawInput {
    RawInput input;
    input.type      = InputType::Key;
    input.special   = key;
    input.modifiers = mods;
    input.timestamp = Clock::now();
    return input;
}

auto RawInput::mouse(MouseAction action, MouseButton button, int x, int y) -> RawInput {
    RawInput input;
    input.type        = InputType::Mouse;
    input.mouseAction = action;
    input.mouseButton = button;
    input.mouseX      = x;
    input.mouseY      = y;
    input.timestamp   = Clock::now();
    return input;
}

auto RawInput::resize(int width, int height) -> RawInput {
    RawInput input;
    input.type      = InputType::Resize;
    input.width     = width;
    input.height    = height;
    input.timestamp = Clock::now();
    return input;
}

auto RawInput::paste(std::string text) -> RawInput {
    RawInput input;
    input.type      = InputType::Paste;
    input.text      = std::move(text);
    input.timestamp = Clock::now();
    return input;
}

// Timestamps are ignored.
auto RawInput::operator==(RawInput const& other) const -> bool {
    return type == other.type && key == other.key && special == other.special && modifiers == other.modifiers && mouseX == other.mouseX
           && mouseY == other.mouseY && mouseButton == other.mouseButton && mouseAction == other.mouseAction && width == other.width
           && height == other.height && text == other.text && signal == other.signal;
}

auto toString(SpecialKey key) -> std::string_view {
    for (auto const& [k, name] : kKeyNames) {
        if (k == key)
            return name;
    }
    return "Unknown";
}

auto specialKeyFromString(std::string_view name) -> SpecialKey {
    if (name == "Escape")
        return SpecialKey::Escape;
    if (name == "PgUp")
        return SpecialKey::PageUp;
    if (name == "PgDn")
        return SpecialKey::PageDown;
    for (auto const& [k, keyName] : kKeyNames) {
        if (keyName == name)
            return k;
    }
    return SpecialKey::None;
}

auto toUtf8(char32_t cp) -> std::string {
    std::string out;
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    return out;
}

auto describeKey(RawInput const& input) -> std::string {
    if (input.type != InputType::Key)
        return {};
    std::string prefix;
    if (hasModifier(input.modifiers, KeyModifiers::Ctrl))
        prefix += "C-";
    if (hasModifier(input.modifiers, KeyModifiers::Alt))
        prefix += "A-";
    if (hasModifier(input.modifiers, KeyModifiers::Shift))
        prefix += "S-";
    if (input.special != SpecialKey::None)
        return prefix + std::string(toString(input.special));
    if (input.key != 0)
        return prefix + toUtf8(input.key);
    return {};
}

} // namespace TS
