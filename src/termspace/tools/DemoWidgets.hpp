#pragma once
#include <termspace/action/Target.hpp>
#include <termspace/core/Component.hpp>
#include <termspace/focus/FocusScope.hpp>
#include <termspace/layout/LayoutNode.hpp>
#include <termspace/paint/PaintContext.hpp>
#include <termspace/runtime/Inspectable.hpp>

#include <functional>
#include <string>

namespace TS::Demo {

class Label final : public Component, public Measurable, public Paintable, public Inspectable {
public:
    Label(std::string id, std::string text);

    [[nodiscard]] auto id() const -> std::string override { return this->labelId; }
    [[nodiscard]] auto type() const -> std::string override { return "Label"; }

    [[nodiscard]] auto measure(Constraints const& constraints) -> Size override;
    auto paint(PaintContext& ctx) -> void override;

    [[nodiscard]] auto inspectProps() const -> Json override;
    [[nodiscard]] auto inspectState() const -> Json override;
    auto restoreState(Json const& state) -> void override;

    auto setText(std::string text) -> void { this->text = std::move(text); }

private:
    std::string labelId;
    std::string text;
};

// Single-line editor. Cursor positions count code points.
class TextInput final : public Component, public Measurable, public Focusable, public Paintable, public Inspectable, public Target {
public:
    TextInput(std::string id, std::string placeholder, int width = 24);

    [[nodiscard]] auto id() const -> std::string override { return this->inputId; }
    [[nodiscard]] auto type() const -> std::string override { return "TextInput"; }

    [[nodiscard]] auto measure(Constraints const& constraints) -> Size override;
    [[nodiscard]] auto isFocusable() const -> bool override { return !this->disabled; }
    auto setFocused(bool value) -> void override { this->focused = value; }
    auto paint(PaintContext& ctx) -> void override;

    [[nodiscard]] auto inspectProps() const -> Json override;
    [[nodiscard]] auto inspectState() const -> Json override;
    [[nodiscard]] auto isDisabled() const -> bool override { return this->disabled; }
    auto restoreState(Json const& state) -> void override;
    auto setStateValue(std::string const& key, Json const& value) -> bool override;

    auto handleAction(Action const& action) -> bool override;

    [[nodiscard]] auto value() const -> std::string;
    auto setDisabled(bool value) -> void { this->disabled = value; }

private:
    auto insert(std::u32string const& text) -> void;

    std::string    inputId;
    std::string    placeholder;
    int            width;
    std::u32string content;
    std::size_t    cursor   = 0;
    bool           focused  = false;
    bool           disabled = false;
};

class Button final : public Component, public Measurable, public Focusable, public Paintable, public Inspectable, public Target {
public:
    using OnPress = std::function<void()>;

    Button(std::string id, std::string label, OnPress onPress = {});

    [[nodiscard]] auto id() const -> std::string override { return this->buttonId; }
    [[nodiscard]] auto type() const -> std::string override { return "Button"; }

    [[nodiscard]] auto measure(Constraints const& constraints) -> Size override;
    [[nodiscard]] auto isFocusable() const -> bool override { return true; }
    auto setFocused(bool value) -> void override { this->focused = value; }
    auto paint(PaintContext& ctx) -> void override;

    [[nodiscard]] auto inspectProps() const -> Json override;
    [[nodiscard]] auto inspectState() const -> Json override;
    auto restoreState(Json const& state) -> void override;

    auto handleAction(Action const& action) -> bool override;

    [[nodiscard]] auto presses() const -> int { return this->pressCount; }

private:
    std::string buttonId;
    std::string label;
    OnPress     onPress;
    int         pressCount = 0;
    bool        focused    = false;
};

// Name and email inputs, a submit button and a status line.
[[nodiscard]] auto buildForm() -> std::unique_ptr<LayoutNode>;

} // namespace TS::Demo
