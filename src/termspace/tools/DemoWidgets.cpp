#include "DemoWidgets.hpp"

#include <termspace/input/RawInput.hpp>
#include <termspace/paint/CellBuffer.hpp>

#include <algorithm>

namespace TS::Demo {

namespace {

auto encode(std::u32string const& text) -> std::string {
    std::string out;
    for (auto ch : text)
        out += toUtf8(ch);
    return out;
}

auto textWidth(std::string const& text) -> int {
    return static_cast<int>(decodeUtf8(text).size());
}

auto isWordChar(char32_t ch) -> bool {
    return ch != U' ' && ch != U'\t';
}

} // namespace

Label::Label(std::string id, std::string text)
    : labelId(std::move(id)), text(std::move(text)) {}

auto Label::measure(Constraints const& constraints) -> Size {
    return Size{std::min(textWidth(this->text), constraints.maxWidth), 1};
}

auto Label::paint(PaintContext& ctx) -> void {
    ctx.drawText(0, 0, this->text);
}

auto Label::inspectProps() const -> Json {
    return Json::object();
}

auto Label::inspectState() const -> Json {
    return Json{{"text", this->text}};
}

auto Label::restoreState(Json const& state) -> void {
    if (auto it = state.find("text"); it != state.end() && it->is_string())
        this->text = it->get<std::string>();
}

TextInput::TextInput(std::string id, std::string placeholder, int width)
    : inputId(std::move(id)), placeholder(std::move(placeholder)), width(width) {}

auto TextInput::measure(Constraints const& constraints) -> Size {
    return Size{std::min(this->width, constraints.maxWidth), 1};
}

auto TextInput::paint(PaintContext& ctx) -> void {
    CellStyle style;
    style.underline = true;
    style.reverse   = ctx.focused;
    ctx.fill(Cell{U' ', style});
    if (this->content.empty()) {
        CellStyle dim = style;
        dim.italic    = true;
        ctx.drawText(0, 0, this->placeholder, dim);
        return;
    }
    // Keep the cursor visible when the value is wider than the field.
    int const   visible = std::max(ctx.bounds().width - 1, 1);
    std::size_t offset  = 0;
    if (static_cast<int>(this->cursor) > visible)
        offset = this->cursor - static_cast<std::size_t>(visible);
    ctx.drawText(0, 0, encode(this->content.substr(offset)), style);
}

auto TextInput::inspectProps() const -> Json {
    return Json{{"placeholder", this->placeholder}, {"width", this->width}};
}

auto TextInput::inspectState() const -> Json {
    return Json{{"value", this->value()}, {"cursor", this->cursor}};
}

auto TextInput::restoreState(Json const& state) -> void {
    if (auto it = state.find("value"); it != state.end() && it->is_string())
        this->content = decodeUtf8(it->get<std::string>());
    this->cursor = this->content.size();
    if (auto it = state.find("cursor"); it != state.end() && it->is_number_unsigned())
        this->cursor = std::min(it->get<std::size_t>(), this->content.size());
}

auto TextInput::setStateValue(std::string const& key, Json const& value) -> bool {
    if (key != "value" || !value.is_string())
        return false;
    this->content = decodeUtf8(value.get<std::string>());
    this->cursor  = this->content.size();
    return true;
}

auto TextInput::handleAction(Action const& action) -> bool {
    if (this->disabled)
        return false;
    switch (action.type) {
    case ActionType::InputChar: {
        auto ch = action.payloadAs<char32_t>();
        if (!ch)
            return false;
        this->insert(std::u32string(1, *ch));
        return true;
    }
    case ActionType::InputText: {
        auto text = action.payloadAs<std::string>();
        if (!text)
            return false;
        this->insert(decodeUtf8(*text));
        return true;
    }
    case ActionType::Backspace:
        if (this->cursor > 0) {
            this->content.erase(this->cursor - 1, 1);
            --this->cursor;
        }
        return true;
    case ActionType::DeleteChar:
        if (this->cursor < this->content.size())
            this->content.erase(this->cursor, 1);
        return true;
    case ActionType::DeleteWord: {
        auto start = this->cursor;
        while (start > 0 && !isWordChar(this->content[start - 1]))
            --start;
        while (start > 0 && isWordChar(this->content[start - 1]))
            --start;
        this->content.erase(start, this->cursor - start);
        this->cursor = start;
        return true;
    }
    case ActionType::DeleteLine:
    case ActionType::Clear:
        this->content.clear();
        this->cursor = 0;
        return true;
    case ActionType::CursorHome:
        this->cursor = 0;
        return true;
    case ActionType::CursorEnd:
        this->cursor = this->content.size();
        return true;
    case ActionType::CursorLeft:
        if (this->cursor > 0)
            --this->cursor;
        return true;
    case ActionType::CursorRight:
        if (this->cursor < this->content.size())
            ++this->cursor;
        return true;
    default:
        return false;
    }
}

auto TextInput::value() const -> std::string {
    return encode(this->content);
}

auto TextInput::insert(std::u32string const& text) -> void {
    this->content.insert(this->cursor, text);
    this->cursor += text.size();
}

Button::Button(std::string id, std::string label, OnPress onPress)
    : buttonId(std::move(id)), label(std::move(label)), onPress(std::move(onPress)) {}

auto Button::measure(Constraints const& constraints) -> Size {
    return Size{std::min(textWidth(this->label) + 4, constraints.maxWidth), 1};
}

auto Button::paint(PaintContext& ctx) -> void {
    CellStyle style;
    style.bold    = true;
    style.reverse = ctx.focused;
    ctx.drawText(0, 0, "[ " + this->label + " ]", style);
}

auto Button::inspectProps() const -> Json {
    return Json{{"label", this->label}};
}

auto Button::inspectState() const -> Json {
    return Json{{"presses", this->pressCount}};
}

auto Button::restoreState(Json const& state) -> void {
    if (auto it = state.find("presses"); it != state.end() && it->is_number_integer())
        this->pressCount = it->get<int>();
}

auto Button::handleAction(Action const& action) -> bool {
    switch (action.type) {
    case ActionType::Submit:
    case ActionType::MouseClick:
        ++this->pressCount;
        if (this->onPress)
            this->onPress();
        return true;
    case ActionType::InputChar: {
        auto ch = action.payloadAs<char32_t>();
        if (!ch || *ch != U' ')
            return false;
        ++this->pressCount;
        if (this->onPress)
            this->onPress();
        return true;
    }
    default:
        return false;
    }
}

auto buildForm() -> std::unique_ptr<LayoutNode> {
    Style rootStyle;
    rootStyle.padding = Insets::all(1);
    rootStyle.gap     = 1;
    auto root         = std::make_unique<LayoutNode>("form", NodeKind::Column, rootStyle);

    auto title = std::make_unique<LayoutNode>("title", NodeKind::Text);
    title->setText("TermSpace demo: Tab moves focus, Enter submits, Ctrl+Z undoes, Ctrl+C quits");
    root->addChild(std::move(title));

    auto addField = [&root](std::string const& id, std::string const& caption, std::string const& placeholder) {
        Style rowStyle;
        rowStyle.gap = 1;
        auto row     = std::make_unique<LayoutNode>(id + "-row", NodeKind::Row, rowStyle);

        Style captionStyle;
        captionStyle.width = 8;
        auto label         = std::make_unique<LayoutNode>(id + "-label", NodeKind::Custom, captionStyle);
        label->setComponent(std::make_shared<Label>(id + "-label", caption));
        row->addChild(std::move(label));

        auto input = std::make_unique<LayoutNode>(id, NodeKind::Custom);
        input->setComponent(std::make_shared<TextInput>(id, placeholder));
        row->addChild(std::move(input));
        root->addChild(std::move(row));
    };
    addField("name", "Name", "your name");
    addField("email", "Email", "you@example.com");

    auto status       = std::make_shared<Label>("status", "");
    auto statusHandle = std::weak_ptr<Label>(status);
    auto* rootPtr     = root.get();

    auto submit = std::make_unique<LayoutNode>("submit", NodeKind::Custom);
    submit->setComponent(std::make_shared<Button>("submit", "Submit", [statusHandle, rootPtr] {
        auto label = statusHandle.lock();
        if (!label)
            return;
        std::string name;
        if (auto* node = rootPtr->find("name")) {
            if (auto input = std::dynamic_pointer_cast<TextInput>(node->component()))
                name = input->value();
        }
        label->setText(name.empty() ? "Please enter a name" : "Submitted " + name);
        if (auto* node = rootPtr->find("status"))
            node->markDirty();
    }));
    root->addChild(std::move(submit));

    Style statusStyle;
    statusStyle.width = 40;
    auto statusNode   = std::make_unique<LayoutNode>("status", NodeKind::Custom, statusStyle);
    statusNode->setComponent(std::move(status));
    root->addChild(std::move(statusNode));
    return root;
}

} // namespace TS::Demo
