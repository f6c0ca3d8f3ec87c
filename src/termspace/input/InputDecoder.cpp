#include <termspace/input/InputDecoder.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>
#include <charconv>

namespace TS {

namespace {

constexpr char             kEsc = '\x1b';
constexpr std::string_view kPasteEnd{"\x1b[201~"};

// xterm encodes modifiers as 1 + bitmask(shift=1, alt=2, ctrl=4, meta=8).
auto xtermModifiers(int param) -> KeyModifiers {
    if (param <= 1)
        return KeyModifiers::None;
    int const bits = param - 1;
    auto      mods = KeyModifiers::None;
    if (bits & 1)
        mods = mods | KeyModifiers::Shift;
    if (bits & 2)
        mods = mods | KeyModifiers::Alt;
    if (bits & 4)
        mods = mods | KeyModifiers::Ctrl;
    if (bits & 8)
        mods = mods | KeyModifiers::Meta;
    return mods;
}

auto parseParams(std::string_view text) -> std::vector<int> {
    std::vector<int> params;
    std::size_t      start = 0;
    while (start <= text.size()) {
        auto end   = text.find(';', start);
        auto piece = text.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
        int  value = 0;
        if (!piece.empty())
            std::from_chars(piece.data(), piece.data() + piece.size(), value);
        params.push_back(value);
        if (end == std::string_view::npos)
            break;
        start = end + 1;
    }
    return params;
}

auto tildeKey(int code) -> SpecialKey {
    switch (code) {
    case 1:
    case 7:
        return SpecialKey::Home;
    case 2:
        return SpecialKey::Insert;
    case 3:
        return SpecialKey::Delete;
    case 4:
    case 8:
        return SpecialKey::End;
    case 5:
        return SpecialKey::PageUp;
    case 6:
        return SpecialKey::PageDown;
    case 11:
        return SpecialKey::F1;
    case 12:
        return SpecialKey::F2;
    case 13:
        return SpecialKey::F3;
    case 14:
        return SpecialKey::F4;
    case 15:
        return SpecialKey::F5;
    case 17:
        return SpecialKey::F6;
    case 18:
        return SpecialKey::F7;
    case 19:
        return SpecialKey::F8;
    case 20:
        return SpecialKey::F9;
    case 21:
        return SpecialKey::F10;
    case 23:
        return SpecialKey::F11;
    case 24:
        return SpecialKey::F12;
    default:
        return SpecialKey::None;
    }
}

// Final bytes shared by CSI and SS3 sequences.
auto finalKey(char final) -> SpecialKey {
    switch (final) {
    case 'A':
        return SpecialKey::Up;
    case 'B':
        return SpecialKey::Down;
    case 'C':
        return SpecialKey::Right;
    case 'D':
        return SpecialKey::Left;
    case 'F':
        return SpecialKey::End;
    case 'H':
        return SpecialKey::Home;
    case 'P':
        return SpecialKey::F1;
    case 'Q':
        return SpecialKey::F2;
    case 'R':
        return SpecialKey::F3;
    case 'S':
        return SpecialKey::F4;
    default:
        return SpecialKey::None;
    }
}

auto mouseButtonBits(int bits) -> MouseButton {
    switch (bits & 0x03) {
    case 0:
        return MouseButton::Left;
    case 1:
        return MouseButton::Middle;
    case 2:
        return MouseButton::Right;
    default:
        return MouseButton::None;
    }
}

auto mouseModifiers(int cb) -> KeyModifiers {
    auto mods = KeyModifiers::None;
    if (cb & 4)
        mods = mods | KeyModifiers::Shift;
    if (cb & 8)
        mods = mods | KeyModifiers::Alt;
    if (cb & 16)
        mods = mods | KeyModifiers::Ctrl;
    return mods;
}

// Shared by both mouse encodings once the button byte is known.
auto decodeMouse(int cb, int x, int y, bool release) -> RawInput {
    RawInput input = RawInput::mouse(MouseAction::Press, MouseButton::None, std::max(x, 0), std::max(y, 0));
    input.modifiers = mouseModifiers(cb);
    if (cb & 64) {
        input.mouseAction = (cb & 1) ? MouseAction::WheelDown : MouseAction::WheelUp;
    } else if (cb & 32) {
        input.mouseAction = MouseAction::Motion;
        input.mouseButton = mouseButtonBits(cb);
    } else {
        input.mouseButton = mouseButtonBits(cb);
        if (release || input.mouseButton == MouseButton::None)
            input.mouseAction = MouseAction::Release;
    }
    return input;
}

} // namespace

auto InputDecoder::feed(std::string_view bytes) -> std::vector<RawInput> {
    this->buffer.append(bytes.data(), bytes.size());
    std::vector<RawInput> out;
    this->drain(out);
    return out;
}

auto InputDecoder::flush() -> std::vector<RawInput> {
    std::vector<RawInput> out;
    this->drain(out);
    while (!this->buffer.empty() && !this->pasting) {
        if (this->buffer.front() == kEsc)
            out.push_back(RawInput::specialKey(SpecialKey::Escape));
        else
            ts_log("InputDecoder::flush dropping stray byte", "Input");
        this->buffer.erase(0, 1);
        this->drain(out);
    }
    return out;
}

auto InputDecoder::reset() -> void {
    this->buffer.clear();
    this->pasteText.clear();
    this->pasting = false;
}

auto InputDecoder::drain(std::vector<RawInput>& out) -> void {
    while (!this->buffer.empty()) {
        if (this->pasting) {
            if (!this->drainPaste(out))
                return;
            continue;
        }
        auto parsed = this->parseOne(this->buffer);
        if (parsed.status == Status::Incomplete) {
            if (this->buffer.size() <= kMaxSequence)
                return;
            ts_log("InputDecoder dropping unterminated sequence", "Input");
            this->buffer.erase(0, kMaxSequence);
            continue;
        }
        if (parsed.input)
            out.push_back(std::move(*parsed.input));
        this->buffer.erase(0, std::max<std::size_t>(parsed.consumed, 1));
    }
}

auto InputDecoder::drainPaste(std::vector<RawInput>& out) -> bool {
    auto end = this->buffer.find(kPasteEnd);
    if (end != std::string::npos) {
        this->pasteText.append(this->buffer, 0, end);
        out.push_back(RawInput::paste(std::move(this->pasteText)));
        this->pasteText.clear();
        this->pasting = false;
        this->buffer.erase(0, end + kPasteEnd.size());
        return true;
    }
    // Hold back a tail that could be the start of the terminator.
    std::size_t keep = 0;
    for (std::size_t k = std::min(kPasteEnd.size() - 1, this->buffer.size()); k > 0; --k) {
        if (kPasteEnd.starts_with(std::string_view(this->buffer).substr(this->buffer.size() - k))) {
            keep = k;
            break;
        }
    }
    this->pasteText.append(this->buffer, 0, this->buffer.size() - keep);
    this->buffer.erase(0, this->buffer.size() - keep);
    return false;
}

auto InputDecoder::parseOne(std::string_view buf) -> Parsed {
    auto const b = static_cast<unsigned char>(buf.front());
    if (b == 0x1b)
        return this->parseEscape(buf);

    switch (b) {
    case '\r':
    case '\n':
        return Parsed{Status::Complete, 1, RawInput::specialKey(SpecialKey::Enter)};
    case '\t':
        return Parsed{Status::Complete, 1, RawInput::specialKey(SpecialKey::Tab)};
    case 0x7f:
    case 0x08:
        return Parsed{Status::Complete, 1, RawInput::specialKey(SpecialKey::Backspace)};
    case 0x00:
        return Parsed{Status::Complete, 1, RawInput::keyPress(U' ', KeyModifiers::Ctrl)};
    default:
        break;
    }
    if (b >= 0x01 && b <= 0x1a)
        return Parsed{Status::Complete, 1, RawInput::keyPress(static_cast<char32_t>(U'a' + (b - 1)), KeyModifiers::Ctrl)};
    if (b < 0x20)
        return Parsed{Status::Complete, 1, std::nullopt};
    if (b < 0x7f)
        return Parsed{Status::Complete, 1, RawInput::keyPress(static_cast<char32_t>(b))};
    return parseUtf8(buf);
}

auto InputDecoder::parseEscape(std::string_view buf) -> Parsed {
    if (buf.size() < 2)
        return Parsed{Status::Incomplete, 0, std::nullopt};

    char const next = buf[1];
    if (next == '[')
        return this->parseCsi(buf);
    if (next == 'O')
        return parseSs3(buf);
    if (next == kEsc)
        return Parsed{Status::Complete, 1, RawInput::specialKey(SpecialKey::Escape)};

    auto inner = this->parseOne(buf.substr(1));
    if (inner.status == Status::Incomplete)
        return inner;
    if (inner.status == Status::Complete && inner.input && inner.input->type == InputType::Key) {
        inner.input->modifiers = inner.input->modifiers | KeyModifiers::Alt;
        return Parsed{Status::Complete, inner.consumed + 1, std::move(inner.input)};
    }
    return Parsed{Status::Complete, 1, RawInput::specialKey(SpecialKey::Escape)};
}

auto InputDecoder::parseCsi(std::string_view buf) -> Parsed {
    if (buf.size() < 3)
        return Parsed{Status::Incomplete, 0, std::nullopt};
    if (buf[2] == '<')
        return parseSgrMouse(buf);
    if (buf[2] == 'M')
        return parseX10Mouse(buf);

    std::size_t finalAt = 0;
    for (std::size_t i = 2; i < buf.size(); ++i) {
        auto const c = static_cast<unsigned char>(buf[i]);
        if (c >= 0x40 && c <= 0x7e) {
            finalAt = i;
            break;
        }
        if (c == 0x1b)
            return Parsed{Status::Invalid, i, std::nullopt};
        if (c < 0x20)
            return Parsed{Status::Invalid, i + 1, std::nullopt};
    }
    if (finalAt == 0)
        return Parsed{Status::Incomplete, 0, std::nullopt};

    auto const       paramText = buf.substr(2, finalAt - 2);
    char const       final     = buf[finalAt];
    std::size_t const consumed = finalAt + 1;

    if (final == '~' && paramText == "200") {
        this->pasting = true;
        this->pasteText.clear();
        return Parsed{Status::Complete, consumed, std::nullopt};
    }

    auto const params = parseParams(paramText);
    auto       mods   = params.size() >= 2 ? xtermModifiers(params[1]) : KeyModifiers::None;

    if (final == 'Z')
        return Parsed{Status::Complete, consumed, RawInput::specialKey(SpecialKey::Tab, mods | KeyModifiers::Shift)};
    if (final == '~') {
        auto key = tildeKey(params.empty() ? 0 : params[0]);
        if (key == SpecialKey::None)
            return Parsed{Status::Complete, consumed, std::nullopt};
        return Parsed{Status::Complete, consumed, RawInput::specialKey(key, mods)};
    }
    if (auto key = finalKey(final); key != SpecialKey::None)
        return Parsed{Status::Complete, consumed, RawInput::specialKey(key, mods)};
    return Parsed{Status::Complete, consumed, std::nullopt};
}

auto InputDecoder::parseSgrMouse(std::string_view buf) -> Parsed {
    std::size_t end = 0;
    for (std::size_t i = 3; i < buf.size(); ++i) {
        char const c = buf[i];
        if (c == 'M' || c == 'm') {
            end = i;
            break;
        }
        if (!(c == ';' || (c >= '0' && c <= '9')))
            return Parsed{Status::Invalid, i, std::nullopt};
    }
    if (end == 0)
        return Parsed{Status::Incomplete, 0, std::nullopt};

    auto const params = parseParams(buf.substr(3, end - 3));
    if (params.size() != 3)
        return Parsed{Status::Invalid, end + 1, std::nullopt};
    auto input = decodeMouse(params[0], params[1] - 1, params[2] - 1, buf[end] == 'm');
    return Parsed{Status::Complete, end + 1, std::move(input)};
}

auto InputDecoder::parseX10Mouse(std::string_view buf) -> Parsed {
    if (buf.size() < 6)
        return Parsed{Status::Incomplete, 0, std::nullopt};
    int const cb = static_cast<unsigned char>(buf[3]) - 32;
    int const cx = static_cast<unsigned char>(buf[4]) - 33;
    int const cy = static_cast<unsigned char>(buf[5]) - 33;
    return Parsed{Status::Complete, 6, decodeMouse(cb, cx, cy, false)};
}

auto InputDecoder::parseSs3(std::string_view buf) -> Parsed {
    if (buf.size() < 3)
        return Parsed{Status::Incomplete, 0, std::nullopt};
    auto key = finalKey(buf[2]);
    if (key == SpecialKey::None)
        return Parsed{Status::Complete, 3, std::nullopt};
    return Parsed{Status::Complete, 3, RawInput::specialKey(key)};
}

auto InputDecoder::parseUtf8(std::string_view buf) -> Parsed {
    auto const  lead   = static_cast<unsigned char>(buf.front());
    std::size_t length = 0;
    char32_t    cp     = 0;
    if ((lead & 0xE0) == 0xC0) {
        length = 2;
        cp     = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        cp     = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
        cp     = lead & 0x07;
    } else {
        return Parsed{Status::Invalid, 1, std::nullopt};
    }
    if (buf.size() < length)
        return Parsed{Status::Incomplete, 0, std::nullopt};
    for (std::size_t i = 1; i < length; ++i) {
        auto const c = static_cast<unsigned char>(buf[i]);
        if ((c & 0xC0) != 0x80)
            return Parsed{Status::Invalid, i, std::nullopt};
        cp = (cp << 6) | (c & 0x3F);
    }
    return Parsed{Status::Complete, length, RawInput::keyPress(cp)};
}

} // namespace TS
