#pragma once
#include <termspace/input/RawInput.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace TS {

/**
 * Incremental decoder for the terminal byte stream.
 *
 * feed() appends bytes and returns every input that could be decoded.
 * A sequence cut at the end of the buffer is kept and retried on the next
 * feed(); once it grows past kMaxSequence bytes without resolving it is
 * dropped. A lone trailing ESC stays pending until flush() turns it into an
 * Escape key press, which callers do after an idle read timeout.
 *
 * Recognised: control keys, ctrl-letters, UTF-8 text, ESC-prefixed alt keys,
 * CSI cursor/editing/function keys with xterm modifier parameters, SS3 keys,
 * SGR (ESC[<b;x;yM) and X10 (ESC[M + 3 bytes) mouse reports and bracketed
 * paste.
 */
class InputDecoder {
public:
    static constexpr std::size_t kMaxSequence = 64;

    auto feed(std::string_view bytes) -> std::vector<RawInput>;
    auto flush() -> std::vector<RawInput>;
    auto reset() -> void;

    [[nodiscard]] auto pending() const -> std::size_t { return this->buffer.size(); }
    [[nodiscard]] auto inPaste() const -> bool { return this->pasting; }

private:
    enum class Status {
        Complete,
        Incomplete,
        Invalid
    };

    struct Parsed {
        Status                  status   = Status::Invalid;
        std::size_t             consumed = 0;
        std::optional<RawInput> input;
    };

    auto drain(std::vector<RawInput>& out) -> void;
    auto drainPaste(std::vector<RawInput>& out) -> bool;
    [[nodiscard]] auto parseOne(std::string_view buf) -> Parsed;
    [[nodiscard]] auto parseEscape(std::string_view buf) -> Parsed;
    [[nodiscard]] auto parseCsi(std::string_view buf) -> Parsed;
    [[nodiscard]] static auto parseSgrMouse(std::string_view buf) -> Parsed;
    [[nodiscard]] static auto parseX10Mouse(std::string_view buf) -> Parsed;
    [[nodiscard]] static auto parseSs3(std::string_view buf) -> Parsed;
    [[nodiscard]] static auto parseUtf8(std::string_view buf) -> Parsed;

    std::string buffer;
    bool        pasting = false;
    std::string pasteText;
};

} // namespace TS
