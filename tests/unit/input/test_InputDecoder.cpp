#include <doctest/doctest.h>

#include <termspace/input/InputDecoder.hpp>

#include <string>

using namespace TS;

TEST_SUITE("input.decoder") {

TEST_CASE("printable ascii and control keys") {
    InputDecoder decoder;
    auto         inputs = decoder.feed("a\r\t\x7f\x03");
    REQUIRE(inputs.size() == 5);
    CHECK(inputs[0] == RawInput::keyPress(U'a'));
    CHECK(inputs[1] == RawInput::specialKey(SpecialKey::Enter));
    CHECK(inputs[2] == RawInput::specialKey(SpecialKey::Tab));
    CHECK(inputs[3] == RawInput::specialKey(SpecialKey::Backspace));
    CHECK(inputs[4] == RawInput::keyPress(U'c', KeyModifiers::Ctrl));
}

TEST_CASE("utf-8 split across feeds") {
    InputDecoder decoder;
    CHECK(decoder.feed("\xc3").empty());
    CHECK(decoder.pending() == 1);
    auto inputs = decoder.feed("\xa9");
    REQUIRE(inputs.size() == 1);
    CHECK(inputs[0].key == U'é');
    CHECK(decoder.pending() == 0);
}

TEST_CASE("csi cursor keys with xterm modifiers") {
    InputDecoder decoder;
    auto         inputs = decoder.feed("\x1b[A\x1b[1;5C\x1b[3~\x1b[Z\x1bOP");
    REQUIRE(inputs.size() == 5);
    CHECK(inputs[0] == RawInput::specialKey(SpecialKey::Up));
    CHECK(inputs[1] == RawInput::specialKey(SpecialKey::Right, KeyModifiers::Ctrl));
    CHECK(inputs[2] == RawInput::specialKey(SpecialKey::Delete));
    CHECK(inputs[3] == RawInput::specialKey(SpecialKey::Tab, KeyModifiers::Shift));
    CHECK(inputs[4] == RawInput::specialKey(SpecialKey::F1));
}

TEST_CASE("a lone escape waits for flush") {
    InputDecoder decoder;
    CHECK(decoder.feed("\x1b").empty());
    auto flushed = decoder.flush();
    REQUIRE(flushed.size() == 1);
    CHECK(flushed[0] == RawInput::specialKey(SpecialKey::Escape));
}

TEST_CASE("escape prefix marks alt") {
    InputDecoder decoder;
    auto         inputs = decoder.feed("\x1bx");
    REQUIRE(inputs.size() == 1);
    CHECK(inputs[0] == RawInput::keyPress(U'x', KeyModifiers::Alt));
}

TEST_CASE("sgr mouse press, release and wheel") {
    InputDecoder decoder;
    auto         inputs = decoder.feed("\x1b[<0;5;3M\x1b[<0;5;3m\x1b[<64;1;1M\x1b[<65;1;1M");
    REQUIRE(inputs.size() == 4);
    CHECK(inputs[0] == RawInput::mouse(MouseAction::Press, MouseButton::Left, 4, 2));
    CHECK(inputs[1].mouseAction == MouseAction::Release);
    CHECK(inputs[2].mouseAction == MouseAction::WheelUp);
    CHECK(inputs[3].mouseAction == MouseAction::WheelDown);
}

TEST_CASE("x10 mouse report") {
    InputDecoder decoder;
    std::string  report{"\x1b[M"};
    report.push_back(static_cast<char>(32 + 2));
    report.push_back(static_cast<char>(33 + 9));
    report.push_back(static_cast<char>(33 + 4));
    auto inputs = decoder.feed(report);
    REQUIRE(inputs.size() == 1);
    CHECK(inputs[0] == RawInput::mouse(MouseAction::Press, MouseButton::Right, 9, 4));
}

TEST_CASE("bracketed paste survives chunking") {
    InputDecoder decoder;
    CHECK(decoder.feed("\x1b[200~hello ").empty());
    CHECK(decoder.inPaste());
    CHECK(decoder.feed("world\x1b[20").empty());
    auto inputs = decoder.feed("1~x");
    REQUIRE(inputs.size() == 2);
    CHECK(inputs[0] == RawInput::paste("hello world"));
    CHECK(inputs[1] == RawInput::keyPress(U'x'));
    CHECK_FALSE(decoder.inPaste());
}

TEST_CASE("an unterminated sequence is dropped once too long") {
    InputDecoder decoder;
    std::string  junk = "\x1b[" + std::string(InputDecoder::kMaxSequence, '1');
    auto         inputs = decoder.feed(junk);
    CHECK(decoder.pending() == 0);
    REQUIRE(inputs.size() == 2);
    CHECK(inputs[0] == RawInput::keyPress(U'1'));
}

} // TEST_SUITE
