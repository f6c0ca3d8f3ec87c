#include <doctest/doctest.h>

#include <termspace/input/KeyMap.hpp>

#include <filesystem>
#include <fstream>

using namespace TS;

TEST_SUITE("input.keymap") {

TEST_CASE("default special keys") {
    KeyMap keys;
    CHECK(keys.map(RawInput::specialKey(SpecialKey::Tab))->type == ActionType::NavigateNext);
    CHECK(keys.map(RawInput::specialKey(SpecialKey::Tab, KeyModifiers::Shift))->type == ActionType::NavigatePrev);
    CHECK(keys.map(RawInput::specialKey(SpecialKey::Enter))->type == ActionType::Submit);
    CHECK(keys.map(RawInput::specialKey(SpecialKey::Escape))->type == ActionType::Cancel);
    CHECK(keys.map(RawInput::keyPress(U'c', KeyModifiers::Ctrl))->type == ActionType::Quit);
    CHECK(keys.map(RawInput::keyPress(U'z', KeyModifiers::Ctrl))->type == ActionType::Undo);
    CHECK_FALSE(keys.map(RawInput::specialKey(SpecialKey::F12)).has_value());
}

TEST_CASE("bound actions carry the raw input") {
    KeyMap keys;
    auto   action = keys.map(RawInput::specialKey(SpecialKey::Up));
    REQUIRE(action.has_value());
    auto raw = action->payloadAs<RawInput>();
    REQUIRE(raw.has_value());
    CHECK(raw->special == SpecialKey::Up);
}

TEST_CASE("printable characters become input_char") {
    KeyMap keys;
    auto   action = keys.map(RawInput::keyPress(U'ä'));
    REQUIRE(action.has_value());
    CHECK(action->type == ActionType::InputChar);
    CHECK(action->payloadAs<char32_t>().value() == U'ä');
    CHECK_FALSE(keys.map(RawInput::keyPress(U'x', KeyModifiers::Alt)).has_value());
}

TEST_CASE("paste becomes input_text") {
    KeyMap keys;
    auto   action = keys.map(RawInput::paste("pasted"));
    REQUIRE(action.has_value());
    CHECK(action->type == ActionType::InputText);
    CHECK(action->payloadAs<std::string>().value() == "pasted");
    CHECK_FALSE(keys.map(RawInput::resize(10, 10)).has_value());
}

TEST_CASE("combos override contexts and defaults") {
    KeyMap keys;
    keys.bind("C-s", ActionType::Submit);
    keys.bind("Tab", ActionType::Help);
    CHECK(keys.map(RawInput::keyPress(U's', KeyModifiers::Ctrl))->type == ActionType::Submit);
    CHECK(keys.map(RawInput::specialKey(SpecialKey::Tab))->type == ActionType::Help);
    CHECK(keys.unbind("Tab"));
    CHECK(keys.map(RawInput::specialKey(SpecialKey::Tab))->type == ActionType::NavigateNext);
}

TEST_CASE("the vim context is opt-in") {
    KeyMap keys;
    CHECK(keys.map(RawInput::keyPress(U'j'))->type == ActionType::InputChar);
    keys.pushContext("vim");
    CHECK(keys.currentContext() == std::optional<std::string>("vim"));
    CHECK(keys.map(RawInput::keyPress(U'j'))->type == ActionType::NavigateDown);
    CHECK(keys.popContext() == std::optional<std::string>("vim"));
    CHECK(keys.map(RawInput::keyPress(U'j'))->type == ActionType::InputChar);
}

TEST_CASE("config documents add bindings on top of the defaults") {
    auto loaded = loadKeyMapFromString(R"({
        "system": {"quit": ["C-x"]},
        "navigation": {"next": "C-n"},
        "contexts": {"menu": {"cancel": ["Escape"], "down": ["j"]}}
    })");
    REQUIRE(loaded.has_value());
    auto& keys = *loaded;
    CHECK(keys.map(RawInput::keyPress(U'x', KeyModifiers::Ctrl))->type == ActionType::Quit);
    CHECK(keys.map(RawInput::keyPress(U'n', KeyModifiers::Ctrl))->type == ActionType::NavigateNext);
    CHECK(keys.map(RawInput::keyPress(U'c', KeyModifiers::Ctrl))->type == ActionType::Quit);

    keys.pushContext("menu");
    CHECK(keys.map(RawInput::keyPress(U'j'))->type == ActionType::NavigateDown);
}

TEST_CASE("malformed configs are rejected") {
    CHECK(loadKeyMapFromString("{not json").error().code == Error::Code::MalformedInput);
    CHECK(loadKeyMapFromString("[1, 2]").error().code == Error::Code::MalformedInput);
    CHECK(loadKeyMapFromString(R"({"system": {"quit": [1]}})").error().code == Error::Code::MalformedInput);
}

TEST_CASE("a missing file yields the defaults") {
    auto path   = std::filesystem::temp_directory_path() / "termspace-keymap-missing.json";
    std::filesystem::remove(path);
    auto loaded = loadKeyMap(path);
    REQUIRE(loaded.has_value());
    CHECK(loaded->map(RawInput::specialKey(SpecialKey::Enter))->type == ActionType::Submit);

    {
        std::ofstream out(path);
        out << R"({"form": {"submit": ["C-j"]}})";
    }
    auto fromFile = loadKeyMap(path);
    REQUIRE(fromFile.has_value());
    CHECK(fromFile->map(RawInput::keyPress(U'j', KeyModifiers::Ctrl))->type == ActionType::Submit);
    std::filesystem::remove(path);
}

} // TEST_SUITE
