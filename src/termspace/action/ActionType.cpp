#include <termspace/action/ActionType.hpp>

#include <array>

namespace TS {

namespace {
constexpr std::array<std::string_view, kActionTypeCount> kNames{
        "navigate_first",
        "navigate_last",
        "navigate_next",
        "navigate_prev",
        "navigate_up",
        "navigate_down",
        "navigate_left",
        "navigate_right",
        "navigate_page_up",
        "navigate_page_down",
        "input_char",
        "input_text",
        "delete_char",
        "delete_word",
        "delete_line",
        "backspace",
        "cursor_home",
        "cursor_end",
        "cursor_left",
        "cursor_right",
        "cursor_word_left",
        "cursor_word_right",
        "select_all",
        "select_word",
        "select_line",
        "submit",
        "cancel",
        "validate",
        "reset",
        "clear",
        "select_item",
        "deselect_item",
        "toggle_select",
        "select_range",
        "mouse_click",
        "mouse_double_click",
        "mouse_press",
        "mouse_release",
        "mouse_motion",
        "mouse_wheel",
        "scroll",
        "scroll_up",
        "scroll_down",
        "scroll_left",
        "scroll_right",
        "zoom_in",
        "zoom_out",
        "zoom_reset",
        "quit",
        "close",
        "maximize",
        "minimize",
        "fullscreen",
        "copy",
        "cut",
        "paste",
        "undo",
        "redo",
        "search",
        "help",
        "refresh",
        "ai_inspect",
        "ai_find",
        "ai_query",
        "ai_dispatch",
        "ai_wait",
        "ai_watch",
};
} // namespace

auto toString(ActionType type) -> std::string_view {
    auto index = static_cast<std::size_t>(type);
    if (index >= kNames.size())
        return "unknown";
    return kNames[index];
}

auto actionTypeFromString(std::string_view name) -> std::optional<ActionType> {
    for (std::size_t i = 0; i < kNames.size(); ++i) {
        if (kNames[i] == name)
            return static_cast<ActionType>(i);
    }
    return std::nullopt;
}

auto isNavigation(ActionType type) -> bool {
    return type >= ActionType::NavigateFirst && type <= ActionType::NavigatePageDown;
}

auto isMouse(ActionType type) -> bool {
    return type >= ActionType::MouseClick && type <= ActionType::MouseWheel;
}

} // namespace TS
