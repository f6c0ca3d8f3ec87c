#pragma once
#include <cstdint>
#include <optional>
#include <string_view>

namespace TS {

enum class ActionType : std::uint8_t {
    // Navigation
    NavigateFirst,
    NavigateLast,
    NavigateNext,
    NavigatePrev,
    NavigateUp,
    NavigateDown,
    NavigateLeft,
    NavigateRight,
    NavigatePageUp,
    NavigatePageDown,
    // Editing
    InputChar,
    InputText,
    DeleteChar,
    DeleteWord,
    DeleteLine,
    Backspace,
    CursorHome,
    CursorEnd,
    CursorLeft,
    CursorRight,
    CursorWordLeft,
    CursorWordRight,
    SelectAll,
    SelectWord,
    SelectLine,
    // Form
    Submit,
    Cancel,
    Validate,
    Reset,
    Clear,
    // Selection
    SelectItem,
    DeselectItem,
    ToggleSelect,
    SelectRange,
    // Mouse
    MouseClick,
    MouseDoubleClick,
    MousePress,
    MouseRelease,
    MouseMotion,
    MouseWheel,
    // View
    Scroll,
    ScrollUp,
    ScrollDown,
    ScrollLeft,
    ScrollRight,
    ZoomIn,
    ZoomOut,
    ZoomReset,
    // Window
    Quit,
    Close,
    Maximize,
    Minimize,
    Fullscreen,
    // System
    Copy,
    Cut,
    Paste,
    Undo,
    Redo,
    Search,
    Help,
    Refresh,
    // Automation
    Inspect,
    Find,
    Query,
    Dispatch,
    Wait,
    Watch,
};

inline constexpr std::size_t kActionTypeCount = static_cast<std::size_t>(ActionType::Watch) + 1;

[[nodiscard]] auto toString(ActionType type) -> std::string_view;
[[nodiscard]] auto actionTypeFromString(std::string_view name) -> std::optional<ActionType>;

[[nodiscard]] auto isNavigation(ActionType type) -> bool;
[[nodiscard]] auto isMouse(ActionType type) -> bool;

} // namespace TS
