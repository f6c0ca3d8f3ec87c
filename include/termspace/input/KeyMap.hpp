#pragma once
#include <termspace/action/Action.hpp>
#include <termspace/core/Error.hpp>
#include <termspace/input/RawInput.hpp>

#include <parallel_hashmap/phmap.h>

#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace TS {

/**
 * Translates RawInput into semantic Actions.
 *
 * Lookup order for key presses:
 *  1. explicit combo bindings ("C-s", "A-x", "S-Tab", "C-S-a")
 *  2. the innermost context on the context stack
 *  3. the default table of named special keys
 *  4. unmodified printable characters become input_char
 * Paste input becomes input_text. Anything else maps to nothing.
 *
 * Bound actions carry the RawInput as payload; input_char carries the
 * char32_t and input_text the pasted std::string.
 */
class KeyMap {
public:
    using Table = phmap::flat_hash_map<std::string, ActionType>;

    KeyMap();
    KeyMap(KeyMap const& other);
    auto operator=(KeyMap const& other) -> KeyMap&;

    auto bind(std::string combo, ActionType type) -> void;
    auto unbind(std::string const& combo) -> bool;
    [[nodiscard]] auto binding(std::string const& combo) const -> std::optional<ActionType>;

    // Context tables are keyed by key name with modifiers ("Up", "k", "C-n").
    auto bindContext(std::string name, Table table) -> void;
    auto pushContext(std::string name) -> void;
    auto popContext() -> std::optional<std::string>;
    auto clearContexts() -> void;
    [[nodiscard]] auto currentContext() const -> std::optional<std::string>;

    auto setDefault(SpecialKey key, ActionType type) -> void;

    [[nodiscard]] auto map(RawInput const& input) const -> std::optional<Action>;

private:
    auto installDefaults() -> void;

    mutable std::shared_mutex                          mutex;
    phmap::flat_hash_map<SpecialKey, ActionType>       defaults;
    phmap::flat_hash_map<std::string, Table>           contexts;
    std::vector<std::string>                           contextStack;
    Table                                              combos;
};

// Loads key bindings from a JSON document with the sections "navigation",
// "editing", "form", "system", "scroll" (name -> [keys]) and "contexts"
// (context -> name -> [keys]), applied on top of the default map.
[[nodiscard]] auto loadKeyMapFromString(std::string_view json) -> Expected<KeyMap>;
// A missing file yields the default map.
[[nodiscard]] auto loadKeyMap(std::filesystem::path const& path) -> Expected<KeyMap>;

} // namespace TS
