#include <termspace/input/KeyMap.hpp>

#include "log/TaggedLogger.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <mutex>
#include <sstream>

namespace TS {

KeyMap::KeyMap() {
    this->installDefaults();
}

KeyMap::KeyMap(KeyMap const& other) {
    std::shared_lock lock(other.mutex);
    this->defaults     = other.defaults;
    this->contexts     = other.contexts;
    this->contextStack = other.contextStack;
    this->combos       = other.combos;
}

auto KeyMap::operator=(KeyMap const& other) -> KeyMap& {
    if (this == &other)
        return *this;
    std::scoped_lock lock(this->mutex, other.mutex);
    this->defaults     = other.defaults;
    this->contexts     = other.contexts;
    this->contextStack = other.contextStack;
    this->combos       = other.combos;
    return *this;
}

auto KeyMap::installDefaults() -> void {
    this->defaults = {
            {SpecialKey::Up, ActionType::NavigateUp},
            {SpecialKey::Down, ActionType::NavigateDown},
            {SpecialKey::Left, ActionType::NavigateLeft},
            {SpecialKey::Right, ActionType::NavigateRight},
            {SpecialKey::Home, ActionType::CursorHome},
            {SpecialKey::End, ActionType::CursorEnd},
            {SpecialKey::PageUp, ActionType::NavigatePageUp},
            {SpecialKey::PageDown, ActionType::NavigatePageDown},
            {SpecialKey::Tab, ActionType::NavigateNext},
            {SpecialKey::Backspace, ActionType::Backspace},
            {SpecialKey::Delete, ActionType::DeleteChar},
            {SpecialKey::Enter, ActionType::Submit},
            {SpecialKey::Escape, ActionType::Cancel},
            {SpecialKey::F1, ActionType::Help},
            {SpecialKey::F5, ActionType::Refresh},
    };
    this->combos = {
            {"S-Tab", ActionType::NavigatePrev},
            {"C-c", ActionType::Quit},
            {"C-q", ActionType::Quit},
            {"C-z", ActionType::Undo},
            {"C-y", ActionType::Redo},
            {"C-w", ActionType::DeleteWord},
            {"C-k", ActionType::DeleteLine},
            {"C-u", ActionType::Clear},
    };
    // Vim-style movement is opt-in so letters still reach text inputs.
    this->contexts["vim"] = Table{
            {"k", ActionType::NavigateUp},
            {"j", ActionType::NavigateDown},
            {"h", ActionType::NavigateLeft},
            {"l", ActionType::NavigateRight},
    };
}

auto KeyMap::bind(std::string combo, ActionType type) -> void {
    std::unique_lock lock(this->mutex);
    this->combos[std::move(combo)] = type;
}

auto KeyMap::unbind(std::string const& combo) -> bool {
    std::unique_lock lock(this->mutex);
    return this->combos.erase(combo) > 0;
}

auto KeyMap::binding(std::string const& combo) const -> std::optional<ActionType> {
    std::shared_lock lock(this->mutex);
    if (auto it = this->combos.find(combo); it != this->combos.end())
        return it->second;
    return std::nullopt;
}

auto KeyMap::bindContext(std::string name, Table table) -> void {
    std::unique_lock lock(this->mutex);
    this->contexts[std::move(name)] = std::move(table);
}

auto KeyMap::pushContext(std::string name) -> void {
    std::unique_lock lock(this->mutex);
    this->contextStack.push_back(std::move(name));
}

auto KeyMap::popContext() -> std::optional<std::string> {
    std::unique_lock lock(this->mutex);
    if (this->contextStack.empty())
        return std::nullopt;
    auto name = std::move(this->contextStack.back());
    this->contextStack.pop_back();
    return name;
}

auto KeyMap::clearContexts() -> void {
    std::unique_lock lock(this->mutex);
    this->contextStack.clear();
}

auto KeyMap::currentContext() const -> std::optional<std::string> {
    std::shared_lock lock(this->mutex);
    if (this->contextStack.empty())
        return std::nullopt;
    return this->contextStack.back();
}

auto KeyMap::setDefault(SpecialKey key, ActionType type) -> void {
    std::unique_lock lock(this->mutex);
    this->defaults[key] = type;
}

auto KeyMap::map(RawInput const& input) const -> std::optional<Action> {
    if (input.type == InputType::Paste) {
        if (input.text.empty())
            return std::nullopt;
        return Action{ActionType::InputText}.withPayload(input.text);
    }
    if (input.type != InputType::Key)
        return std::nullopt;

    auto const combo = describeKey(input);

    std::shared_lock lock(this->mutex);
    if (!combo.empty()) {
        if (auto it = this->combos.find(combo); it != this->combos.end())
            return Action{it->second}.withPayload(input);

        if (!this->contextStack.empty()) {
            if (auto ctx = this->contexts.find(this->contextStack.back()); ctx != this->contexts.end()) {
                if (auto it = ctx->second.find(combo); it != ctx->second.end())
                    return Action{it->second}.withPayload(input);
            }
        }
    }

    if (input.special != SpecialKey::None) {
        if (auto it = this->defaults.find(input.special); it != this->defaults.end())
            return Action{it->second}.withPayload(input);
        return std::nullopt;
    }

    bool const chorded = hasModifier(input.modifiers, KeyModifiers::Ctrl) || hasModifier(input.modifiers, KeyModifiers::Alt)
                         || hasModifier(input.modifiers, KeyModifiers::Meta);
    if (input.key >= 0x20 && input.key != 0x7f && !chorded)
        return Action{ActionType::InputChar}.withPayload(input.key);

    ts_log("KeyMap no binding for " + combo, "Input");
    return std::nullopt;
}

namespace {

using NameTable = std::vector<std::pair<std::string_view, ActionType>>;

NameTable const kNavigationNames{
        {"next", ActionType::NavigateNext},
        {"prev", ActionType::NavigatePrev},
        {"up", ActionType::NavigateUp},
        {"down", ActionType::NavigateDown},
        {"left", ActionType::NavigateLeft},
        {"right", ActionType::NavigateRight},
        {"first", ActionType::NavigateFirst},
        {"last", ActionType::NavigateLast},
        {"page_up", ActionType::NavigatePageUp},
        {"page_down", ActionType::NavigatePageDown},
};

NameTable const kEditingNames{
        {"delete_char", ActionType::DeleteChar},
        {"delete_word", ActionType::DeleteWord},
        {"delete_line", ActionType::DeleteLine},
        {"backspace", ActionType::Backspace},
        {"select_all", ActionType::SelectAll},
        {"select_word", ActionType::SelectWord},
        {"select_line", ActionType::SelectLine},
        {"cursor_home", ActionType::CursorHome},
        {"cursor_end", ActionType::CursorEnd},
        {"cursor_left", ActionType::CursorLeft},
        {"cursor_right", ActionType::CursorRight},
        {"clear", ActionType::Clear},
};

NameTable const kFormNames{
        {"submit", ActionType::Submit},
        {"cancel", ActionType::Cancel},
        {"validate", ActionType::Validate},
        {"reset", ActionType::Reset},
};

NameTable const kSystemNames{
        {"quit", ActionType::Quit},
        {"help", ActionType::Help},
        {"search", ActionType::Search},
        {"refresh", ActionType::Refresh},
        {"copy", ActionType::Copy},
        {"paste", ActionType::Paste},
        {"undo", ActionType::Undo},
        {"redo", ActionType::Redo},
};

NameTable const kScrollNames{
        {"up", ActionType::ScrollUp},
        {"down", ActionType::ScrollDown},
        {"left", ActionType::ScrollLeft},
        {"right", ActionType::ScrollRight},
        {"zoom_in", ActionType::ZoomIn},
        {"zoom_out", ActionType::ZoomOut},
};

auto lookupName(NameTable const& table, std::string_view name) -> std::optional<ActionType> {
    for (auto const& [key, type] : table)
        if (key == name)
            return type;
    return std::nullopt;
}

// Context sections may use names from any section; navigation wins on
// duplicates such as "up".
auto lookupAnyName(std::string_view name) -> std::optional<ActionType> {
    for (auto const* table : {&kNavigationNames, &kEditingNames, &kFormNames, &kSystemNames, &kScrollNames})
        if (auto type = lookupName(*table, name))
            return type;
    return std::nullopt;
}

auto keyList(nlohmann::json const& value, std::string const& where) -> Expected<std::vector<std::string>> {
    std::vector<std::string> keys;
    if (value.is_string()) {
        keys.push_back(value.get<std::string>());
        return keys;
    }
    if (!value.is_array())
        return std::unexpected(Error{Error::Code::MalformedInput, where + " must be a key or list of keys"});
    for (auto const& entry : value) {
        if (!entry.is_string())
            return std::unexpected(Error{Error::Code::MalformedInput, where + " contains a non-string key"});
        keys.push_back(entry.get<std::string>());
    }
    return keys;
}

auto applySection(KeyMap& keyMap, nlohmann::json const& doc, char const* section, NameTable const& names) -> std::optional<Error> {
    if (!doc.contains(section))
        return std::nullopt;
    auto const& body = doc.at(section);
    if (!body.is_object())
        return Error{Error::Code::MalformedInput, std::string("section '") + section + "' must be an object"};
    for (auto const& [name, value] : body.items()) {
        auto type = lookupName(names, name);
        if (!type) {
            ts_log("KeyMap ignoring unknown action name " + name, "Input");
            continue;
        }
        auto keys = keyList(value, std::string(section) + "." + name);
        if (!keys)
            return keys.error();
        for (auto& key : *keys)
            keyMap.bind(std::move(key), *type);
    }
    return std::nullopt;
}

auto applyContexts(KeyMap& keyMap, nlohmann::json const& doc) -> std::optional<Error> {
    if (!doc.contains("contexts"))
        return std::nullopt;
    auto const& body = doc.at("contexts");
    if (!body.is_object())
        return Error{Error::Code::MalformedInput, "section 'contexts' must be an object"};
    for (auto const& [context, mappings] : body.items()) {
        if (!mappings.is_object())
            return Error{Error::Code::MalformedInput, "context '" + context + "' must be an object"};
        KeyMap::Table table;
        for (auto const& [name, value] : mappings.items()) {
            auto type = lookupAnyName(name);
            if (!type)
                continue;
            auto keys = keyList(value, "contexts." + context + "." + name);
            if (!keys)
                return keys.error();
            for (auto& key : *keys) {
                // Accept the long spellings ("Escape", "PgDn") and store canonical names.
                if (auto special = specialKeyFromString(key); special != SpecialKey::None)
                    key = std::string(toString(special));
                table[key] = *type;
            }
        }
        if (!table.empty())
            keyMap.bindContext(context, std::move(table));
    }
    return std::nullopt;
}

} // namespace

auto loadKeyMapFromString(std::string_view json) -> Expected<KeyMap> {
    auto doc = nlohmann::json::parse(json, nullptr, false);
    if (doc.is_discarded())
        return std::unexpected(Error{Error::Code::MalformedInput, "failed to parse keymap config"});
    KeyMap keyMap;
    if (doc.is_null())
        return keyMap;
    if (!doc.is_object())
        return std::unexpected(Error{Error::Code::MalformedInput, "keymap config must be an object"});

    if (auto error = applySection(keyMap, doc, "navigation", kNavigationNames))
        return std::unexpected(*error);
    if (auto error = applySection(keyMap, doc, "editing", kEditingNames))
        return std::unexpected(*error);
    if (auto error = applySection(keyMap, doc, "form", kFormNames))
        return std::unexpected(*error);
    if (auto error = applySection(keyMap, doc, "system", kSystemNames))
        return std::unexpected(*error);
    if (auto error = applySection(keyMap, doc, "scroll", kScrollNames))
        return std::unexpected(*error);
    if (auto error = applyContexts(keyMap, doc))
        return std::unexpected(*error);
    return keyMap;
}

auto loadKeyMap(std::filesystem::path const& path) -> Expected<KeyMap> {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        ts_log("KeyMap config " + path.string() + " not found, using defaults", "Input");
        return KeyMap{};
    }
    std::ifstream in(path);
    if (!in)
        return std::unexpected(Error{Error::Code::IOError, "failed to read keymap file: " + path.string()});
    std::ostringstream contents;
    contents << in.rdbuf();
    return loadKeyMapFromString(contents.str());
}

} // namespace TS
