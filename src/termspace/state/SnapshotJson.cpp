#include <termspace/state/SnapshotJson.hpp>

#include "log/TaggedLogger.hpp"
#include "state/FileUtils.hpp"

#include <cstdint>

namespace TS::SnapshotJson {

namespace {

auto malformed(std::string message) -> Error {
    return Error{Error::Code::MalformedInput, std::move(message)};
}

[[nodiscard]] auto rectToJson(Rect const& rect) -> Json {
    return Json{{"x", rect.x}, {"y", rect.y}, {"width", rect.width}, {"height", rect.height}};
}

[[nodiscard]] auto rectFromJson(Json const& json) -> Expected<Rect> {
    if (!json.is_object())
        return std::unexpected(malformed("rect must be an object"));
    Rect rect;
    rect.x      = json.value("x", 0);
    rect.y      = json.value("y", 0);
    rect.width  = json.value("width", 0);
    rect.height = json.value("height", 0);
    return rect;
}

[[nodiscard]] auto componentToJson(ComponentState const& component) -> Json {
    return Json{
            {"id", component.id},
            {"type", component.type},
            {"props", component.props},
            {"state", component.state},
            {"rect", rectToJson(component.rect)},
            {"visible", component.visible},
            {"disabled", component.disabled},
    };
}

[[nodiscard]] auto componentFromJson(std::string const& id, Json const& json) -> Expected<ComponentState> {
    if (!json.is_object())
        return std::unexpected(malformed("component '" + id + "' must be an object"));
    ComponentState component;
    component.id       = json.value("id", id);
    component.type     = json.value("type", std::string{});
    component.props    = json.value("props", Json::object());
    component.state    = json.value("state", Json::object());
    component.visible  = json.value("visible", true);
    component.disabled = json.value("disabled", false);
    if (auto it = json.find("rect"); it != json.end()) {
        auto rect = rectFromJson(*it);
        if (!rect)
            return std::unexpected(rect.error());
        component.rect = *rect;
    }
    return component;
}

[[nodiscard]] auto modalToJson(ModalState const& modal) -> Json {
    return Json{
            {"id", modal.id},
            {"type", std::string(toString(modal.type))},
            {"focus", modal.focus},
            {"open", modal.open},
            {"closable", modal.closable},
    };
}

[[nodiscard]] auto modalFromJson(Json const& json) -> Expected<ModalState> {
    if (!json.is_object())
        return std::unexpected(malformed("modal must be an object"));
    ModalState modal;
    modal.id       = json.value("id", std::string{});
    modal.focus    = json.value("focus", std::string{});
    modal.open     = json.value("open", false);
    modal.closable = json.value("closable", true);
    if (auto it = json.find("type"); it != json.end()) {
        if (it->is_string()) {
            auto type = modalTypeFromString(it->get<std::string>());
            if (!type)
                return std::unexpected(malformed("unknown modal type: " + it->get<std::string>()));
            modal.type = *type;
        } else if (it->is_number_integer()) {
            auto value = it->get<int>();
            if (value < 0 || value > static_cast<int>(ModalType::Menu))
                return std::unexpected(malformed("modal type out of range"));
            modal.type = static_cast<ModalType>(value);
        } else {
            return std::unexpected(malformed("modal type must be a string"));
        }
    }
    return modal;
}

[[nodiscard]] auto dirtyToJson(DirtyRegions const& dirty) -> Json {
    Json cells = Json::array();
    for (auto const& cell : dirty.cells)
        cells.push_back(Json{{"x", cell.x}, {"y", cell.y}});
    Json rects = Json::array();
    for (auto const& rect : dirty.rects)
        rects.push_back(rectToJson(rect));
    return Json{{"cells", std::move(cells)}, {"rects", std::move(rects)}};
}

[[nodiscard]] auto dirtyFromJson(Json const& json) -> Expected<DirtyRegions> {
    if (!json.is_object())
        return std::unexpected(malformed("dirty must be an object"));
    DirtyRegions dirty;
    if (auto it = json.find("cells"); it != json.end() && it->is_array()) {
        for (auto const& cell : *it)
            dirty.cells.push_back(CellRef{cell.value("x", 0), cell.value("y", 0)});
    }
    if (auto it = json.find("rects"); it != json.end() && it->is_array()) {
        for (auto const& entry : *it) {
            auto rect = rectFromJson(entry);
            if (!rect)
                return std::unexpected(rect.error());
            dirty.rects.push_back(*rect);
        }
    }
    return dirty;
}

[[nodiscard]] auto toMillis(Snapshot::Clock::time_point tp) -> std::int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

[[nodiscard]] auto fromMillis(std::int64_t ms) -> Snapshot::Clock::time_point {
    return Snapshot::Clock::time_point{std::chrono::duration_cast<Snapshot::Clock::duration>(std::chrono::milliseconds{ms})};
}

// Dots and backslashes inside a segment are escaped with a backslash.
[[nodiscard]] auto joinFocusPath(FocusPath const& path) -> std::string {
    std::string out;
    bool        first = true;
    for (auto const& segment : path.segments()) {
        if (!first)
            out.push_back('.');
        first = false;
        for (char c : segment) {
            if (c == '.' || c == '\\')
                out.push_back('\\');
            out.push_back(c);
        }
    }
    return out;
}

[[nodiscard]] auto splitFocusPath(std::string_view joined) -> FocusPath {
    std::vector<std::string> segments;
    std::string              current;
    for (std::size_t i = 0; i < joined.size(); ++i) {
        char const c = joined[i];
        if (c == '\\' && i + 1 < joined.size()) {
            current.push_back(joined[++i]);
        } else if (c == '.') {
            if (!current.empty())
                segments.push_back(std::move(current));
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty())
        segments.push_back(std::move(current));
    return FocusPath(std::move(segments));
}

// Shared by both forms once the focus path has been decoded.
[[nodiscard]] auto readFields(Json const& json, Snapshot& snapshot) -> std::optional<Error> {
    if (auto it = json.find("timestamp"); it != json.end()) {
        if (!it->is_number_integer())
            return malformed("timestamp must be an integer");
        snapshot.timestamp = fromMillis(it->get<std::int64_t>());
    }
    if (auto it = json.find("components"); it != json.end()) {
        if (!it->is_object())
            return malformed("components must be an object");
        for (auto const& [id, value] : it->items()) {
            auto component = componentFromJson(id, value);
            if (!component)
                return component.error();
            snapshot.components.emplace(id, std::move(*component));
        }
    }
    if (auto it = json.find("modals"); it != json.end()) {
        if (!it->is_array())
            return malformed("modals must be an array");
        for (auto const& entry : *it) {
            auto modal = modalFromJson(entry);
            if (!modal)
                return modal.error();
            snapshot.modals.push_back(std::move(*modal));
        }
    }
    if (auto it = json.find("dirty"); it != json.end()) {
        auto dirty = dirtyFromJson(*it);
        if (!dirty)
            return dirty.error();
        snapshot.dirty = std::move(*dirty);
    }
    if (auto it = json.find("metadata"); it != json.end())
        snapshot.metadata = *it;
    return std::nullopt;
}

// Json::value() throws type_error when a present field has the wrong type.
[[nodiscard]] auto readBody(Json const& json, Snapshot& snapshot) -> std::optional<Error> {
    try {
        return readFields(json, snapshot);
    } catch (Json::exception const& e) {
        return malformed(std::string("snapshot field has the wrong type: ") + e.what());
    }
}

} // namespace

auto toJson(Snapshot const& snapshot) -> Json {
    Json components = Json::object();
    for (auto const& [id, component] : snapshot.components)
        components[id] = componentToJson(component);
    Json modals = Json::array();
    for (auto const& modal : snapshot.modals)
        modals.push_back(modalToJson(modal));

    return Json{
            {"timestamp", toMillis(snapshot.timestamp)},
            {"focusPath", snapshot.focusPath.segments()},
            {"components", std::move(components)},
            {"modals", std::move(modals)},
            {"dirty", dirtyToJson(snapshot.dirty)},
            {"metadata", snapshot.metadata},
    };
}

auto fromJson(Json const& json) -> Expected<Snapshot> {
    if (!json.is_object())
        return std::unexpected(malformed("snapshot must be an object"));
    Snapshot snapshot;
    if (auto it = json.find("focusPath"); it != json.end()) {
        if (!it->is_array())
            return std::unexpected(malformed("focusPath must be an array"));
        std::vector<std::string> segments;
        for (auto const& segment : *it) {
            if (!segment.is_string())
                return std::unexpected(malformed("focusPath entries must be strings"));
            segments.push_back(segment.get<std::string>());
        }
        snapshot.focusPath = FocusPath(std::move(segments));
    }
    if (auto error = readBody(json, snapshot))
        return std::unexpected(*error);
    return snapshot;
}

auto serialize(Snapshot const& snapshot, int indent) -> std::string {
    return toJson(snapshot).dump(indent);
}

auto deserialize(std::string_view text) -> Expected<Snapshot> {
    auto json = Json::parse(text, nullptr, false);
    if (json.is_discarded())
        return std::unexpected(malformed("snapshot is not valid JSON"));
    return fromJson(json);
}

auto saveToFile(Snapshot const& snapshot, std::filesystem::path const& path) -> Expected<void> {
    return FileUtils::writeTextFile(path, serialize(snapshot));
}

auto saveToFileAtomic(Snapshot const& snapshot, std::filesystem::path const& path) -> Expected<void> {
    auto result = FileUtils::writeTextFileAtomic(path, serialize(snapshot), true);
    if (!result)
        ts_log("SnapshotJson atomic save failed: " + describeError(result.error()), "State");
    return result;
}

auto loadFromFile(std::filesystem::path const& path) -> Expected<Snapshot> {
    auto text = FileUtils::readTextFile(path);
    if (!text)
        return std::unexpected(text.error());
    return deserialize(*text);
}

auto exportToMap(Snapshot const& snapshot) -> Json {
    Json result = Json::object();
    result["timestamp"] = toMillis(snapshot.timestamp);
    result["focusPath"] = joinFocusPath(snapshot.focusPath);

    Json components = Json::object();
    for (auto const& [id, component] : snapshot.components) {
        auto entry = componentToJson(component);
        entry.erase("id");
        components[id] = std::move(entry);
    }
    result["components"] = std::move(components);

    Json modals = Json::array();
    for (auto const& modal : snapshot.modals)
        modals.push_back(modalToJson(modal));
    result["modals"] = std::move(modals);

    if (!snapshot.dirty.empty()) {
        Json dirty = Json::object();
        auto full  = dirtyToJson(snapshot.dirty);
        if (!snapshot.dirty.cells.empty())
            dirty["cells"] = full["cells"];
        if (!snapshot.dirty.rects.empty())
            dirty["rects"] = full["rects"];
        result["dirty"] = std::move(dirty);
    }
    if (snapshot.metadata.is_object() && !snapshot.metadata.empty())
        result["metadata"] = snapshot.metadata;
    return result;
}

auto importFromMap(Json const& map) -> Expected<Snapshot> {
    if (!map.is_object())
        return std::unexpected(malformed("snapshot map must be an object"));
    Snapshot snapshot;
    if (auto it = map.find("focusPath"); it != map.end()) {
        if (!it->is_string())
            return std::unexpected(malformed("focusPath must be a string"));
        snapshot.focusPath = splitFocusPath(it->get<std::string>());
    }
    if (auto error = readBody(map, snapshot))
        return std::unexpected(*error);
    return snapshot;
}

} // namespace TS::SnapshotJson
