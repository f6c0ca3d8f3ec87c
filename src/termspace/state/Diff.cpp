#include <termspace/state/Diff.hpp>

#include <algorithm>

namespace TS {

namespace {

auto contains(std::vector<std::string> const& ids, std::string const& id) -> bool {
    return std::find(ids.begin(), ids.end(), id) != ids.end();
}

auto quoteList(std::vector<std::string> const& ids) -> std::string {
    std::string out = "[";
    for (std::size_t i = 0; i < ids.size(); ++i) {
        if (i > 0)
            out += ",";
        out += "\"" + ids[i] + "\"";
    }
    return out + "]";
}

auto compareFields(ComponentState const& before, ComponentState const& after) -> std::vector<std::string> {
    std::vector<std::string> fields;
    auto const empty = Json::object();
    auto const& lhs  = before.state.is_object() ? before.state : empty;
    auto const& rhs  = after.state.is_object() ? after.state : empty;

    for (auto const& [key, value] : rhs.items()) {
        auto it = lhs.find(key);
        if (it == lhs.end() || *it != value)
            fields.push_back(key);
    }
    for (auto const& [key, value] : lhs.items()) {
        if (!rhs.contains(key))
            fields.push_back(key);
    }
    if (!before.state.is_object() || !after.state.is_object()) {
        if (before.state != after.state && fields.empty())
            fields.push_back("state");
    }

    if (before.type != after.type)
        fields.push_back("type");
    if (before.props != after.props)
        fields.push_back("props");
    if (!(before.rect == after.rect))
        fields.push_back("rect");
    if (before.visible != after.visible)
        fields.push_back("visible");
    if (before.disabled != after.disabled)
        fields.push_back("disabled");
    return fields;
}

} // namespace

auto Diff::hasChanges() const -> bool {
    return this->focusChanged || !this->changed.empty() || !this->added.empty() || !this->removed.empty();
}

auto Diff::isChanged(std::string const& id) const -> bool {
    return contains(this->changed, id);
}

auto Diff::isAdded(std::string const& id) const -> bool {
    return contains(this->added, id);
}

auto Diff::isRemoved(std::string const& id) const -> bool {
    return contains(this->removed, id);
}

auto Diff::changesFor(std::string const& id) const -> std::vector<std::string> {
    if (auto it = this->changedFields.find(id); it != this->changedFields.end())
        return it->second;
    return {};
}

auto Diff::toString() const -> std::string {
    std::string out = "StateDiff{";
    if (this->focusChanged)
        out += " FocusChanged";
    if (!this->changed.empty())
        out += " Changed:" + quoteList(this->changed);
    if (!this->added.empty())
        out += " Added:" + quoteList(this->added);
    if (!this->removed.empty())
        out += " Removed:" + quoteList(this->removed);
    return out + " }";
}

auto computeDiff(Snapshot const& before, Snapshot const& after) -> Diff {
    Diff diff;
    diff.focusChanged = !(before.focusPath == after.focusPath);

    for (auto const& [id, component] : after.components) {
        auto it = before.components.find(id);
        if (it == before.components.end()) {
            diff.added.push_back(id);
            continue;
        }
        auto fields = compareFields(it->second, component);
        if (!fields.empty()) {
            diff.changed.push_back(id);
            diff.changedFields.emplace(id, std::move(fields));
        }
    }
    for (auto const& [id, component] : before.components) {
        if (!after.components.contains(id))
            diff.removed.push_back(id);
    }
    return diff;
}

} // namespace TS
