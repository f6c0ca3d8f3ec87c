#include <termspace/automation/Controller.hpp>
#include <termspace/automation/Operation.hpp>

#include <termspace/runtime/Inspectable.hpp>
#include <termspace/runtime/Runtime.hpp>

#include "log/TaggedLogger.hpp"

#include <algorithm>

namespace TS {

namespace {

auto notFound(std::string const& id) -> Error {
    return Error{Error::Code::NotFound, "component not found: " + id};
}

auto invalidSelector(std::string_view selector) -> Error {
    return Error{Error::Code::MalformedInput, "invalid selector: " + std::string(selector)};
}

auto toInfo(ComponentState const& component) -> ComponentInfo {
    return ComponentInfo{component.id, component.type, component.props, component.state, component.rect, component.visible, component.disabled};
}

auto trim(std::string_view text) -> std::string_view {
    auto const first = text.find_first_not_of(" \t");
    if (first == std::string_view::npos)
        return {};
    auto const last = text.find_last_not_of(" \t");
    return text.substr(first, last - first + 1);
}

// Strings compare by content, everything else by its JSON text.
auto matchesText(Json const& value, std::string_view text) -> bool {
    if (value.is_string())
        return value.get_ref<std::string const&>() == text;
    return value.dump() == text;
}

auto holds(Json const& object, std::string const& key, std::string_view text) -> bool {
    if (!object.is_object())
        return false;
    auto it = object.find(key);
    return it != object.end() && matchesText(*it, text);
}

auto navigationAction(NavigateTo direction) -> ActionType {
    switch (direction) {
    case NavigateTo::Up:
        return ActionType::NavigateUp;
    case NavigateTo::Down:
        return ActionType::NavigateDown;
    case NavigateTo::Left:
        return ActionType::NavigateLeft;
    case NavigateTo::Right:
        return ActionType::NavigateRight;
    case NavigateTo::Next:
        return ActionType::NavigateNext;
    case NavigateTo::Prev:
        return ActionType::NavigatePrev;
    case NavigateTo::First:
        return ActionType::NavigateFirst;
    case NavigateTo::Last:
        return ActionType::NavigateLast;
    }
    return ActionType::NavigateNext;
}

} // namespace

auto toString(NavigateTo direction) -> std::string_view {
    switch (direction) {
    case NavigateTo::Up:
        return "up";
    case NavigateTo::Down:
        return "down";
    case NavigateTo::Left:
        return "left";
    case NavigateTo::Right:
        return "right";
    case NavigateTo::Next:
        return "next";
    case NavigateTo::Prev:
        return "prev";
    case NavigateTo::First:
        return "first";
    case NavigateTo::Last:
        return "last";
    }
    return "unknown";
}

Controller::Controller(Runtime& runtime)
    : target(&runtime) {}

auto Controller::inspect() const -> Snapshot {
    return this->target->stateTracker().current();
}

auto Controller::find(std::string_view selector) const -> Expected<std::vector<ComponentInfo>> {
    auto const                 snapshot = this->inspect();
    std::vector<ComponentInfo> results;

    if (selector == "*") {
        for (auto const& [id, component] : snapshot.components)
            results.push_back(toInfo(component));
        return results;
    }
    if (selector.size() > 1 && selector.front() == '#') {
        auto const id = std::string(selector.substr(1));
        if (auto const* component = snapshot.component(id)) {
            results.push_back(toInfo(*component));
            return results;
        }
        return std::unexpected(notFound(id));
    }
    if (selector.size() > 1 && selector.front() == '.') {
        auto const type = selector.substr(1);
        for (auto const& [id, component] : snapshot.components) {
            if (component.type == type)
                results.push_back(toInfo(component));
        }
        return results;
    }
    if (selector.size() > 2 && selector.front() == '[' && selector.back() == ']') {
        auto const body = selector.substr(1, selector.size() - 2);
        auto const eq   = body.find('=');
        if (eq == std::string_view::npos)
            return std::unexpected(invalidSelector(selector));
        auto const key = std::string(trim(body.substr(0, eq)));
        auto       value = trim(body.substr(eq + 1));
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"')
            value = value.substr(1, value.size() - 2);
        if (key.empty())
            return std::unexpected(invalidSelector(selector));

        for (auto const& [id, component] : snapshot.components) {
            if (holds(component.props, key, value) || holds(component.state, key, value))
                results.push_back(toInfo(component));
        }
        return results;
    }
    return std::unexpected(invalidSelector(selector));
}

auto Controller::query(StateQuery const& query) const -> Expected<Json> {
    auto const snapshot = this->inspect();

    if (!query.componentId.empty()) {
        auto const* component = snapshot.component(query.componentId);
        if (component == nullptr)
            return std::unexpected(notFound(query.componentId));
        if (query.stateKey.empty())
            return component->state;
        Json result = Json::object();
        auto it     = component->state.find(query.stateKey);
        result[query.stateKey] = it == component->state.end() ? Json(nullptr) : *it;
        return result;
    }

    Json result = Json::object();
    for (auto const& [id, component] : snapshot.components) {
        if (!query.componentType.empty() && component.type != query.componentType)
            continue;
        result[id] = component.state;
    }
    return result;
}

auto Controller::dispatch(Action const& action) -> Expected<void> {
    ts_log("Controller dispatch " + action.toString(), "Automation");
    return this->target->tryDispatch(action);
}

auto Controller::click(std::string const& id) -> Expected<void> {
    auto component = this->componentState(id);
    if (!component)
        return std::unexpected(component.error());
    if (component->disabled)
        return std::unexpected(Error{Error::Code::NotAllowed, "component is disabled: " + id});
    return this->dispatch(Action{ActionType::Submit}.withTarget(id));
}

auto Controller::input(std::string const& id, std::string text) -> Expected<void> {
    if (auto component = this->componentState(id); !component)
        return std::unexpected(component.error());
    return this->dispatch(Action{ActionType::InputText}.withTarget(id).withPayload(std::move(text)));
}

auto Controller::navigate(NavigateTo direction) -> Expected<void> {
    if (this->target->tryDispatch(Action{navigationAction(direction)}))
        return {};
    return std::unexpected(Error{Error::Code::NotFound, "navigation failed: no component in direction " + std::string(toString(direction))});
}

auto Controller::waitUntil(Condition const& condition, std::chrono::milliseconds timeout) const -> Expected<void> {
    auto const deadline = std::chrono::steady_clock::now() + timeout;
    auto const ctx      = this->target->context();
    while (true) {
        if (condition(this->inspect()))
            return {};
        auto const now = std::chrono::steady_clock::now();
        if (now >= deadline)
            return std::unexpected(Error{Error::Code::Timeout, "timeout waiting for condition"});
        auto const slice = std::min<std::chrono::steady_clock::duration>(kPollInterval, deadline - now);
        if (!ctx.waitFor(slice))
            return std::unexpected(Error{Error::Code::Canceled, "runtime canceled while waiting"});
    }
}

auto Controller::waitForVisible(std::string const& id, std::chrono::milliseconds timeout) const -> Expected<void> {
    return this->waitUntil(
            [&id](Snapshot const& snapshot) {
                auto const* component = snapshot.component(id);
                return component != nullptr && component->visible;
            },
            timeout);
}

auto Controller::waitForValue(std::string const& id, std::string const& key, Json const& expected, std::chrono::milliseconds timeout) const
        -> Expected<void> {
    return this->waitUntil(
            [&](Snapshot const& snapshot) {
                auto const* component = snapshot.component(id);
                if (component == nullptr || !component->state.is_object())
                    return false;
                auto it = component->state.find(key);
                return it != component->state.end() && *it == expected;
            },
            timeout);
}

auto Controller::watch(Watcher callback) -> std::function<void()> {
    auto& tracker = this->target->stateTracker();
    auto  id      = tracker.subscribe([callback = std::move(callback)](std::optional<Snapshot> const&, Snapshot const& current) {
        callback(current);
    });
    return [&tracker, id] { tracker.unsubscribe(id); };
}

auto Controller::state(std::string const& id, std::string const& key) const -> Expected<Json> {
    auto result = this->query(StateQuery{.componentId = id, .stateKey = key});
    if (!result)
        return std::unexpected(result.error());
    return (*result)[key];
}

auto Controller::setValue(std::string const& id, std::string const& key, Json value) -> Expected<void> {
    auto component = this->target->component(id);
    if (!component)
        return std::unexpected(notFound(id));
    auto* inspectable = capability<Inspectable>(component.get());
    if (inspectable == nullptr)
        return std::unexpected(Error{Error::Code::NotSupported, "component is not inspectable: " + id});

    bool accepted = false;
    this->target->transact([&] { accepted = inspectable->setStateValue(key, value); });
    if (!accepted)
        return std::unexpected(Error{Error::Code::NotAllowed, "state key not writable: " + id + "." + key});
    return {};
}

auto Controller::isVisible(std::string const& id) const -> Expected<bool> {
    auto component = this->componentState(id);
    if (!component)
        return std::unexpected(component.error());
    return component->visible;
}

auto Controller::isDisabled(std::string const& id) const -> Expected<bool> {
    auto component = this->componentState(id);
    if (!component)
        return std::unexpected(component.error());
    return component->disabled;
}

auto Controller::focused() const -> Expected<std::string> {
    if (auto id = this->target->focused())
        return *id;
    return std::unexpected(Error{Error::Code::NotFound, "no focused component"});
}

auto Controller::execute(std::vector<std::shared_ptr<Operation>> const& ops) -> Expected<void> {
    for (auto const& op : ops) {
        if (!op)
            continue;
        if (auto done = op->execute(*this); !done)
            return done;
    }
    return {};
}

auto Controller::componentState(std::string const& id) const -> Expected<ComponentState> {
    auto const snapshot = this->inspect();
    if (auto const* component = snapshot.component(id))
        return *component;
    return std::unexpected(notFound(id));
}

} // namespace TS
