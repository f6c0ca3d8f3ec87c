#include <termspace/action/Action.hpp>

namespace TS {

auto toString(MouseButton button) -> std::string_view {
    switch (button) {
    case MouseButton::None:
        return "none";
    case MouseButton::Left:
        return "left";
    case MouseButton::Middle:
        return "middle";
    case MouseButton::Right:
        return "right";
    }
    return "none";
}

Action::Action() : timestamp(Clock::now()) {}

Action::Action(ActionType type) : type(type), timestamp(Clock::now()) {}

auto Action::withPayload(std::any value) -> Action& {
    this->payload = std::move(value);
    return *this;
}

auto Action::withSource(std::string id) -> Action& {
    this->source = std::move(id);
    return *this;
}

auto Action::withTarget(std::string id) -> Action& {
    this->target = std::move(id);
    return *this;
}

auto Action::toString() const -> std::string {
    std::string out{TS::toString(this->type)};
    if (!this->target.empty()) {
        out.push_back('{');
        out.append(this->target);
        out.push_back('}');
    }
    return out;
}

} // namespace TS
