#include <termspace/action/ActionError.hpp>

namespace TS {

auto toString(ActionError::Kind kind) -> std::string_view {
    switch (kind) {
    case ActionError::Kind::TargetNotFound:
        return "target_not_found";
    case ActionError::Kind::TargetDisabled:
        return "target_disabled";
    case ActionError::Kind::TargetNotInteractable:
        return "target_not_interactable";
    case ActionError::Kind::InvalidPayload:
        return "invalid_payload";
    case ActionError::Kind::MissingPayload:
        return "missing_payload";
    case ActionError::Kind::PayloadTypeMismatch:
        return "payload_type_mismatch";
    case ActionError::Kind::ActionNotSupported:
        return "action_not_supported";
    case ActionError::Kind::ActionNotAllowed:
        return "action_not_allowed";
    case ActionError::Kind::ActionFailed:
        return "action_failed";
    case ActionError::Kind::DispatchFailed:
        return "dispatch_failed";
    case ActionError::Kind::Timeout:
        return "timeout";
    }
    return "action_failed";
}

auto ActionError::withComponentType(std::string type) -> ActionError& {
    this->componentType = std::move(type);
    return *this;
}

auto ActionError::withDetail(std::string const& key, Json value) -> ActionError& {
    this->details[key] = std::move(value);
    return *this;
}

auto ActionError::toString() const -> std::string {
    std::string out = "[";
    out.append(TS::toString(this->kind));
    out.append("] ");
    out.append(this->message);
    if (!this->action.empty() || !this->target.empty()) {
        out.append(" (");
        if (!this->action.empty()) {
            out.append("action: ");
            out.append(this->action);
        }
        if (!this->target.empty()) {
            if (!this->action.empty())
                out.append(", ");
            out.append("target: ");
            out.append(this->target);
        }
        out.push_back(')');
    }
    return out;
}

auto ActionError::toError() const -> Error {
    auto code = Error::Code::ActionFailed;
    switch (this->kind) {
    case Kind::TargetNotFound:
        code = Error::Code::NotFound;
        break;
    case Kind::TargetDisabled:
    case Kind::TargetNotInteractable:
    case Kind::ActionNotAllowed:
        code = Error::Code::NotAllowed;
        break;
    case Kind::InvalidPayload:
    case Kind::MissingPayload:
    case Kind::PayloadTypeMismatch:
        code = Error::Code::InvalidPayload;
        break;
    case Kind::ActionNotSupported:
        code = Error::Code::NotSupported;
        break;
    case Kind::Timeout:
        code = Error::Code::Timeout;
        break;
    case Kind::ActionFailed:
    case Kind::DispatchFailed:
        code = Error::Code::ActionFailed;
        break;
    }
    return Error{code, this->toString()};
}

auto ActionError::targetNotFound(std::string_view targetId, Action const& action) -> ActionError {
    ActionError error;
    error.kind    = Kind::TargetNotFound;
    error.message = "target component not found: " + std::string(targetId);
    error.action  = std::string(TS::toString(action.type));
    error.target  = std::string(targetId);
    return error;
}

auto ActionError::targetDisabled(std::string_view targetId, Action const& action) -> ActionError {
    ActionError error;
    error.kind    = Kind::TargetDisabled;
    error.message = "target component is disabled: " + std::string(targetId);
    error.action  = std::string(TS::toString(action.type));
    error.target  = std::string(targetId);
    return error;
}

auto ActionError::invalidPayload(Action const& action, std::string_view expected, std::string_view actual) -> ActionError {
    ActionError error;
    error.kind    = Kind::InvalidPayload;
    error.message = "invalid payload for action " + std::string(TS::toString(action.type));
    error.action  = std::string(TS::toString(action.type));
    error.target  = action.target;
    error.details["expected_type"] = std::string(expected);
    error.details["actual_type"]   = std::string(actual);
    return error;
}

auto ActionError::actionNotSupported(Action const& action, std::string_view componentType) -> ActionError {
    ActionError error;
    error.kind          = Kind::ActionNotSupported;
    error.message       = "action not supported by component type " + std::string(componentType);
    error.action        = std::string(TS::toString(action.type));
    error.target        = action.target;
    error.componentType = std::string(componentType);
    return error;
}

auto ActionError::actionNotAllowed(Action const& action, std::string_view reason) -> ActionError {
    ActionError error;
    error.kind    = Kind::ActionNotAllowed;
    error.message = "action not allowed: " + std::string(reason);
    error.action  = std::string(TS::toString(action.type));
    error.target  = action.target;
    return error;
}

auto requirePayload(Action const& action) -> std::optional<ActionError> {
    if (action.payload.has_value())
        return std::nullopt;
    ActionError error;
    error.kind    = ActionError::Kind::MissingPayload;
    error.message = "action requires a payload";
    error.action  = std::string(TS::toString(action.type));
    error.target  = action.target;
    return error;
}

} // namespace TS
