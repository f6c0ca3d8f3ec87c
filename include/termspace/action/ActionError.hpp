#pragma once
#include <termspace/action/Action.hpp>
#include <termspace/core/Error.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace TS {

using Json = nlohmann::json;

// Richer failure record for action handling. Converts to the plain Error
// taxonomy with toError() when it crosses into Expected-returning APIs.
struct ActionError {
    enum class Kind {
        TargetNotFound,
        TargetDisabled,
        TargetNotInteractable,
        InvalidPayload,
        MissingPayload,
        PayloadTypeMismatch,
        ActionNotSupported,
        ActionNotAllowed,
        ActionFailed,
        DispatchFailed,
        Timeout
    };

    Kind        kind = Kind::ActionFailed;
    std::string message;
    std::string action;
    std::string target;
    std::string componentType;
    Json        details = Json::object();

    auto withComponentType(std::string type) -> ActionError&;
    auto withDetail(std::string const& key, Json value) -> ActionError&;

    // "[kind] message (action: X, target: T)"
    [[nodiscard]] auto toString() const -> std::string;
    [[nodiscard]] auto toError() const -> Error;

    [[nodiscard]] static auto targetNotFound(std::string_view targetId, Action const& action) -> ActionError;
    [[nodiscard]] static auto targetDisabled(std::string_view targetId, Action const& action) -> ActionError;
    [[nodiscard]] static auto invalidPayload(Action const& action, std::string_view expected, std::string_view actual) -> ActionError;
    [[nodiscard]] static auto actionNotSupported(Action const& action, std::string_view componentType) -> ActionError;
    [[nodiscard]] static auto actionNotAllowed(Action const& action, std::string_view reason) -> ActionError;
};

[[nodiscard]] auto toString(ActionError::Kind kind) -> std::string_view;

// Payload checks used by targets before touching Action::payload.
[[nodiscard]] auto requirePayload(Action const& action) -> std::optional<ActionError>;

template <typename T>
[[nodiscard]] auto validatePayloadType(Action const& action, std::string_view expectedName) -> std::optional<ActionError> {
    if (auto missing = requirePayload(action))
        return missing;
    if (std::any_cast<T>(&action.payload) == nullptr)
        return ActionError::invalidPayload(action, expectedName, action.payload.type().name());
    return std::nullopt;
}

} // namespace TS
