#pragma once
#include <termspace/action/Action.hpp>
#include <termspace/core/Error.hpp>
#include <termspace/core/Geometry.hpp>
#include <termspace/state/Snapshot.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace TS {

class Runtime;
class Operation;

enum class NavigateTo : std::uint8_t {
    Up = 0,
    Down,
    Left,
    Right,
    Next,
    Prev,
    First,
    Last
};

[[nodiscard]] auto toString(NavigateTo direction) -> std::string_view;

struct ComponentInfo {
    std::string id;
    std::string type;
    Json        props = Json::object();
    Json        state = Json::object();
    Rect        rect;
    bool        visible  = true;
    bool        disabled = false;
};

// Empty fields do not filter.
struct StateQuery {
    std::string componentId;
    std::string componentType;
    std::string stateKey;
};

/**
 * Programmatic driver of a Runtime, the automation counterpart of a user at
 * the keyboard. Reads go through the state tracker's current snapshot, so
 * they observe the UI as of the last completed action. Writes dispatch real
 * Actions and are recorded in history like user input.
 *
 * Selectors accepted by find():
 *   #id            the component with that id (NotFound when absent)
 *   .Type          every component of that type
 *   [key=value]    components whose props or state hold key with value;
 *                  value may be double-quoted, non-string values compare
 *                  by their JSON text
 *   *              every component
 */
class Controller {
public:
    using Condition = std::function<bool(Snapshot const&)>;
    using Watcher   = std::function<void(Snapshot const&)>;

    static constexpr std::chrono::milliseconds kPollInterval{50};

    explicit Controller(Runtime& runtime);

    [[nodiscard]] auto inspect() const -> Snapshot;
    [[nodiscard]] auto find(std::string_view selector) const -> Expected<std::vector<ComponentInfo>>;
    [[nodiscard]] auto query(StateQuery const& query) const -> Expected<Json>;

    auto dispatch(Action const& action) -> Expected<void>;
    auto click(std::string const& id) -> Expected<void>;
    auto input(std::string const& id, std::string text) -> Expected<void>;
    auto navigate(NavigateTo direction) -> Expected<void>;

    auto waitUntil(Condition const& condition, std::chrono::milliseconds timeout) const -> Expected<void>;
    auto waitForVisible(std::string const& id, std::chrono::milliseconds timeout) const -> Expected<void>;
    auto waitForValue(std::string const& id, std::string const& key, Json const& expected, std::chrono::milliseconds timeout) const
            -> Expected<void>;

    // Returns a function that cancels the watch.
    auto watch(Watcher callback) -> std::function<void()>;

    [[nodiscard]] auto state(std::string const& id, std::string const& key) const -> Expected<Json>;
    auto setValue(std::string const& id, std::string const& key, Json value) -> Expected<void>;
    [[nodiscard]] auto isVisible(std::string const& id) const -> Expected<bool>;
    [[nodiscard]] auto isDisabled(std::string const& id) const -> Expected<bool>;
    [[nodiscard]] auto focused() const -> Expected<std::string>;

    // Runs the operations in order, stopping at the first failure.
    auto execute(std::vector<std::shared_ptr<Operation>> const& ops) -> Expected<void>;

    [[nodiscard]] auto runtime() -> Runtime& { return *this->target; }

private:
    [[nodiscard]] auto componentState(std::string const& id) const -> Expected<ComponentState>;

    Runtime* target;
};

} // namespace TS
