#pragma once
#include <termspace/state/Snapshot.hpp>

#include <string>

namespace TS {

/**
 * Capability of components that take part in state snapshots.
 *
 * inspectState() must return a JSON object; its keys are what state diffs
 * and automation selectors ([key=value]) look at. restoreState() receives a
 * value previously produced by inspectState() when history is replayed.
 */
class Inspectable {
public:
    virtual ~Inspectable() = default;

    [[nodiscard]] virtual auto inspectProps() const -> Json { return Json::object(); }
    [[nodiscard]] virtual auto inspectState() const -> Json = 0;
    [[nodiscard]] virtual auto isVisible() const -> bool { return true; }
    [[nodiscard]] virtual auto isDisabled() const -> bool { return false; }

    virtual auto restoreState(Json const& state) -> void = 0;

    // Returns false when the key is not writable.
    virtual auto setStateValue(std::string const& key, Json const& value) -> bool { return false; }
};

} // namespace TS
