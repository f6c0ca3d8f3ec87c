#pragma once
#include <termspace/state/Snapshot.hpp>

#include <map>
#include <string>
#include <vector>

namespace TS {

// Component-level difference between two snapshots. Id lists are sorted.
struct Diff {
    std::vector<std::string>                        changed;
    std::map<std::string, std::vector<std::string>> changedFields;
    std::vector<std::string>                        added;
    std::vector<std::string>                        removed;
    bool                                            focusChanged = false;

    [[nodiscard]] auto hasChanges() const -> bool;
    [[nodiscard]] auto isChanged(std::string const& id) const -> bool;
    [[nodiscard]] auto isAdded(std::string const& id) const -> bool;
    [[nodiscard]] auto isRemoved(std::string const& id) const -> bool;
    [[nodiscard]] auto changesFor(std::string const& id) const -> std::vector<std::string>;
    // StateDiff{ FocusChanged Changed:["a"] Added:["b"] Removed:["c"] }
    [[nodiscard]] auto toString() const -> std::string;
};

/**
 * Keys present only in after are added, only in before removed. Components
 * in both are compared field by field: every key of the runtime state object
 * by deep equality, then the "type", "props", "rect", "visible" and
 * "disabled" fields as wholes.
 */
[[nodiscard]] auto computeDiff(Snapshot const& before, Snapshot const& after) -> Diff;

} // namespace TS
