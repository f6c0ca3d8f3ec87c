#pragma once
#include <termspace/core/Error.hpp>
#include <termspace/state/Snapshot.hpp>

#include <filesystem>
#include <string>
#include <string_view>

namespace TS::SnapshotJson {

// Field-for-field document form: timestamp (ms since epoch), focusPath
// (array), components (object keyed by id), modals, dirty, metadata.
[[nodiscard]] auto toJson(Snapshot const& snapshot) -> Json;
[[nodiscard]] auto fromJson(Json const& json) -> Expected<Snapshot>;

[[nodiscard]] auto serialize(Snapshot const& snapshot, int indent = 2) -> std::string;
[[nodiscard]] auto deserialize(std::string_view text) -> Expected<Snapshot>;

auto saveToFile(Snapshot const& snapshot, std::filesystem::path const& path) -> Expected<void>;
// Temp file, fsync, rename: readers see either the old or the new document.
auto saveToFileAtomic(Snapshot const& snapshot, std::filesystem::path const& path) -> Expected<void>;
[[nodiscard]] auto loadFromFile(std::filesystem::path const& path) -> Expected<Snapshot>;

// Introspection form: "."-joined focusPath, components with x/y/width/height
// rects, modal types by name, dirty and metadata only when non-empty.
[[nodiscard]] auto exportToMap(Snapshot const& snapshot) -> Json;
[[nodiscard]] auto importFromMap(Json const& map) -> Expected<Snapshot>;

} // namespace TS::SnapshotJson
