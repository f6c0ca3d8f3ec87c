#pragma once
#include <termspace/layout/Constraints.hpp>
#include <termspace/layout/LayoutEngine.hpp>
#include <termspace/layout/LayoutNode.hpp>

#include <parallel_hashmap/phmap.h>

#include <atomic>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace TS {

// Memoized layout results keyed by tree signature. Oldest insertion is
// evicted once the capacity is reached. All access is serialized.
class LayoutCache {
public:
    explicit LayoutCache(std::size_t capacity);

    // Constraint tuple followed by id and kind of every node in pre-order.
    [[nodiscard]] static auto signature(std::vector<LayoutNode*> const& roots, Constraints const& constraints) -> std::string;

    [[nodiscard]] auto get(std::string const& key) -> std::optional<LayoutResult>;
    auto put(std::string key, LayoutResult result) -> void;

    auto clear() -> void;
    // Drops every entry whose result contains the node.
    auto erase(std::string_view nodeId) -> void;

    [[nodiscard]] auto size() const -> std::size_t;

    std::atomic<bool>          enabled{true};
    std::atomic<std::uint64_t> totalLayouts{0};
    std::atomic<std::uint64_t> hits{0};
    std::atomic<std::uint64_t> misses{0};

private:
    std::size_t                                        capacity;
    mutable std::mutex                                 mutex;
    phmap::flat_hash_map<std::string, LayoutResult>    entries;
    std::deque<std::string>                            order;
};

} // namespace TS
