#pragma once
#include <termspace/core/Geometry.hpp>
#include <termspace/layout/Constraints.hpp>
#include <termspace/layout/LayoutNode.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace TS {

struct LayoutBox {
    std::string nodeId;
    int         x      = 0;
    int         y      = 0;
    int         width  = 0;
    int         height = 0;
    int         zIndex = 0;

    [[nodiscard]] auto rect() const -> Rect { return Rect{x, y, width, height}; }
    auto operator==(LayoutBox const&) const -> bool = default;
};

struct LayoutResult {
    std::vector<LayoutBox> boxes; // pre-order
    int                    rootWidth  = 0;
    int                    rootHeight = 0;
    Size                   contentSize;

    [[nodiscard]] auto findBox(std::string_view id) const -> LayoutBox const*;
};

class LayoutCache;

/**
 * Flexbox-style layout over LayoutNode trees.
 *
 * layout() runs measure (bottom-up sizes), arrange (top-down positions) and
 * the absolute pass, then returns the boxes of every node. Results are
 * memoized by the node ids/kinds of the tree plus the constraints; a dirty
 * node anywhere in the tree forces a recompute. Sizes are never negative.
 */
class LayoutEngine {
public:
    struct Stats {
        std::uint64_t totalLayouts = 0;
        std::uint64_t cacheHits    = 0;
        std::uint64_t cacheMisses  = 0;
        std::size_t   cacheSize    = 0;
    };

    static constexpr std::size_t kDefaultCacheCapacity = 1000;

    explicit LayoutEngine(std::size_t cacheCapacity = kDefaultCacheCapacity);
    ~LayoutEngine();

    LayoutEngine(LayoutEngine const&)                    = delete;
    auto operator=(LayoutEngine const&) -> LayoutEngine& = delete;

    auto layout(LayoutNode& root, Constraints const& constraints) -> LayoutResult;
    // Several roots are stacked top to bottom.
    auto layout(std::vector<LayoutNode*> const& roots, Constraints const& constraints) -> LayoutResult;

    auto invalidate() -> void;
    auto invalidateNode(std::string_view id) -> void;
    auto setCacheEnabled(bool enabled) -> void;
    [[nodiscard]] auto stats() const -> Stats;

    // Individual passes, exposed for widgets that lay out their own subtrees.
    static auto measure(LayoutNode& node, Constraints const& constraints) -> Size;
    static auto arrange(LayoutNode& node, int x, int y) -> void;
    // Positions out-of-flow children against their parent. Idempotent.
    static auto applyAbsoluteLayout(LayoutNode& node) -> void;

private:
    auto compute(std::vector<LayoutNode*> const& roots, Constraints const& constraints) -> LayoutResult;

    std::unique_ptr<LayoutCache> cache;
};

} // namespace TS
