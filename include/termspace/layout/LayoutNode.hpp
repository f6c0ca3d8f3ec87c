#pragma once
#include <termspace/core/Component.hpp>
#include <termspace/core/Geometry.hpp>
#include <termspace/layout/Constraints.hpp>
#include <termspace/layout/Style.hpp>

#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace TS {

enum class NodeKind : std::uint8_t {
    Flex = 0,
    Row,
    Column,
    Text,
    Custom
};

[[nodiscard]] auto toString(NodeKind kind) -> std::string_view;

// Capability: widgets that know their own content size.
class Measurable {
public:
    virtual ~Measurable() = default;
    [[nodiscard]] virtual auto measure(Constraints const& constraints) -> Size = 0;
};

/**
 * One node of the layout tree.
 *
 * A parent exclusively owns its children; parent() is a non-owning back
 * reference valid while the node is attached. Trees are rebuilt wholesale on
 * structural change, the geometry fields are overwritten by every pass.
 *
 * Positions: x/y hold the flowed position, absoluteX/absoluteY the final
 * screen position once absolute layout has run. Both are screen cells.
 */
class LayoutNode {
public:
    explicit LayoutNode(std::string id, NodeKind kind = NodeKind::Flex, Style style = {});

    LayoutNode(LayoutNode const&)                    = delete;
    auto operator=(LayoutNode const&) -> LayoutNode& = delete;

    [[nodiscard]] auto id() const -> std::string const& { return this->nodeId; }
    [[nodiscard]] auto kind() const -> NodeKind { return this->nodeKind; }

    [[nodiscard]] auto style() const -> Style const& { return this->nodeStyle; }
    auto setStyle(Style style) -> void;

    [[nodiscard]] auto component() const -> std::shared_ptr<Component> const& { return this->widget; }
    auto setComponent(std::shared_ptr<Component> component) -> void;

    // Content for Text nodes without a Measurable component.
    [[nodiscard]] auto text() const -> std::string const& { return this->content; }
    auto setText(std::string text) -> void;

    auto addChild(std::unique_ptr<LayoutNode> child) -> LayoutNode&;
    auto removeChild(std::string_view id) -> std::unique_ptr<LayoutNode>;
    [[nodiscard]] auto children() const -> std::vector<std::unique_ptr<LayoutNode>> const& { return this->kids; }
    [[nodiscard]] auto parent() const -> LayoutNode* { return this->parentNode; }

    [[nodiscard]] auto find(std::string_view id) -> LayoutNode*;
    [[nodiscard]] auto find(std::string_view id) const -> LayoutNode const*;
    // Pre-order traversal.
    auto visit(std::function<void(LayoutNode&)> const& fn) -> void;
    auto visit(std::function<void(LayoutNode const&)> const& fn) const -> void;

    // Flags this node and every ancestor for re-layout.
    auto markDirty() -> void;
    [[nodiscard]] auto isDirty() const -> bool { return this->dirty; }
    [[nodiscard]] auto subtreeDirty() const -> bool;
    auto clearDirty() -> void;

    [[nodiscard]] auto direction() const -> Direction;
    [[nodiscard]] auto isContainer() const -> bool;

    [[nodiscard]] auto bounds() const -> Rect;
    // Bounds minus padding and border.
    [[nodiscard]] auto innerBounds() const -> Rect;
    [[nodiscard]] auto containsPoint(int px, int py) const -> bool;

    int x              = 0;
    int y              = 0;
    int absoluteX      = 0;
    int absoluteY      = 0;
    int measuredWidth  = 0;
    int measuredHeight = 0;

private:
    std::string                              nodeId;
    NodeKind                                 nodeKind;
    Style                                    nodeStyle;
    std::shared_ptr<Component>               widget;
    std::string                              content;
    LayoutNode*                              parentNode = nullptr;
    std::vector<std::unique_ptr<LayoutNode>> kids;
    bool                                     dirty = true;
};

// Deepest node containing the point; later siblings are checked first.
[[nodiscard]] auto hitTest(LayoutNode& root, int x, int y) -> LayoutNode*;

} // namespace TS
