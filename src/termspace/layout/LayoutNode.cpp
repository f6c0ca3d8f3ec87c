#include <termspace/layout/LayoutNode.hpp>

#include <algorithm>
#include <utility>

namespace TS {

auto Constraints::toString() const -> std::string {
    auto bound = [](int value) { return value >= kUnbounded ? std::string("inf") : std::to_string(value); };
    return "Constraints{w:" + std::to_string(minWidth) + ".." + bound(maxWidth) + ", h:" + std::to_string(minHeight) + ".."
           + bound(maxHeight) + "}";
}

auto toString(NodeKind kind) -> std::string_view {
    switch (kind) {
    case NodeKind::Flex:
        return "flex";
    case NodeKind::Row:
        return "row";
    case NodeKind::Column:
        return "column";
    case NodeKind::Text:
        return "text";
    case NodeKind::Custom:
        return "custom";
    }
    return "custom";
}

LayoutNode::LayoutNode(std::string id, NodeKind kind, Style style)
    : nodeId(std::move(id)), nodeKind(kind), nodeStyle(std::move(style)) {}

auto LayoutNode::setStyle(Style style) -> void {
    this->nodeStyle = std::move(style);
    this->markDirty();
}

auto LayoutNode::setComponent(std::shared_ptr<Component> component) -> void {
    this->widget = std::move(component);
    this->markDirty();
}

auto LayoutNode::setText(std::string text) -> void {
    this->content = std::move(text);
    this->markDirty();
}

auto LayoutNode::addChild(std::unique_ptr<LayoutNode> child) -> LayoutNode& {
    child->parentNode = this;
    this->kids.push_back(std::move(child));
    this->markDirty();
    return *this->kids.back();
}

auto LayoutNode::removeChild(std::string_view id) -> std::unique_ptr<LayoutNode> {
    auto it = std::find_if(this->kids.begin(), this->kids.end(), [id](auto const& child) { return child->id() == id; });
    if (it == this->kids.end())
        return nullptr;
    auto removed = std::move(*it);
    this->kids.erase(it);
    removed->parentNode = nullptr;
    this->markDirty();
    return removed;
}

auto LayoutNode::find(std::string_view id) -> LayoutNode* {
    if (this->nodeId == id)
        return this;
    for (auto& child : this->kids) {
        if (auto* found = child->find(id))
            return found;
    }
    return nullptr;
}

auto LayoutNode::find(std::string_view id) const -> LayoutNode const* {
    return const_cast<LayoutNode*>(this)->find(id);
}

auto LayoutNode::visit(std::function<void(LayoutNode&)> const& fn) -> void {
    fn(*this);
    for (auto& child : this->kids)
        child->visit(fn);
}

auto LayoutNode::visit(std::function<void(LayoutNode const&)> const& fn) const -> void {
    fn(*this);
    for (auto const& child : this->kids)
        std::as_const(*child).visit(fn);
}

auto LayoutNode::markDirty() -> void {
    for (auto* node = this; node != nullptr; node = node->parentNode)
        node->dirty = true;
}

auto LayoutNode::subtreeDirty() const -> bool {
    if (this->dirty)
        return true;
    return std::any_of(this->kids.begin(), this->kids.end(), [](auto const& child) { return child->subtreeDirty(); });
}

auto LayoutNode::clearDirty() -> void {
    this->dirty = false;
    for (auto& child : this->kids)
        child->clearDirty();
}

auto LayoutNode::direction() const -> Direction {
    switch (this->nodeKind) {
    case NodeKind::Row:
        return Direction::Row;
    case NodeKind::Column:
        return Direction::Column;
    default:
        return this->nodeStyle.direction;
    }
}

auto LayoutNode::isContainer() const -> bool {
    return !this->kids.empty();
}

auto LayoutNode::bounds() const -> Rect {
    return Rect{this->absoluteX, this->absoluteY, this->measuredWidth, this->measuredHeight};
}

auto LayoutNode::innerBounds() const -> Rect {
    auto const& s = this->nodeStyle;
    int const   left = s.padding.left + s.border.left;
    int const   top  = s.padding.top + s.border.top;
    return Rect{this->absoluteX + left, this->absoluteY + top,
                std::max(this->measuredWidth - s.padding.horizontal() - s.border.horizontal(), 0),
                std::max(this->measuredHeight - s.padding.vertical() - s.border.vertical(), 0)};
}

auto LayoutNode::containsPoint(int px, int py) const -> bool {
    return this->bounds().contains(px, py);
}

auto hitTest(LayoutNode& root, int x, int y) -> LayoutNode* {
    if (!root.containsPoint(x, y))
        return nullptr;
    auto const& children = root.children();
    for (auto it = children.rbegin(); it != children.rend(); ++it) {
        if (auto* hit = hitTest(**it, x, y))
            return hit;
    }
    return &root;
}

} // namespace TS
